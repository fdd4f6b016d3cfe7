#pragma once
/**
 * @file config_loader.hpp
 * @brief Runtime configuration: named defaults overridden by a JSON document.
 * @details All defaults reference constants.hpp. Every section and member is
 * optional; `//` comments are accepted:
 *
 *   {
 *     "send":    { "small_max": 512, "large_min": 65536 },
 *     "recv":    { "small_max": 512, "large_min": 65536,
 *                  "scratch_bytes": 4096, "max_message_bytes": 67108864 },
 *     "poller":  { "capacity": 64 },
 *     "sender":  { "queue_depth": 1024 },
 *     "log":     { "level": "info" },
 *     "prewarm": { "1024": 128 }   // 128 idle buffers in the 1 KiB class
 *   }
 */

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

#include "msgbuf/compat/expected.hpp"
#include "msgbuf/config/constants.hpp"
#include "msgbuf/mem/buffer_error.hpp"
#include "msgbuf/transfer/transfer_strategy.hpp"

namespace msgbuf::mem {
class BufferPool;
}

namespace msgbuf::config {

    enum class ConfigError : std::uint8_t {
        FileNotFound = 1, ///< Path missing or unreadable
        ParseError,       ///< Malformed JSON, wrong member type or a non-unsigned number
        UnknownKey,       ///< Section or member not listed above
        InvalidValue      ///< Well-formed but inconsistent (thresholds, class, depth...)
    };

    const char* to_string(ConfigError e) noexcept;

    /** @struct RuntimeConfig
     *  @brief Everything an application needs to build a pool, couriers and senders.
     */
    struct RuntimeConfig {
        transfer::Thresholds thresholds{};                                    ///< Strategy crossovers
        std::map<std::size_t, std::size_t> prewarm{};                         ///< class bytes -> idle buffers
        std::size_t poller_capacity{constants::POLLER_DEFAULT_CAPACITY};
        std::size_t scratch_bytes{constants::RECV_SCRATCH_BYTES};
        std::size_t max_message_bytes{constants::RECV_MAX_MESSAGE_BYTES};
        std::size_t sender_queue_depth{constants::SENDER_QUEUE_DEPTH};
        std::string log_level{"info"};
    };

    /// @brief Constants-only configuration.
    RuntimeConfig defaults();

    /** @class Loader
     *  @brief Source of runtime configuration (defaults or parsed files).
     */
    class Loader {
    public:
        /**
         * @brief Read and parse @p path on top of defaults().
         * @return FileNotFound if the file cannot be opened, otherwise as parse().
         */
        static msgbuf_detail::expected<RuntimeConfig, ConfigError> load_from_file(const std::string& path);

        /**
         * @brief Parse JSON text on top of defaults(); the first bad member wins.
         * @return The validated configuration, or the error of the first bad member
         *         (logged with its section and key).
         */
        static msgbuf_detail::expected<RuntimeConfig, ConfigError> parse(std::string_view text);
    };

    /**
     * @brief Apply @p cfg: set the log level and prewarm @p pool.
     * @return Buffers created by prewarming.
     */
    msgbuf_detail::expected<std::size_t, mem::BufferError> apply(mem::BufferPool& pool,
                                                                 const RuntimeConfig& cfg);

} // namespace msgbuf::config
