#pragma once
/**
 * @file observability.hpp
 * @brief Logging facade (spdlog) and pool statistics reporting.
 * @details Every msgbuf component logs through the one named logger returned by
 *          logger(). Hot paths only log failures.
 */

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace msgbuf::mem {
class BufferPool;
}

namespace msgbuf::obs {

    /// Name under which the logger is registered with spdlog.
    inline constexpr const char* kLoggerName = "msgbuf";

    /**
     * @brief Shared msgbuf logger.
     * @details Reuses a logger already registered as "msgbuf" (so an application
     *          can install its own sinks first); otherwise creates a colour stdout one.
     */
    std::shared_ptr<spdlog::logger> logger();

    /// @brief Set the msgbuf logger level.
    void set_level(spdlog::level::level_enum level);

    /**
     * @brief Set the level from its spdlog name ("trace", "debug", "info", "warn", "error", "off").
     * @return false if @p name is not a known level.
     */
    bool set_level(std::string_view name);

    /// @brief Emit one JSON-ish statistics line for @p pool at info level.
    void report(const msgbuf::mem::BufferPool& pool);

} // namespace msgbuf::obs
