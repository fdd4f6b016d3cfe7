/**
 * @file config_loader.cpp
 * @brief JSON configuration layered over the named defaults.
 */
#include "msgbuf/config/config_loader.hpp"

#include <charconv>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "msgbuf/mem/buffer_pool.hpp"
#include "msgbuf/mem/size_class.hpp"
#include "msgbuf/obs/observability.hpp"

namespace msgbuf::config {

    namespace {

        using json = nlohmann::json;
        using Status = msgbuf_detail::expected<void, ConfigError>;

        bool is_level_name(std::string_view name) {
            for (std::string_view known : {"trace", "debug", "info", "warning", "warn", "error", "err",
                                           "critical", "off"}) {
                if (name == known) return true;
            }
            return false;
        }

        /// Unsigned integer member; negative, fractional or non-numeric values are ParseError.
        Status read_size(const json& value, std::size_t& out) {
            if (!value.is_number_unsigned()) {
                return msgbuf_detail::unexpected(ConfigError::ParseError);
            }
            out = value.get<std::size_t>();
            return {};
        }

        /**
         * Walk one section object, dispatching each member to @p assign.
         * The section itself must be an object; @p assign reports UnknownKey
         * for members it does not recognise.
         */
        template <class Assign>
        Status read_section(const json& root, const char* name, Assign&& assign) {
            const auto it = root.find(name);
            if (it == root.end()) return {};
            if (!it->is_object()) {
                obs::logger()->error("config: '{}' must be an object", name);
                return msgbuf_detail::unexpected(ConfigError::ParseError);
            }
            for (const auto& [key, value] : it->items()) {
                if (auto ok = assign(key, value); !ok) {
                    obs::logger()->error("config: '{}.{}': {}", name, key, to_string(ok.error()));
                    return ok;
                }
            }
            return {};
        }

        Status assign_band(transfer::Band& band, const std::string& key, const json& value) {
            if (key == "small_max") return read_size(value, band.small_max);
            if (key == "large_min") return read_size(value, band.large_min);
            return msgbuf_detail::unexpected(ConfigError::UnknownKey);
        }

        Status assign_prewarm(RuntimeConfig& cfg, const std::string& key, const json& value) {
            std::size_t bytes = 0;
            const auto* end = key.data() + key.size();
            const auto [ptr, ec] = std::from_chars(key.data(), end, bytes);
            if (key.empty() || ec != std::errc{} || ptr != end) {
                return msgbuf_detail::unexpected(ConfigError::ParseError);
            }
            if (!mem::class_for(bytes)) {
                return msgbuf_detail::unexpected(ConfigError::InvalidValue);
            }
            std::size_t count = 0;
            if (auto ok = read_size(value, count); !ok) return ok;
            cfg.prewarm[bytes] = count;
            return {};
        }

        Status read_document(const json& root, RuntimeConfig& cfg) {
            static constexpr std::string_view kSections[] = {"send", "recv", "poller", "sender", "log",
                                                             "prewarm"};
            for (auto it = root.begin(); it != root.end(); ++it) {
                bool known = false;
                for (auto s : kSections) known = known || it.key() == s;
                if (!known) {
                    obs::logger()->error("config: unknown section '{}'", it.key());
                    return msgbuf_detail::unexpected(ConfigError::UnknownKey);
                }
            }

            if (auto ok = read_section(root, "send", [&](const std::string& k, const json& v) {
                    return assign_band(cfg.thresholds.send, k, v);
                }); !ok) return ok;

            if (auto ok = read_section(root, "recv", [&](const std::string& k, const json& v) -> Status {
                    if (k == "scratch_bytes")     return read_size(v, cfg.scratch_bytes);
                    if (k == "max_message_bytes") return read_size(v, cfg.max_message_bytes);
                    return assign_band(cfg.thresholds.recv, k, v);
                }); !ok) return ok;

            if (auto ok = read_section(root, "poller", [&](const std::string& k, const json& v) -> Status {
                    if (k == "capacity") return read_size(v, cfg.poller_capacity);
                    return msgbuf_detail::unexpected(ConfigError::UnknownKey);
                }); !ok) return ok;

            if (auto ok = read_section(root, "sender", [&](const std::string& k, const json& v) -> Status {
                    if (k == "queue_depth") return read_size(v, cfg.sender_queue_depth);
                    return msgbuf_detail::unexpected(ConfigError::UnknownKey);
                }); !ok) return ok;

            if (auto ok = read_section(root, "log", [&](const std::string& k, const json& v) -> Status {
                    if (k != "level") return msgbuf_detail::unexpected(ConfigError::UnknownKey);
                    if (!v.is_string()) return msgbuf_detail::unexpected(ConfigError::ParseError);
                    const auto& name = v.get_ref<const std::string&>();
                    if (!is_level_name(name)) return msgbuf_detail::unexpected(ConfigError::InvalidValue);
                    cfg.log_level = name;
                    return {};
                }); !ok) return ok;

            return read_section(root, "prewarm", [&](const std::string& k, const json& v) {
                return assign_prewarm(cfg, k, v);
            });
        }

        /// Cross-field checks once every member is in.
        bool consistent(const RuntimeConfig& cfg) {
            const auto depth = cfg.sender_queue_depth;
            return cfg.thresholds.valid()
                && cfg.poller_capacity > 0
                && cfg.scratch_bytes >= cfg.thresholds.recv.small_max
                && cfg.max_message_bytes > 0
                && depth >= 2 && (depth & (depth - 1)) == 0;
        }

    } // namespace

    const char* to_string(ConfigError e) noexcept {
        switch (e) {
            case ConfigError::FileNotFound: return "file_not_found";
            case ConfigError::ParseError:   return "parse_error";
            case ConfigError::UnknownKey:   return "unknown_key";
            case ConfigError::InvalidValue: return "invalid_value";
        }
        return "unknown";
    }

    RuntimeConfig defaults() {
        return RuntimeConfig{};
    }

    msgbuf_detail::expected<RuntimeConfig, ConfigError> Loader::parse(std::string_view text) {
        json root;
        try {
            root = json::parse(text.begin(), text.end(), nullptr, true, /*ignore_comments=*/true);
        } catch (const json::parse_error& e) {
            obs::logger()->error("config: {}", e.what());
            return msgbuf_detail::unexpected(ConfigError::ParseError);
        }
        if (!root.is_object()) {
            obs::logger()->error("config: top level must be an object");
            return msgbuf_detail::unexpected(ConfigError::ParseError);
        }

        RuntimeConfig cfg = defaults();
        if (auto ok = read_document(root, cfg); !ok) {
            return msgbuf_detail::unexpected(ok.error());
        }
        if (!consistent(cfg)) {
            obs::logger()->error("config: inconsistent settings (thresholds, scratch, capacity or queue depth)");
            return msgbuf_detail::unexpected(ConfigError::InvalidValue);
        }
        return cfg;
    }

    msgbuf_detail::expected<RuntimeConfig, ConfigError> Loader::load_from_file(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            obs::logger()->error("config: cannot open '{}'", path);
            return msgbuf_detail::unexpected(ConfigError::FileNotFound);
        }
        std::ostringstream buf;
        buf << in.rdbuf();
        auto cfg = parse(buf.str());
        if (cfg) {
            obs::logger()->info("config: loaded '{}' ({} prewarm classes)", path, cfg->prewarm.size());
        }
        return cfg;
    }

    msgbuf_detail::expected<std::size_t, mem::BufferError> apply(mem::BufferPool& pool,
                                                                 const RuntimeConfig& cfg) {
        if (!obs::set_level(cfg.log_level)) {
            obs::logger()->warn("config: unknown log level '{}', keeping current", cfg.log_level);
        }
        if (cfg.prewarm.empty()) {
            return std::size_t{0};
        }
        return pool.prewarm(cfg.prewarm);
    }

} // namespace msgbuf::config
