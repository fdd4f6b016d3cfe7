/**
* @file observability.cpp
 * @brief spdlog-backed logger bootstrap and statistics line.
 */
#include "msgbuf/obs/observability.hpp"
#include "msgbuf/mem/buffer_pool.hpp"

#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace msgbuf::obs {

    std::shared_ptr<spdlog::logger> logger() {
        static std::shared_ptr<spdlog::logger> lg = [] {
            if (auto existing = spdlog::get(kLoggerName)) {
                return existing;
            }
            auto created = spdlog::stdout_color_mt(kLoggerName);
            created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [tid %t] %v");
            return created;
        }();
        return lg;
    }

    void set_level(spdlog::level::level_enum level) {
        logger()->set_level(level);
    }

    bool set_level(std::string_view name) {
        const auto level = spdlog::level::from_str(std::string(name));
        // from_str() maps unknown names to "off"; only accept an explicit "off".
        if (level == spdlog::level::off && name != "off") {
            return false;
        }
        set_level(level);
        return true;
    }

    void report(const msgbuf::mem::BufferPool& pool) {
        const auto s = pool.statistics();
        // JSON-ish line, one per report
        logger()->info(
            R"({{"rents":{},"returns":{},"hits":{},"misses":{},"oversize":{},"outstanding":{},"hit_rate":{:.3f}}})",
            s.rents, s.returns, s.hits, s.misses, s.oversize, s.outstanding(), s.hit_rate());
    }

} // namespace msgbuf::obs
