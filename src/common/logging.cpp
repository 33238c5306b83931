#include "obfsconn/common/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace obfsconn::common {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        auto existing = spdlog::get("obfsconn");
        if (existing) return existing;
        return spdlog::stderr_color_mt("obfsconn");
    }();
    return instance;
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

}  // namespace obfsconn::common
