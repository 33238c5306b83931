#pragma once

#include <memory>
#include <spdlog/spdlog.h>

namespace obfsconn::common {

// Shared "obfsconn" logger, created on first use.
std::shared_ptr<spdlog::logger> logger();

void set_log_level(spdlog::level::level_enum level);

}  // namespace obfsconn::common

#define OBFSCONN_LOG_DEBUG(...) ::obfsconn::common::logger()->debug(__VA_ARGS__)
#define OBFSCONN_LOG_INFO(...)  ::obfsconn::common::logger()->info(__VA_ARGS__)
#define OBFSCONN_LOG_WARN(...)  ::obfsconn::common::logger()->warn(__VA_ARGS__)
#define OBFSCONN_LOG_ERROR(...) ::obfsconn::common::logger()->error(__VA_ARGS__)
