#ifndef ROWBIND_CONFIG_ROWBIND_CONFIG_H
#define ROWBIND_CONFIG_ROWBIND_CONFIG_H

#include <memory>
#include <string>

#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

namespace rowbind {
    namespace config {

        inline constexpr const char* kDefaultLoggerName = "RowBind";

        struct RowBindConfig {
            // --- Logging ---
            std::string logger_name = kDefaultLoggerName;
            std::shared_ptr<spdlog::logger> logger;  // 注入的 logger 优先
            spdlog::level::level_enum log_level = spdlog::level::info;
            std::string log_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] [tid %t] %v";

            // 返回注入的 logger, 否则按 logger_name 在 spdlog 注册表中查找或创建.
            // 创建的 logger 会被注册, 之后库代码通过 getLogger() 取得它.
            std::shared_ptr<spdlog::logger> get_or_create_logger();
        };

        // 库内部使用: 只查找, 不创建. 未配置日志时返回 nullptr.
        std::shared_ptr<spdlog::logger> getLogger(const std::string& logger_name = kDefaultLoggerName);

    }  // namespace config
}  // namespace rowbind

#endif  // ROWBIND_CONFIG_ROWBIND_CONFIG_H
