#include "rowbind/config/rowbind_config.h"

#include <iostream>

namespace rowbind {
    namespace config {

        std::shared_ptr<spdlog::logger> RowBindConfig::get_or_create_logger() {
            if (logger) {
                // 库代码按名字查找 logger, 注入的 logger 需要以 logger_name 注册
                if (logger->name() != logger_name) {
                    logger = logger->clone(logger_name);
                }
                logger->set_level(log_level);
                if (spdlog::get(logger_name) != logger) {
                    spdlog::drop(logger_name);
                    spdlog::register_logger(logger);
                }
                return logger;
            }
            auto default_logger = spdlog::get(logger_name);
            if (!default_logger) {
                try {
                    default_logger = spdlog::stdout_color_mt(logger_name);
                    default_logger->set_pattern(log_pattern);
                    default_logger->set_level(log_level);
                } catch (const spdlog::spdlog_ex& ex) {
                    std::cerr << "Logger (" << logger_name << ") initialization failed: " << ex.what() << std::endl;
                    return nullptr;
                }
            } else {
                default_logger->set_level(log_level);
            }
            logger = default_logger;
            return default_logger;
        }

        std::shared_ptr<spdlog::logger> getLogger(const std::string& logger_name) {
            return spdlog::get(logger_name);
        }

    }  // namespace config
}  // namespace rowbind
