#include "core/common/Logging.hpp"
#include <filesystem>
#include <iostream>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace qsynth {
namespace core {
namespace common {

namespace {
std::mutex registryMutex;
}

std::shared_ptr<spdlog::logger> componentLogger(const std::string& name) {
    std::lock_guard<std::mutex> lock(registryMutex);
    auto logger = spdlog::get(name);
    if (logger) {
        return logger;
    }

    try {
        logger = spdlog::rotating_logger_mt(name, "logs/" + name + ".log",
                                           1024 * 1024 * 5, 3);
    } catch (const spdlog::spdlog_ex& e) {
        // Файл недоступен, пишем в консоль
        std::cerr << "Ошибка инициализации логгера " << name << ": " << e.what() << std::endl;
        logger = spdlog::stderr_color_mt(name);
    }
    logger->set_level(spdlog::level::debug);
    return logger;
}

void initializeLogging(const std::string& logDirectory, spdlog::level::level_enum level) {
    try {
        std::filesystem::create_directories(logDirectory);

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(level);
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logDirectory + "/qsynth.log", 1024 * 1024 * 10, 5);
        file_sink->set_level(spdlog::level::debug);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");

        auto logger = std::make_shared<spdlog::logger>("qsynth",
            spdlog::sinks_init_list{console_sink, file_sink});

        spdlog::set_default_logger(logger);
        spdlog::set_level(spdlog::level::debug);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

} // namespace common
} // namespace core
} // namespace qsynth
