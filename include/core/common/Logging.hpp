#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace qsynth {
namespace core {
namespace common {

// Возвращает именованный логгер компонента, создавая ротируемый файловый
// логгер logs/<name>.log при первом обращении
std::shared_ptr<spdlog::logger> componentLogger(const std::string& name);

// Логгер по умолчанию для исполняемого файла: консоль + ротируемый файл
void initializeLogging(const std::string& logDirectory, spdlog::level::level_enum level);

} // namespace common
} // namespace core
} // namespace qsynth
