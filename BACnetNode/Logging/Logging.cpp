// Category loggers share one stdout sink; the logger name carries the category
// so lines can be filtered the same way regardless of sink.
#include "Logging.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

std::shared_ptr<spdlog::logger> MakeCategory(const char* category) {
    if (auto existing = spdlog::get(category)) {
        return existing;
    }
    auto logger = spdlog::stdout_color_mt(category);
    logger->set_pattern(kPattern);
    return logger;
}

} // namespace

namespace BACN::Logging {

const std::shared_ptr<spdlog::logger>& Node()      { static auto log = MakeCategory("node");      return log; }
const std::shared_ptr<spdlog::logger>& Device()    { static auto log = MakeCategory("device");    return log; }
const std::shared_ptr<spdlog::logger>& Discovery() { static auto log = MakeCategory("discovery"); return log; }
const std::shared_ptr<spdlog::logger>& Request()   { static auto log = MakeCategory("request");   return log; }
const std::shared_ptr<spdlog::logger>& Remote()    { static auto log = MakeCategory("remote");    return log; }
const std::shared_ptr<spdlog::logger>& Backup()    { static auto log = MakeCategory("backup");    return log; }
const std::shared_ptr<spdlog::logger>& Transport() { static auto log = MakeCategory("transport"); return log; }

void Configure(spdlog::level::level_enum level) {
    static std::mutex lock;
    std::lock_guard<std::mutex> guard(lock);

    // Touch every category so the level applies to all of them.
    Node();
    Device();
    Discovery();
    Request();
    Remote();
    Backup();
    Transport();

    spdlog::set_pattern(kPattern);
    spdlog::set_level(level);
}

} // namespace BACN::Logging
