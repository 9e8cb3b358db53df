#include "libctdi/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <utility>

namespace libctdi {

namespace {

std::shared_ptr<spdlog::logger> make_default_logger() {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("libctdi", std::move(sink));
    logger->set_level(spdlog::level::warn);
    return logger;
}

struct logger_slot {
    std::mutex mutex;
    std::shared_ptr<spdlog::logger> logger = make_default_logger();
};

logger_slot& slot() {
    static logger_slot instance;
    return instance;
}

} // namespace

std::shared_ptr<spdlog::logger> get_logger() {
    auto& s = slot();
    std::lock_guard lock(s.mutex);
    return s.logger;
}

void set_logger(std::shared_ptr<spdlog::logger> logger) {
    auto& s = slot();
    std::lock_guard lock(s.mutex);
    s.logger = logger ? std::move(logger) : make_default_logger();
}

} // namespace libctdi
