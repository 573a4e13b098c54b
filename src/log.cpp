#include "txcopy/log.h"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <mutex>

namespace txcopy {

std::shared_ptr<spdlog::logger> default_logger() {
    static std::mutex mutex;
    std::lock_guard<std::mutex> lk(mutex);

    auto logger = spdlog::get(LOGGER_NAME);
    if (!logger) {
        logger = spdlog::stderr_color_mt(LOGGER_NAME);
        spdlog::cfg::load_env_levels();
    }
    return logger;
}

} // namespace txcopy
