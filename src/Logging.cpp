#include "Logging.h"

#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

void initLogging()
{
    auto logger = spdlog::stdout_color_mt("praymodoro");
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::info);

    // SPDLOG_LEVEL=debug, SPDLOG_LEVEL=trace, ...
    spdlog::cfg::load_env_levels();
}
