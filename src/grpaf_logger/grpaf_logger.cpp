#include "grpaf_logger.h"

#include "spdlog/sinks/stdout_color_sinks.h"

static constexpr const char* s_logger_name = "grpaf";

void GrpafLogger::init_stderr_logger()
{
    std::shared_ptr<spdlog::logger> logger = spdlog::get(s_logger_name);
    if (nullptr == logger) {
        logger = spdlog::stderr_color_mt(s_logger_name);
    }
    spdlog::set_default_logger(std::move(logger));
}

void GrpafLogger::set_level(spdlog::level::level_enum log_level) { spdlog::set_level(log_level); }

void GrpafLogger::set_pattern(std::string pattern, spdlog::pattern_time_type time_type)
{
    spdlog::set_pattern(std::move(pattern), time_type);
}
