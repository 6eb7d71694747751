/**
 * @file
 *
 * Configuration for logger routines.
 */
#pragma once

#include <string>

#include <errh/logger/log.hpp>

namespace errh::logger
{

//
// logger_cfg_t
//

/**
 * @brief Application wide logger configuration.
 */
struct logger_cfg_t
{
    static constexpr const char default_log_message_pattern[] =
        "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v [%g:%#]";

    //! Pattern used for logging.
    std::string log_message_pattern = default_log_message_pattern;

    static constexpr const char default_path[] = "./";
    //! Directory for log files, used when `log_to_file` is set.
    std::string path = default_path;

    static constexpr log_level default_global_log_level = log_level::info;
    //! Default log level.
    log_level global_log_level = default_global_log_level;

    static constexpr bool default_log_to_stdout = true;
    bool log_to_stdout                          = default_log_to_stdout;

    static constexpr bool default_log_to_file = false;
    bool log_to_file                          = default_log_to_file;
};

}  // namespace errh::logger
