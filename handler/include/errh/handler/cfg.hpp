/**
 * @file A vocabulary for config types of error handler.
 */
#pragma once

#include <cstdint>

#include <errh/logger/log.hpp>

#include <errh/handler/diagnostic_context.hpp>

namespace errh::handler
{

//
// error_handler_cfg_t
//

/**
 * @brief Error handler parameters.
 */
struct error_handler_cfg_t
{
    static constexpr logger::log_level default_failure_log_level =
        logger::log_level::error;
    //! The level failure records are logged with.
    logger::log_level failure_log_level = default_failure_log_level;

    static constexpr bool default_capture_stacktrace = true;
    bool capture_stacktrace                          = default_capture_stacktrace;

    static constexpr std::uint32_t default_stacktrace_skip_frames = 0;
    std::uint32_t stacktrace_skip_frames = default_stacktrace_skip_frames;

    static constexpr std::uint32_t default_stacktrace_max_depth =
        ::errh::handler::default_stacktrace_max_depth;
    std::uint32_t stacktrace_max_depth = default_stacktrace_max_depth;
};

}  // namespace errh::handler
