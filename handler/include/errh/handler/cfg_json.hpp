/**
 * @file Contains integration of error handler cfg with json (through json_dto).
 */
#pragma once

#include <json_dto/pub.hpp>

#include <errh/logger/cfg_json.hpp>

#include <errh/handler/cfg.hpp>

namespace json_dto
{

//
// json_io()
//

/**
 * @brief Reader customization for error handler config.
 */
template < typename Json_Io >
void json_io( Json_Io & io, ::errh::handler::error_handler_cfg_t & cfg )
{
    using cfg_t = ::errh::handler::error_handler_cfg_t;
    io & json_dto::optional( "failure_log_level",
                             cfg.failure_log_level,
                             cfg_t::default_failure_log_level )
        & json_dto::optional( "capture_stacktrace",
                              cfg.capture_stacktrace,
                              cfg_t::default_capture_stacktrace )
        & json_dto::optional( "stacktrace_skip_frames",
                              cfg.stacktrace_skip_frames,
                              cfg_t::default_stacktrace_skip_frames )
        & json_dto::optional( "stacktrace_max_depth",
                              cfg.stacktrace_max_depth,
                              cfg_t::default_stacktrace_max_depth );
}

}  // namespace json_dto
