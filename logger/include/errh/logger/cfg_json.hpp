#pragma once

#include <string>

#include <json_dto/pub.hpp>

#include <errh/logger/cfg.hpp>

namespace json_dto
{

//
// read_json_value()
//

/**
 * @brief A helper function to read log level from json.
 */
template <>
void read_json_value( ::errh::logger::log_level & lvl,
                      const rapidjson::Value & object );

//
// json_io()
//

/**
 * @brief Reader customization for logger config.
 */
template < typename Json_Io >
void json_io( Json_Io & io, ::errh::logger::logger_cfg_t & cfg )
{
    using cfg_t = ::errh::logger::logger_cfg_t;
    io & json_dto::optional( "log_message_pattern",
                             cfg.log_message_pattern,
                             cfg_t::default_log_message_pattern )
        & json_dto::optional( "path", cfg.path, cfg_t::default_path )
        & json_dto::optional( "global_log_level",
                              cfg.global_log_level,
                              cfg_t::default_global_log_level )
        & json_dto::optional(
            "log_to_stdout", cfg.log_to_stdout, cfg_t::default_log_to_stdout )
        & json_dto::optional(
            "log_to_file", cfg.log_to_file, cfg_t::default_log_to_file );
}

}  // namespace json_dto
