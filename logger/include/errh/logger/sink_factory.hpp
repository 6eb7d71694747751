/**
 * @file Contains helper factory-functions to create sinks for logger.
 */
#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <logr/spdlog_backend.hpp>

#include <errh/logger/log.hpp>

namespace errh::logger
{

//! An alias for spd sinks.
using logger_sink_sptr_t = spdlog::sink_ptr;

//
// make_color_sink()
//

/**
 * @brief Create console color log-sink.
 */
[[nodiscard]] logger_sink_sptr_t make_color_sink(
    std::optional< std::string > pattern = std::nullopt );

//
// make_daily_sink()
//

/**
 * @brief Make Daily sink.
 *
 * Creates @p path if it doesn't exist.
 *
 * @param  path             Log files directory.
 * @param  filename_prefix  Log-file name prefix.
 */
[[nodiscard]] logger_sink_sptr_t make_daily_sink(
    std::string_view path,
    std::string_view filename_prefix,
    std::optional< std::string > pattern = std::nullopt );

//
// make_ostream_sink()
//

/**
 * @brief Make a sink writing to a given stream.
 *
 * @pre @p out must outlive all loggers using the sink.
 */
[[nodiscard]] logger_sink_sptr_t make_ostream_sink(
    std::ostream & out,
    std::optional< std::string > pattern = std::nullopt );

}  // namespace errh::logger
