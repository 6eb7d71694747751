#pragma once

#include <string>
#include <string_view>

#include <logr/logr.hpp>
#include <logr/spdlog_backend.hpp>

namespace errh::logger
{

//
// log_level
//

/**
 * @brief Log levels enum.
 *
 * Follows the one that is in logr,
 * which in turn folows the ones in spdlog.
 */
using log_level = logr::log_message_level;

//
// log_level_from_string()
//

/**
 * @brief Get a log level from a string.
 *
 * Converts a string like "debug", "info" etc. to the value of log level.
 *
 * @throw errh::exception_t if the string is not a level name.
 */
[[nodiscard]] log_level log_level_from_string( std::string_view str );

//
// log_level_to_string()
//

/**
 * @brief Make a string with log level.
 */
[[nodiscard]] std::string log_level_to_string( log_level lvl );

//
// logger_static_buffer_size
//

/**
 * @brief Standard static-buffer size for formatting log-message.
 *
 * Failure reports carry a stack dump, messages longer than that
 * spill to heap.
 */
constexpr std::size_t logger_static_buffer_size = 512;

//
// logger_t
//

/**
 * @brief Default logger type.
 */
using logger_t = logr::spdlog_logger_t< logger_static_buffer_size >;

#if defined( ERRHPRJ_COLLAPSE_SRC_LOCATION )
// ERRHPRJ_COLLAPSE_SRC_LOCATION is defined that means
// all src location pieces must be collapsed to nothing.
#    define ERRH_SRC_LOCATION \
        ::logr::no_src_location_t {}
#else
#    if !defined( ERRH_PRJ_ROOT_LENGTH_HINT )
#        define ERRH_PRJ_ROOT_LENGTH_HINT 0
#    endif

#    define ERRH_SRC_LOCATION                                             \
        ::logr::src_location_t                                            \
        {                                                                 \
            LOGR_STRIP_FILE_NAME_N( ERRH_PRJ_ROOT_LENGTH_HINT ), __LINE__ \
        }
#endif

}  // namespace errh::logger
