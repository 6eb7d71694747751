/**
 * @file Contains helpers to set the logging insfrastructure of the application.
 */
#pragma once

#include <memory>
#include <string_view>
#include <vector>

#include <errh/logger/log.hpp>
#include <errh/logger/cfg.hpp>

namespace errh::logger
{

//
// logger_factory_t
//

/**
 * Logger factory.
 */
class logger_factory_t
{
public:
    virtual ~logger_factory_t() = default;

    /**
     * @brief Creates a logger with a given name.
     *
     * Log level is assigned to what factory considers default.
     *
     * @param  logger_name  The name of logger.
     *
     * @return Logger instance.
     */
    [[nodiscard]] virtual logger_t make_logger( std::string_view logger_name ) = 0;

    /**
     * @brief Creates a logger with a given name and explicit level.
     *
     * @param  level        Log level.
     * @param  logger_name  The name of logger.
     *
     * @return Logger instance.
     */
    [[nodiscard]] virtual logger_t make_logger( log_level level,
                                                std::string_view logger_name ) = 0;
};

using logger_factory_uptr_t = std::unique_ptr< logger_factory_t >;

//
// make_logger_factory
//

/**
 * @brief Makes logger factory to create logger to a specific sinks.
 *
 * @param  default_level  Default implicit level for loggers.
 * @param  spd_sinks      Log messages sinks for created loggers.
 *
 * @return A unique pointer to factory object.
 */
[[nodiscard]] logger_factory_uptr_t make_logger_factory(
    log_level default_level,
    std::vector< spdlog::sink_ptr > spd_sinks );

/**
 * @brief Makes logger factory based on config.
 *
 * If neither stdout nor file logging is enabled
 * the loggers created by factory log nothing.
 *
 * @param  app_name  Application name, used as log-file prefix.
 * @param  cfg       Logger configuration.
 *
 * @throw errh::exception_t if file logging is requested with empty path.
 */
[[nodiscard]] logger_factory_uptr_t make_logger_factory(
    std::string_view app_name,
    const logger_cfg_t & cfg );

}  // namespace errh::logger
