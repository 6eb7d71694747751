/**
 * @file
 *
 * A failure sink writing records to log.
 */
#pragma once

#include <memory>
#include <utility>

#include <errh/logger/log.hpp>

#include <errh/handler/failure_sink.hpp>

namespace errh::handler
{

//
// logger_failure_sink_t
//

/**
 * @brief A sink writing each failure record as a single log message.
 *
 * @tparam Logger  A logr-compatible logger type.
 */
template < typename Logger >
class logger_failure_sink_t final : public failure_sink_t
{
public:
    explicit logger_failure_sink_t(
        Logger target_logger,
        logger::log_level level = logger::log_level::error )
        : m_logger{ std::move( target_logger ) }
        , m_level{ level }
    {
    }

    void consume( const failure_record_t & failure ) override
    {
        auto message = [ & ]( auto out ) { fmt::format_to( out, "{}", failure ); };

        switch( m_level )
        {
            case logger::log_level::trace:
                m_logger.trace( ERRH_SRC_LOCATION, message );
                break;
            case logger::log_level::debug:
                m_logger.debug( ERRH_SRC_LOCATION, message );
                break;
            case logger::log_level::info:
                m_logger.info( ERRH_SRC_LOCATION, message );
                break;
            case logger::log_level::warn:
                m_logger.warn( ERRH_SRC_LOCATION, message );
                break;
            case logger::log_level::error:
                m_logger.error( ERRH_SRC_LOCATION, message );
                break;
            case logger::log_level::critical:
                m_logger.critical( ERRH_SRC_LOCATION, message );
                break;
            case logger::log_level::nolog:
                break;
        }
    }

private:
    Logger m_logger;
    const logger::log_level m_level;
};

//
// make_logger_failure_sink()
//

template < typename Logger >
[[nodiscard]] failure_sink_sptr_t make_logger_failure_sink(
    Logger target_logger,
    logger::log_level level = logger::log_level::error )
{
    return std::make_shared< logger_failure_sink_t< Logger > >(
        std::move( target_logger ), level );
}

}  // namespace errh::handler
