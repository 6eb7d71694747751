#include <errh/logger/logger_factory.hpp>
#include <errh/logger/sink_factory.hpp>

#include <errh/exception.hpp>

namespace errh::logger
{

namespace /* anonymous */
{

//
// logger_factory_impl_t
//

class logger_factory_impl_t final : public logger_factory_t
{
public:
    logger_factory_impl_t( log_level default_level,
                           std::vector< spdlog::sink_ptr > spd_sinks )
        : m_default_level{ default_level }
        , m_spd_sinks{ std::move( spd_sinks ) }
    {
    }

    [[nodiscard]] logger_t make_logger( std::string_view logger_name ) final
    {
        return make_logger( m_default_level, logger_name );
    }

    [[nodiscard]] logger_t make_logger( log_level level,
                                        std::string_view logger_name ) final
    {
        return logger_t{ std::string{ logger_name },
                         begin( m_spd_sinks ),
                         end( m_spd_sinks ),
                         level };
    }

private:
    const log_level m_default_level;
    const std::vector< spdlog::sink_ptr > m_spd_sinks;
};

}  // anonymous namespace

//
// make_logger_factory
//

[[nodiscard]] logger_factory_uptr_t make_logger_factory(
    log_level default_level,
    std::vector< spdlog::sink_ptr > spd_sinks )
{
    return std::make_unique< logger_factory_impl_t >( default_level,
                                                      std::move( spd_sinks ) );
}

[[nodiscard]] logger_factory_uptr_t make_logger_factory(
    std::string_view app_name,
    const logger_cfg_t & cfg )
{
    std::vector< spdlog::sink_ptr > sinks;

    if( cfg.log_to_stdout )
    {
        sinks.push_back( make_color_sink( cfg.log_message_pattern ) );
    }

    if( cfg.log_to_file )
    {
        if( cfg.path.empty() )
        {
            throw_exception( "log_to_file is set for '{}' but log path is empty",
                             app_name );
        }

        sinks.push_back(
            make_daily_sink( cfg.path, app_name, cfg.log_message_pattern ) );
    }

    if( sinks.empty() )
    {
        return make_logger_factory( log_level::nolog, std::move( sinks ) );
    }

    return make_logger_factory( cfg.global_log_level, std::move( sinks ) );
}

}  // namespace errh::logger
