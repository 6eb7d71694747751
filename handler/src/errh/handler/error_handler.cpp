#include <errh/handler/error_handler.hpp>

#include <errh/exception.hpp>
#include <errh/handler/logger_failure_sink.hpp>

namespace errh::handler
{

//
// error_handler_t
//

error_handler_t::error_handler_t(
    failure_sink_sptr_t sink,
    diagnostic_context_provider_sptr_t context_provider )
    : m_sink{ std::move( sink ) }
    , m_context_provider{ std::move( context_provider ) }
{
    if( !m_sink )
    {
        throw_exception( "error handler requires a failure sink" );
    }

    if( !m_context_provider )
    {
        m_context_provider = make_noop_diagnostic_context_provider();
    }
}

void error_handler_t::log_failure( std::string description ) const
{
    emit( exception_description_t{ std::move( description ), std::string{} } );
}

void error_handler_t::log_current_exception() const
{
    emit( describe_current_exception() );
}

void error_handler_t::emit( exception_description_t what ) const
{
    const failure_record_t failure{ std::move( what.description ),
                                    std::move( what.exception_type ),
                                    m_context_provider->capture() };
    m_sink->consume( failure );
}

//
// make_error_handler()
//

[[nodiscard]] error_handler_t make_error_handler(
    logger::logger_t target_logger,
    const error_handler_cfg_t & cfg )
{
    auto sink = make_logger_failure_sink( std::move( target_logger ),
                                          cfg.failure_log_level );

    if( !cfg.capture_stacktrace )
    {
        return error_handler_t{ std::move( sink ),
                                make_noop_diagnostic_context_provider() };
    }

    return error_handler_t{ std::move( sink ),
                            make_stacktrace_context_provider(
                                cfg.stacktrace_skip_frames,
                                cfg.stacktrace_max_depth ) };
}

}  // namespace errh::handler
