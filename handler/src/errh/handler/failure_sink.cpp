#include <errh/handler/failure_sink.hpp>

#include <errh/exception.hpp>

namespace errh::handler
{

//
// callback_failure_sink_t
//

callback_failure_sink_t::callback_failure_sink_t( callback_t callback )
    : m_callback{ std::move( callback ) }
{
    if( !m_callback )
    {
        throw_exception( "callback failure sink requires a callback" );
    }
}

void callback_failure_sink_t::consume( const failure_record_t & failure )
{
    m_callback( failure );
}

//
// make_callback_failure_sink()
//

[[nodiscard]] failure_sink_sptr_t make_callback_failure_sink(
    callback_failure_sink_t::callback_t callback )
{
    return std::make_shared< callback_failure_sink_t >( std::move( callback ) );
}

}  // namespace errh::handler
