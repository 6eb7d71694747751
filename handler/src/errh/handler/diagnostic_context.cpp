#include <errh/handler/diagnostic_context.hpp>

#include <boost/stacktrace.hpp>

namespace errh::handler
{

namespace /* anonymous */
{

//
// noop_diagnostic_context_provider_t
//

class noop_diagnostic_context_provider_t final
    : public diagnostic_context_provider_t
{
public:
    [[nodiscard]] diagnostic_context_t capture() const override { return {}; }
};

//
// stacktrace_context_provider_t
//

/**
 * @brief Captures call stack with Boost.Stacktrace.
 */
class stacktrace_context_provider_t final : public diagnostic_context_provider_t
{
public:
    stacktrace_context_provider_t( std::uint32_t skip_frames,
                                   std::uint32_t max_depth ) noexcept
        : m_skip_frames{ skip_frames }
        , m_max_depth{ max_depth }
    {
    }

    [[nodiscard]] diagnostic_context_t capture() const override
    {
        diagnostic_context_t ctx;
        if( 0 == m_max_depth )
        {
            return ctx;
        }

        // +1 for this very function.
        const boost::stacktrace::stacktrace trace{ std::size_t{ m_skip_frames } + 1,
                                                   m_max_depth };

        ctx.stack_symbols.reserve( trace.size() );
        for( const auto & frame : trace )
        {
            ctx.stack_symbols.push_back( boost::stacktrace::to_string( frame ) );
        }

        return ctx;
    }

private:
    const std::uint32_t m_skip_frames;
    const std::uint32_t m_max_depth;
};

}  // anonymous namespace

//
// make_noop_diagnostic_context_provider()
//

[[nodiscard]] diagnostic_context_provider_sptr_t
make_noop_diagnostic_context_provider()
{
    return std::make_shared< noop_diagnostic_context_provider_t >();
}

//
// make_stacktrace_context_provider()
//

[[nodiscard]] diagnostic_context_provider_sptr_t make_stacktrace_context_provider(
    std::uint32_t skip_frames,
    std::uint32_t max_depth )
{
    return std::make_shared< stacktrace_context_provider_t >( skip_frames,
                                                              max_depth );
}

}  // namespace errh::handler
