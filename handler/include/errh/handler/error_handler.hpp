/**
 * @file
 *
 * Error handler turning failures of operations into absent values.
 */
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include <errh/logger/log.hpp>

#include <errh/handler/cfg.hpp>
#include <errh/handler/diagnostic_context.hpp>
#include <errh/handler/failure_record.hpp>
#include <errh/handler/failure_sink.hpp>

namespace errh::handler
{

namespace details
{

//
// wrap_result
//

template < typename T >
struct wrap_result
{
    using type = std::optional< T >;
};

template < typename T >
struct wrap_result< std::optional< T > >
{
    using type = std::optional< T >;
};

template <>
struct wrap_result< void >
{
    using type = bool;
};

}  // namespace details

//
// wrap_result_t
//

/**
 * @brief The type `error_handler_t::wrap()` returns for a given operation.
 *
 * An operation returning `std::optional<T>` or plain `T` gives
 * `std::optional<T>`, an operation returning void gives bool.
 */
template < typename Operation >
using wrap_result_t = typename details::wrap_result<
    std::remove_cvref_t< std::invoke_result_t< Operation > > >::type;

//
// error_handler_t
//

/**
 * @brief An adapter between fallible operation and optional result.
 *
 * Any exception thrown by a wrapped operation is reported
 * to the failure sink and turned into an absent result.
 * An operation that legitimately returns an empty optional
 * is indistinguishable from the failed one for the caller.
 *
 * Handler holds no mutable state, it is safe to use it
 * from multiple threads as long as its sink
 * and context provider are.
 */
class error_handler_t
{
public:
    /**
     * @throw errh::exception_t if @p sink is null.
     */
    explicit error_handler_t( failure_sink_sptr_t sink,
                              diagnostic_context_provider_sptr_t context_provider =
                                  make_stacktrace_context_provider() );

    /**
     * @brief Run operation and swallow its failure.
     *
     * Invokes @p operation exactly once on the calling thread.
     * If it throws, the failure is logged and an empty result is returned.
     *
     * @code
     * errh::handler::error_handler_t handler{ sink };
     * std::optional< std::string > content =
     *     handler.wrap( [ & ] { return read_file_content( path ); } );
     * @endcode
     *
     * @return The result of operation, or an empty one if it failed.
     */
    template < typename Operation >
    [[nodiscard]] wrap_result_t< Operation > wrap( Operation && operation ) const
    {
        using result_t = wrap_result_t< Operation >;

        try
        {
            if constexpr( std::is_void_v< std::invoke_result_t< Operation > > )
            {
                std::invoke( std::forward< Operation >( operation ) );
                return true;
            }
            else
            {
                return result_t{ std::invoke(
                    std::forward< Operation >( operation ) ) };
            }
        }
        catch( ... )
        {
            log_current_exception();
        }

        return result_t{};
    }

    /**
     * @brief Report a failure with a given description to the sink.
     *
     * Captures diagnostic context and emits exactly one record.
     */
    void log_failure( std::string description ) const;

private:
    //! Report the exception being handled, must be called inside catch block.
    void log_current_exception() const;

    void emit( exception_description_t what ) const;

    failure_sink_sptr_t m_sink;
    diagnostic_context_provider_sptr_t m_context_provider;
};

//
// make_error_handler()
//

/**
 * @brief Create error handler logging failures to a given logger.
 */
[[nodiscard]] error_handler_t make_error_handler(
    logger::logger_t target_logger,
    const error_handler_cfg_t & cfg = error_handler_cfg_t{} );

}  // namespace errh::handler
