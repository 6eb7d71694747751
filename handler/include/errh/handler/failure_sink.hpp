/**
 * @file
 *
 * Sinks consuming failure records.
 */
#pragma once

#include <functional>
#include <memory>

#include <errh/handler/failure_record.hpp>

namespace errh::handler
{

//
// failure_sink_t
//

/**
 * @brief An interface for a destination of failure records.
 *
 * This is where handled failures leave the error handler,
 * production code plugs its crash-analytics or metrics service here.
 * A sink is expected not to throw, error handler doesn't intercept
 * exceptions coming from a sink.
 */
class failure_sink_t
{
public:
    virtual ~failure_sink_t() = default;

    /**
     * @brief Record a failure.
     *
     * Called exactly once per handled failure.
     */
    virtual void consume( const failure_record_t & failure ) = 0;
};

using failure_sink_sptr_t = std::shared_ptr< failure_sink_t >;

//
// callback_failure_sink_t
//

/**
 * @brief A sink forwarding records to a given callback.
 */
class callback_failure_sink_t final : public failure_sink_t
{
public:
    using callback_t = std::function< void( const failure_record_t & ) >;

    /**
     * @throw errh::exception_t if @p callback is empty.
     */
    explicit callback_failure_sink_t( callback_t callback );

    void consume( const failure_record_t & failure ) override;

private:
    callback_t m_callback;
};

//
// make_callback_failure_sink()
//

[[nodiscard]] failure_sink_sptr_t make_callback_failure_sink(
    callback_failure_sink_t::callback_t callback );

}  // namespace errh::handler
