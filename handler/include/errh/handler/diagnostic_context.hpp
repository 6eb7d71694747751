/**
 * @file
 *
 * Diagnostic context captured along with a failure.
 */
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace errh::handler
{

//
// diagnostic_context_t
//

/**
 * @brief Diagnostic snapshot taken at the moment a failure is handled.
 */
struct diagnostic_context_t
{
    //! Call-stack symbols, innermost frame first.
    std::vector< std::string > stack_symbols;

    [[nodiscard]] bool empty() const noexcept { return stack_symbols.empty(); }
};

//
// diagnostic_context_provider_t
//

/**
 * @brief An interface for a routine capturing diagnostic context.
 *
 * Implementations must be safe to call from multiple threads
 * if the handler using them is shared between threads.
 */
class diagnostic_context_provider_t
{
public:
    virtual ~diagnostic_context_provider_t() = default;

    /**
     * @brief Take a snapshot of the current diagnostic context.
     */
    [[nodiscard]] virtual diagnostic_context_t capture() const = 0;
};

using diagnostic_context_provider_sptr_t =
    std::shared_ptr< const diagnostic_context_provider_t >;

//
// make_noop_diagnostic_context_provider()
//

/**
 * @brief Create a provider that captures nothing.
 */
[[nodiscard]] diagnostic_context_provider_sptr_t
make_noop_diagnostic_context_provider();

//
// default_stacktrace_max_depth
//

inline constexpr std::uint32_t default_stacktrace_max_depth = 64;

//
// make_stacktrace_context_provider()
//

/**
 * @brief Create a provider that captures current call stack.
 *
 * Frames of the provider itself are never included.
 *
 * @param  skip_frames  Number of extra innermost frames to skip.
 * @param  max_depth    Maximum number of frames to store.
 */
[[nodiscard]] diagnostic_context_provider_sptr_t make_stacktrace_context_provider(
    std::uint32_t skip_frames = 0,
    std::uint32_t max_depth   = default_stacktrace_max_depth );

}  // namespace errh::handler
