#pragma once

#include <stdexcept>
#include <string>

#include <fmt/format.h>

namespace errh
{

//
// exception_t
//

/**
 * @brief A base class for errh own exceptions.
 *
 * Thrown for broken configuration and for failures of the example
 * operations. The error handler itself never lets these escape `wrap()`.
 */
class exception_t : public std::runtime_error
{
    using base_type_t = std::runtime_error;

public:
    explicit exception_t( std::string err )
        : base_type_t{ std::move( err ) }
    {
    }

    template < typename... Args >
    exception_t( fmt::format_string< Args... > format_str, Args &&... args )
        : exception_t{ ::fmt::format( format_str,
                                      std::forward< Args >( args )... ) }
    {
    }
};

template < typename... Args >
[[noreturn]] void throw_exception( fmt::format_string< Args... > format_str,
                                   Args &&... args )
{
    throw exception_t{ format_str, std::forward< Args >( args )... };
}

}  // namespace errh
