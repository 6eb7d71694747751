/**
 * @file
 *
 * A vocabulary type describing a handled failure.
 */
#pragma once

#include <string>

#include <fmt/format.h>

#include <errh/handler/diagnostic_context.hpp>

namespace errh::handler
{

//
// failure_record_t
//

/**
 * @brief A failure of a wrapped operation along with its diagnostic context.
 *
 * Created only when a failure is handled and passed to a sink right away.
 */
struct failure_record_t
{
    //! Text describing the failure.
    std::string description;

    //! Demangled name of exception type, empty if unknown.
    std::string exception_type;

    diagnostic_context_t context;
};

//
// exception_description_t
//

struct exception_description_t
{
    std::string description;
    std::string exception_type;
};

//
// describe_current_exception()
//

/**
 * @brief Get the description of the exception currently being handled.
 *
 * `std::exception` derivatives are described by `what()`,
 * thrown strings by themselves and anything else as "unknown exception".
 *
 * @pre Must be called from within a catch block.
 */
[[nodiscard]] exception_description_t describe_current_exception();

}  // namespace errh::handler

namespace fmt
{

template <>
struct formatter< ::errh::handler::failure_record_t >
{
    template < class Parse_Context >
    constexpr auto parse( Parse_Context & ctx )
    {
        auto it  = std::begin( ctx );
        auto end = std::end( ctx );
        if( it != end && *it != '}' ) throw fmt::format_error( "invalid format" );
        return it;
    }

    template < class Format_Context >
    auto format( const ::errh::handler::failure_record_t & failure,
                 Format_Context & ctx ) const
    {
        // Produces the output of the following form:
        //  Error: file not found (errh::exception_t)
        //   Stack Symbols:
        //    #0 read_file_content(...) at main.cpp:42
        //    #1 ...
        auto out = fmt::format_to( ctx.out(), "Error: {}", failure.description );

        if( !failure.exception_type.empty() )
        {
            out = fmt::format_to( out, " ({})", failure.exception_type );
        }

        if( failure.context.empty() )
        {
            return out;
        }

        out = fmt::format_to( out, "\n Stack Symbols:" );
        const auto & symbols = failure.context.stack_symbols;
        for( std::size_t i = 0; i < symbols.size(); ++i )
        {
            out = fmt::format_to( out, "\n  #{} {}", i, symbols[ i ] );
        }

        return out;
    }
};

}  // namespace fmt
