#include <errh/handler/logger_failure_sink.hpp>
#include <errh/handler/error_handler.hpp>

#include <algorithm>
#include <sstream>
#include <string>

#include <errh/exception.hpp>
#include <errh/test_utils/test_logger.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace /* anonymous */
{

using namespace ::errh::handler;     // NOLINT
using namespace ::errh::test_utils;  // NOLINT
using ::errh::logger::log_level;     // NOLINT
using ::testing::HasSubstr;          // NOLINT
using ::testing::StartsWith;         // NOLINT

[[nodiscard]] std::size_t count_lines( const std::string & str )
{
    return static_cast< std::size_t >( std::count( begin( str ), end( str ), '\n' ) );
}

[[nodiscard]] std::string current_test_name()
{
    return ::testing::UnitTest::GetInstance()->current_test_info()->name();
}

TEST( ErrhHandlerLoggerSink, NothingLoggedOnSuccess )  // NOLINT
{
    std::ostringstream out;
    const error_handler_t handler{
        make_logger_failure_sink( make_ostream_test_logger( current_test_name(), out ) ),
        make_noop_diagnostic_context_provider()
    };

    const auto res =
        handler.wrap( []() -> std::optional< std::string > { return "hello"; } );
    EXPECT_EQ( res, "hello" );

    const auto empty_res = handler.wrap(
        []() -> std::optional< std::string > { return std::nullopt; } );
    EXPECT_FALSE( empty_res.has_value() );

    EXPECT_TRUE( out.str().empty() );
}

TEST( ErrhHandlerLoggerSink, SingleMessagePerFailure )  // NOLINT
{
    std::ostringstream out;
    const error_handler_t handler{
        make_logger_failure_sink( make_ostream_test_logger( current_test_name(), out ) ),
        make_noop_diagnostic_context_provider()
    };

    const auto res = handler.wrap( []() -> std::optional< std::string > {
        errh::throw_exception( "file not found" );
    } );
    EXPECT_FALSE( res.has_value() );

    EXPECT_EQ( out.str(), "error|Error: file not found (errh::exception_t)\n" );
    EXPECT_EQ( count_lines( out.str() ), 1 );
}

TEST( ErrhHandlerLoggerSink, StackSymbolsInMessage )  // NOLINT
{
    std::ostringstream out;
    const error_handler_t handler{
        make_logger_failure_sink( make_ostream_test_logger( current_test_name(), out ) ),
        make_stacktrace_context_provider( 0, 4 )
    };

    const auto res = handler.wrap( []() -> std::optional< std::string > {
        errh::throw_exception( "file not found" );
    } );
    EXPECT_FALSE( res.has_value() );

    const auto text = out.str();
    EXPECT_THAT( text, StartsWith( "error|Error: file not found" ) );
    EXPECT_THAT( text, HasSubstr( "\n Stack Symbols:\n  #0 " ) );

    // A single record: level prefix is met only once.
    EXPECT_EQ( text.find( "error|" ), text.rfind( "error|" ) );
}

TEST( ErrhHandlerLoggerSink, FailureLevel )  // NOLINT
{
    {
        std::ostringstream out;
        const error_handler_t handler{
            make_logger_failure_sink(
                make_ostream_test_logger( current_test_name(), out ), log_level::info ),
            make_noop_diagnostic_context_provider()
        };

        handler.log_failure( "minor problem" );
        EXPECT_EQ( out.str(), "info|Error: minor problem\n" );
    }

    {
        // Logger itself filters out failure records.
        std::ostringstream out;
        const error_handler_t handler{
            make_logger_failure_sink(
                make_ostream_test_logger( current_test_name(), out, log_level::error ),
                log_level::debug ),
            make_noop_diagnostic_context_provider()
        };

        handler.log_failure( "filtered out" );
        EXPECT_TRUE( out.str().empty() );
    }

    {
        std::ostringstream out;
        const error_handler_t handler{
            make_logger_failure_sink(
                make_ostream_test_logger( current_test_name(), out ), log_level::nolog ),
            make_noop_diagnostic_context_provider()
        };

        EXPECT_FALSE( handler.wrap( []() -> std::optional< int > {
            errh::throw_exception( "never logged" );
        } ) );
        EXPECT_TRUE( out.str().empty() );
    }
}

TEST( ErrhHandlerLoggerSink, MakeErrorHandler )  // NOLINT
{
    std::ostringstream out;

    error_handler_cfg_t cfg;
    cfg.failure_log_level  = log_level::critical;
    cfg.capture_stacktrace = false;

    const auto handler =
        make_error_handler( make_ostream_test_logger( current_test_name(), out ), cfg );

    const auto res = handler.wrap( []() -> std::optional< int > {
        throw std::out_of_range{ "index 5 is out of range" };
    } );
    EXPECT_FALSE( res.has_value() );
    EXPECT_EQ( out.str(),
               "critical|Error: index 5 is out of range (std::out_of_range)\n" );
}

TEST( ErrhHandlerLoggerSink, ConsoleLogger )  // NOLINT
{
    const auto handler = make_error_handler( make_test_logger( current_test_name() ) );

    const auto res = handler.wrap( []() -> std::optional< std::string > {
        errh::throw_exception( "file not found" );
    } );
    EXPECT_FALSE( res.has_value() );
}

}  // anonymous namespace
