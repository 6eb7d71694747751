#include <errh/logger/log.hpp>
#include <errh/logger/logger_factory.hpp>
#include <errh/logger/sink_factory.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include <errh/exception.hpp>

#include <gtest/gtest.h>

namespace /* anonymous */
{

// NOLINTNEXTLINE
using namespace ::errh::logger;

namespace fs = std::filesystem;

//
// unique_temp_log_dir()
//

[[nodiscard]] fs::path unique_temp_log_dir( std::string_view tag )
{
    return fs::temp_directory_path()
           / fmt::format( "errh_{}_{}",
                          tag,
                          std::chrono::steady_clock::now().time_since_epoch().count() );
}

//
// list_log_files()
//

[[nodiscard]] std::vector< fs::path > list_log_files( const fs::path & dir,
                                                      std::string_view prefix )
{
    std::vector< fs::path > res;
    for( const auto & entry : fs::directory_iterator{ dir } )
    {
        const auto name = entry.path().filename().string();
        if( entry.is_regular_file() && name.rfind( prefix, 0 ) == 0
            && entry.path().extension() == ".log" )
        {
            res.push_back( entry.path() );
        }
    }
    return res;
}

[[nodiscard]] std::string read_whole_file( const fs::path & path )
{
    std::ifstream input{ path, std::ios::binary };
    return std::string{ std::istreambuf_iterator< char >{ input },
                        std::istreambuf_iterator< char >{} };
}

// NOLINTNEXTLINE
TEST( ErrhLogger, LogLevelFromString )
{
    EXPECT_EQ( log_level_from_string( "trace" ), log_level::trace );
    EXPECT_EQ( log_level_from_string( "debug" ), log_level::debug );
    EXPECT_EQ( log_level_from_string( "info" ), log_level::info );
    EXPECT_EQ( log_level_from_string( "warn" ), log_level::warn );
    EXPECT_EQ( log_level_from_string( "error" ), log_level::error );
    EXPECT_EQ( log_level_from_string( "critical" ), log_level::critical );
    EXPECT_EQ( log_level_from_string( "nolog" ), log_level::nolog );

    EXPECT_THROW( (void)log_level_from_string( "" ), errh::exception_t );
    EXPECT_THROW( (void)log_level_from_string( "ERROR" ), errh::exception_t );
}

// NOLINTNEXTLINE
TEST( ErrhLogger, LogLevelToString )
{
    EXPECT_EQ( log_level_to_string( log_level::trace ), "trace" );
    EXPECT_EQ( log_level_to_string( log_level::warn ), "warn" );
    EXPECT_EQ( log_level_to_string( log_level::nolog ), "nolog" );

    EXPECT_THROW( (void)log_level_to_string( static_cast< log_level >( 42 ) ),
                  errh::exception_t );
}

// NOLINTNEXTLINE
TEST( ErrhLogger, LoggerFactory )
{
    std::ostringstream out;
    auto factory = make_logger_factory(
        log_level::info, { make_ostream_sink( out, "%n:%v" ) } );

    auto logger = factory->make_logger( "default_level" );
    logger.debug( ERRH_SRC_LOCATION, "hidden" );
    logger.info( ERRH_SRC_LOCATION, "shown" );

    auto verbose = factory->make_logger( log_level::trace, "verbose" );
    verbose.debug( ERRH_SRC_LOCATION, [ & ]( auto out_it ) {
        fmt::format_to( out_it, "value={}", 42 );
    } );

    EXPECT_EQ( out.str(), "default_level:shown\nverbose:value=42\n" );
}

// NOLINTNEXTLINE
TEST( ErrhLogger, LoggerFactoryFromCfg )
{
    {
        logger_cfg_t cfg;
        cfg.log_to_stdout = false;
        cfg.log_to_file   = true;
        cfg.path.clear();

        EXPECT_THROW( (void)make_logger_factory( "errh_test", cfg ),
                      errh::exception_t );
    }

    {
        logger_cfg_t cfg;
        cfg.log_to_stdout = false;
        cfg.log_to_file   = false;

        auto factory = make_logger_factory( "errh_test", cfg );
        ASSERT_TRUE( factory );
        auto logger = factory->make_logger( "silent" );
        logger.critical( ERRH_SRC_LOCATION, "goes nowhere" );
    }
}

// NOLINTNEXTLINE
TEST( ErrhLogger, DailySink )
{
    const auto dir = unique_temp_log_dir( "daily_sink" );
    ASSERT_FALSE( fs::exists( dir ) );

    {
        auto sink = make_daily_sink( dir.string(), "errh_daily", "%v" );
        ASSERT_TRUE( fs::is_directory( dir ) );

        logger_t logger{ std::string{ "daily" }, sink, log_level::trace };
        logger.info( ERRH_SRC_LOCATION, "message into daily file" );
        sink->flush();
    }

    const auto files = list_log_files( dir, "errh_daily_" );
    ASSERT_EQ( files.size(), 1 );
    EXPECT_EQ( read_whole_file( files.front() ), "message into daily file\n" );

    fs::remove_all( dir );
}

// NOLINTNEXTLINE
TEST( ErrhLogger, LoggerFactoryFromCfgToFile )
{
    const auto dir = unique_temp_log_dir( "factory" );
    ASSERT_FALSE( fs::exists( dir ) );

    {
        logger_cfg_t cfg;
        cfg.log_to_stdout       = false;
        cfg.log_to_file         = true;
        cfg.path                = dir.string();
        cfg.log_message_pattern = "[%n] %v";

        auto factory = make_logger_factory( "errh_app", cfg );
        ASSERT_TRUE( fs::is_directory( dir ) );

        auto logger = factory->make_logger( "to_file" );
        logger.info( ERRH_SRC_LOCATION, "written through factory" );
        logger.debug( ERRH_SRC_LOCATION, "below default level" );
        // Sinks are flushed and closed when the factory
        // and its loggers are gone.
    }

    const auto files = list_log_files( dir, "errh_app_" );
    ASSERT_EQ( files.size(), 1 );
    EXPECT_EQ( read_whole_file( files.front() ), "[to_file] written through factory\n" );

    fs::remove_all( dir );
}

}  // anonymous namespace
