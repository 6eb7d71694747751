/**
 * @file
 *
 * An example that reads a file through error handler.
 * A missing file is logged with a stack dump and turns into no content.
 */

#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>

#include <CLI/CLI.hpp>

#include <json_dto/pub.hpp>

#include <errh/exception.hpp>
#include <errh/version.hpp>
#include <errh/logger/cfg_json.hpp>
#include <errh/logger/logger_factory.hpp>
#include <errh/handler/cfg_json.hpp>
#include <errh/handler/error_handler.hpp>

//
// app_cfg_t
//

struct app_cfg_t
{
    errh::logger::logger_cfg_t logger;
    errh::handler::error_handler_cfg_t error_handler;

    template < typename Json_Io >
    void json_io( Json_Io & io )
    {
        io & json_dto::optional_no_default( "logger", logger )
            & json_dto::optional_no_default( "error_handler", error_handler );
    }
};

[[nodiscard]] app_cfg_t read_app_cfg( const std::string & path )
{
    std::ifstream input{ path };
    if( !input )
    {
        errh::throw_exception( "unable to open config file '{}'", path );
    }

    return json_dto::from_stream< app_cfg_t,
                                  rapidjson::kParseCommentsFlag
                                      | rapidjson::kParseTrailingCommasFlag >(
        input );
}

[[nodiscard]] std::optional< std::string > read_file_content(
    const std::string & path )
{
    std::ifstream input{ path, std::ios::binary };
    if( !input )
    {
        errh::throw_exception( "file not found: '{}'", path );
    }

    return std::string{ std::istreambuf_iterator< char >{ input },
                        std::istreambuf_iterator< char >{} };
}

int main( int argc, char * argv[] )
{
    try
    {
        std::string file_path = "doesNotExist";
        std::string cfg_path;

        CLI::App app{ "_example.errh.read_file reads a file swallowing errors" };

        app.add_option( "--file,-f", file_path, "file to read" )->required( false );
        app.add_option( "--config,-c", cfg_path, "json config file" )
            ->required( false );
        app.add_flag_callback(
            "--version,-v",
            [] {
                std::cout << "errh version " << ERRH_VERSION_MAJOR << "."
                          << ERRH_VERSION_MINOR << "." << ERRH_VERSION_PATCH
                          << " (" << ERRH_VCS_REVISION << ")" << std::endl;
                throw CLI::Success{};
            },
            "print version and exit" );

        CLI11_PARSE( app, argc, argv );

        const app_cfg_t cfg = cfg_path.empty() ? app_cfg_t{} : read_app_cfg( cfg_path );

        auto logger_factory =
            errh::logger::make_logger_factory( "read_file", cfg.logger );

        const auto error_handler = errh::handler::make_error_handler(
            logger_factory->make_logger( "error_handler" ), cfg.error_handler );

        const auto file_content =
            error_handler.wrap( [ & ] { return read_file_content( file_path ); } );

        std::cout << file_content.value_or( "(no content)" ) << std::endl;
    }
    catch( const std::exception & ex )
    {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}
