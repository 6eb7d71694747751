#include <errh/logger/cfg_json.hpp>

#include <errh/exception.hpp>

namespace json_dto
{

//
// read_json_value()
//

template <>
void read_json_value( ::errh::logger::log_level & v,
                      const rapidjson::Value & object )
{
    if( !object.IsString() )
    {
        ::errh::throw_exception( "log_level must be a string" );
    }

    v = ::errh::logger::log_level_from_string(
        std::string_view{ object.GetString(), object.GetStringLength() } );
}

}  // namespace json_dto
