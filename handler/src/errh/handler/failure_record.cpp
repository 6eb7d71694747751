#include <errh/handler/failure_record.hpp>

#include <exception>
#include <typeinfo>

#include <boost/core/demangle.hpp>

namespace errh::handler
{

//
// describe_current_exception()
//

[[nodiscard]] exception_description_t describe_current_exception()
{
    try
    {
        throw;
    }
    catch( const std::exception & ex )
    {
        return { ex.what(), boost::core::demangle( typeid( ex ).name() ) };
    }
    catch( const std::string & str )
    {
        return { str, "std::string" };
    }
    catch( const char * str )
    {
        return { str ? std::string{ str } : std::string{}, "const char*" };
    }
    catch( ... )
    {
        return { "unknown exception", std::string{} };
    }
}

}  // namespace errh::handler
