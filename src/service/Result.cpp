#include "Result.hpp"

#include <boost/core/demangle.hpp>

std::string Service::Result::describeType(const std::type_info &type)
{
    return boost::core::demangle(type.name());
}
