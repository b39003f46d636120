#include <sstream>
#include <steer/version.hpp>

namespace steer
{

std::string version_string()
{
    std::ostringstream oss;
    oss << VERSION_MAJOR << "." << VERSION_MINOR << "." << VERSION_PATCH;
    return oss.str();
}

} // namespace steer
