#ifndef STEER_VERSION_HPP
#define STEER_VERSION_HPP

#include <string>

namespace steer
{

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

std::string version_string();

} // namespace steer

#endif // STEER_VERSION_HPP
