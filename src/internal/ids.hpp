#ifndef STEER_INTERNAL_IDS_HPP
#define STEER_INTERNAL_IDS_HPP

#include <string>

namespace steer
{
namespace internal
{

// {prefix}_{counter}_{8 random hex chars}; unique within the process.
std::string generate_id(const std::string& prefix);

} // namespace internal
} // namespace steer

#endif // STEER_INTERNAL_IDS_HPP
