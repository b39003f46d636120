#include "ids.hpp"

#include <atomic>
#include <iomanip>
#include <random>
#include <sstream>

namespace steer
{
namespace internal
{

std::string generate_id(const std::string& prefix)
{
    static std::atomic<unsigned long long> counter{0};
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 255);

    std::ostringstream oss;
    oss << prefix << "_" << counter++ << "_";
    for (int i = 0; i < 4; ++i)
        oss << std::hex << std::setfill('0') << std::setw(2) << dis(gen);

    return oss.str();
}

} // namespace internal
} // namespace steer
