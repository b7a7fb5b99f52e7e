#include "time_utils.hpp"

#include <algorithm>

namespace logplot::timeutil
{

std::chrono::steady_clock::duration fromSeconds(double sec)
{
    using namespace std::chrono;
    const auto us = static_cast<long long>(sec * 1e6);
    return duration_cast<steady_clock::duration>(
        microseconds(std::max<long long>(us, 1000)));
}

double secondsSince(std::chrono::steady_clock::time_point start)
{
    using namespace std::chrono;
    return duration<double>(steady_clock::now() - start).count();
}

} // namespace logplot::timeutil
