#pragma once

#include <chrono>

namespace logplot::timeutil
{

// Convert a (fractional) number of seconds to a steady_clock duration,
// never shorter than one millisecond.
std::chrono::steady_clock::duration fromSeconds(double sec);

// Seconds elapsed since start.
double secondsSince(std::chrono::steady_clock::time_point start);

} // namespace logplot::timeutil
