#pragma once

#include <stdexcept>

namespace logplot
{

// Invalid option, unresolvable column selector or bad capacity.
// Fatal: reported once, the render loop never starts streaming.
struct ConfigError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

} // namespace logplot
