#pragma once

#include "../series/selector.hpp"

#include <string>
#include <vector>

namespace logplot
{

struct Config
{
    std::string logPath;        // growing CSV log (required)
    double tickIntervalSec{0.05};
    long maxSamples{100};       // per-series window capacity
    double fileTimeoutSec{10.0}; // wait for the file; 0 waits forever
    int stallTicks{20};         // ticks without data before "stalled"

    std::vector<series::Selector> xSelectors;
    std::vector<series::Selector> ySelectors;

    // Display
    bool color{true};
    int width{0};  // 0: terminal size
    int height{0};
    double rescaleSpeed{0.1}; // (0, 1]
    double limMargin{0.05};

    // Diagnostics for skipped rows etc.
    bool diagnostics{true};
    std::string diagnosticsLog;
};

// Load from file (JSON) on top of the defaults. Throws ConfigError on an
// unreadable file, bad JSON or wrongly typed values.
Config loadConfigFromJsonFile(const std::string& jsonPath,
                              Config base = Config{});

// Single validation point before the render loop starts. Throws
// ConfigError naming the bad option.
void validate(const Config& cfg);

} // namespace logplot
