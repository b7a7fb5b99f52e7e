#pragma once

#include "config.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace logplot::cmdline
{

// Raw command line; unset options leave the file/default value alone.
struct Options
{
    bool help{false};
    std::optional<std::string> configPath;
    std::optional<std::string> file;
    std::optional<double> sleep;
    std::optional<long> maxSamples;
    std::optional<double> timeout;
    std::optional<int> stallTicks;
    std::optional<int> width;
    std::optional<int> height;
    std::optional<std::string> diagLog;
    bool quiet{false};
    bool noColor{false};
    bool haveX{false};
    bool haveY{false};
    std::vector<std::string> xCols;
    std::vector<std::string> yCols;
};

// Accepts "--opt value" and "--opt=value". -x/-y take one or more values
// (negative indices such as -1 included). Throws ConfigError.
Options parse(int argc, const char* const* argv);

// Defaults, then the JSON file (if any), then command-line overrides.
// Not validated.
Config buildConfig(const Options& opts);

void printUsage(std::ostream& os);

} // namespace logplot::cmdline
