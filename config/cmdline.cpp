#include "cmdline.hpp"

#include "../core/errors.hpp"
#include "../core/numeric.hpp"

#include <ostream>

namespace logplot::cmdline
{

namespace
{

bool isOption(const std::string& arg)
{
    // "-1" is a column index, not an option.
    return arg.size() > 1 && arg[0] == '-' && !numeric::parseInteger(arg);
}

double toDouble(const std::string& opt, const std::string& v)
{
    auto d = numeric::parseDouble(v);
    if (!d)
        throw ConfigError(opt + ": expected a number, got '" + v + "'");
    return *d;
}

long toLong(const std::string& opt, const std::string& v)
{
    auto n = numeric::parseInteger(v);
    if (!n)
        throw ConfigError(opt + ": expected an integer, got '" + v + "'");
    return *n;
}

} // namespace

void printUsage(std::ostream& os)
{
    os << "logplot: live plot of CSV rows appended to a log file\n\n"
       << "Usage:\n"
       << "  logplot -f logging/log.txt\n"
       << "  logplot -f log.txt -x t -y a b --max-samples 200\n\n"
       << "Options:\n"
       << "  -f, --file PATH             Growing log file (required)\n"
       << "  -x, --x-cols SEL...         Column(s) for x values, name or index.\n"
       << "                              With only -y given, x is the sample\n"
       << "                              index. Several x-cols must match the\n"
       << "                              number of y-cols.\n"
       << "  -y, --y-cols SEL...         Column(s) for y values, name or index.\n"
       << "                              With only -x given, every other\n"
       << "                              column is plotted.\n"
       << "  -n, --max-samples N         Samples kept per series (default: 100)\n"
       << "  -s, --sleep SEC             Time between updates (default: 0.05)\n"
       << "      --timeout SEC           Wait for the log file (default: 10,\n"
       << "                              0 waits forever)\n"
       << "      --stall-ticks N         Idle updates before 'stalled' (default: 20)\n"
       << "  -c, --config PATH           JSON configuration file\n"
       << "      --diag-log PATH         Also append diagnostics to PATH\n"
       << "  -q, --quiet                 No diagnostics for skipped rows\n"
       << "      --no-color              Plain ASCII chart\n"
       << "      --width N, --height N   Chart size (default: terminal size)\n"
       << "  -h, --help                  Show this help\n\n"
       << "With no -x/-y, a single-column log is plotted against the sample\n"
       << "index and wider logs plot column 1 against column 0.\n"
       << "Use " << series::kSampleIndexName
       << " as an x-col for the sample index.\n";
}

Options parse(int argc, const char* const* argv)
{
    Options o;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        std::string inlineValue;
        bool hasInline = false;
        if (arg.rfind("--", 0) == 0)
        {
            const auto eq = arg.find('=');
            if (eq != std::string::npos)
            {
                inlineValue = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
                hasInline = true;
            }
        }

        auto value = [&]() -> std::string {
            if (hasInline)
                return inlineValue;
            if (i + 1 >= argc)
                throw ConfigError(arg + ": missing value");
            return argv[++i];
        };
        auto values = [&]() {
            std::vector<std::string> out;
            if (hasInline)
                out.push_back(inlineValue);
            while (i + 1 < argc && !isOption(argv[i + 1]))
                out.push_back(argv[++i]);
            if (out.empty())
                throw ConfigError(arg + ": expected at least one column");
            return out;
        };

        if (arg == "-h" || arg == "--help")
            o.help = true;
        else if (arg == "-f" || arg == "--file")
            o.file = value();
        else if (arg == "-c" || arg == "--config")
            o.configPath = value();
        else if (arg == "-s" || arg == "--sleep")
            o.sleep = toDouble(arg, value());
        else if (arg == "-n" || arg == "--max-samples")
            o.maxSamples = toLong(arg, value());
        else if (arg == "--timeout")
            o.timeout = toDouble(arg, value());
        else if (arg == "--stall-ticks")
            o.stallTicks = static_cast<int>(toLong(arg, value()));
        else if (arg == "--width")
            o.width = static_cast<int>(toLong(arg, value()));
        else if (arg == "--height")
            o.height = static_cast<int>(toLong(arg, value()));
        else if (arg == "--diag-log")
            o.diagLog = value();
        else if (arg == "-q" || arg == "--quiet")
            o.quiet = true;
        else if (arg == "--no-color")
            o.noColor = true;
        else if (arg == "-x" || arg == "--x-cols" || arg == "--x-col")
        {
            auto v = values();
            o.xCols.insert(o.xCols.end(), v.begin(), v.end());
            o.haveX = true;
        }
        else if (arg == "-y" || arg == "--y-cols" || arg == "--y-col")
        {
            auto v = values();
            o.yCols.insert(o.yCols.end(), v.begin(), v.end());
            o.haveY = true;
        }
        else
            throw ConfigError("unknown option: " + arg);
    }
    return o;
}

Config buildConfig(const Options& o)
{
    Config cfg;
    if (o.configPath)
        cfg = loadConfigFromJsonFile(*o.configPath, cfg);

    if (o.file)
        cfg.logPath = *o.file;
    if (o.sleep)
        cfg.tickIntervalSec = *o.sleep;
    if (o.maxSamples)
        cfg.maxSamples = *o.maxSamples;
    if (o.timeout)
        cfg.fileTimeoutSec = *o.timeout;
    if (o.stallTicks)
        cfg.stallTicks = *o.stallTicks;
    if (o.width)
        cfg.width = *o.width;
    if (o.height)
        cfg.height = *o.height;
    if (o.diagLog)
        cfg.diagnosticsLog = *o.diagLog;
    if (o.quiet)
        cfg.diagnostics = false;
    if (o.noColor)
        cfg.color = false;
    if (o.haveX)
        cfg.xSelectors = series::parseSelectorList(o.xCols);
    if (o.haveY)
        cfg.ySelectors = series::parseSelectorList(o.yCols);
    return cfg;
}

} // namespace logplot::cmdline
