#pragma once
#include <chrono>
#include <ctime>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>
#include <string>
#include <utility>

namespace logplot::log
{

inline std::string nowIso()
{
    using namespace std::chrono;
    auto t = system_clock::now();
    std::time_t tt = system_clock::to_time_t(t);
    std::tm tm = *std::gmtime(&tt);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Append a timestamped line to the given path, creating directories as needed.
inline void appendLine(const std::string& path, const std::string& line)
{
    const auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }
    std::ofstream f(path, std::ios::app);
    f << nowIso() << " " << line << "\n";
}

// Operator-facing message with the tool tag.
inline void info(const std::string& msg)
{
    std::cerr << "[logplot] " << msg << "\n";
}

// Diagnostics for transient data errors (malformed lines, truncation).
// Each distinct key is reported once; later repeats are only counted.
class Diagnostics
{
  public:
    Diagnostics() = default;
    Diagnostics(bool enabled, std::string mirrorPath,
                std::ostream& out = std::cerr) :
        enabled(enabled), mirrorPath(std::move(mirrorPath)), out(&out)
    {}

    // Report msg unless key was seen before. Returns true if emitted.
    bool once(const std::string& key, const std::string& msg)
    {
        if (!seen.insert(key).second)
        {
            ++suppressedCount;
            return false;
        }
        emit(msg);
        return enabled;
    }

    // Always reported (subject to the enable flag).
    void note(const std::string& msg)
    {
        emit(msg);
    }

    const std::string& last() const
    {
        return lastMsg;
    }

    std::size_t suppressed() const
    {
        return suppressedCount;
    }

    bool isEnabled() const
    {
        return enabled;
    }

    // While a full-screen chart is up, messages only reach last() and the
    // mirror file.
    void setConsole(bool on)
    {
        console = on;
    }

  private:
    void emit(const std::string& msg)
    {
        if (!enabled)
            return;
        lastMsg = msg;
        if (console)
            *out << "[logplot] " << msg << "\n";
        if (!mirrorPath.empty())
            appendLine(mirrorPath, msg);
    }

    bool enabled{true};
    bool console{true};
    std::string mirrorPath;
    std::ostream* out{&std::cerr};
    std::set<std::string> seen;
    std::size_t suppressedCount{0};
    std::string lastMsg;
};

} // namespace logplot::log
