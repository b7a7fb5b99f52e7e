#pragma once

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <optional>
#include <string>

namespace logplot::numeric
{

// Strip leading/trailing spaces, tabs and CR/LF.
inline std::string trim(const std::string& s)
{
    const char* ws = " \t\r\n";
    const auto b = s.find_first_not_of(ws);
    if (b == std::string::npos)
        return {};
    const auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

// Parse a whole field as a finite double. Partial matches ("12abc"),
// empty fields, inf and nan are rejected.
inline std::optional<double> parseDouble(const std::string& field)
{
    if (field.empty())
        return std::nullopt;
    const char* begin = field.c_str();
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || errno == ERANGE)
        return std::nullopt;
    if (!std::isfinite(v))
        return std::nullopt;
    return v;
}

// Parse an optionally signed decimal integer ("3", "-1").
inline std::optional<long> parseInteger(const std::string& field)
{
    if (field.empty())
        return std::nullopt;
    std::size_t i = (field[0] == '-' || field[0] == '+') ? 1 : 0;
    if (i == field.size())
        return std::nullopt;
    for (std::size_t k = i; k < field.size(); ++k)
    {
        if (field[k] < '0' || field[k] > '9')
            return std::nullopt;
    }
    errno = 0;
    const long v = std::strtol(field.c_str(), nullptr, 10);
    if (errno == ERANGE)
        return std::nullopt;
    return v;
}

} // namespace logplot::numeric
