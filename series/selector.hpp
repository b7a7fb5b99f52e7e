#pragma once

#include <string>
#include <variant>
#include <vector>

namespace logplot::series
{

// Column by position. Negative values count from the last column.
struct ColumnIndex
{
    long value{0};
};

// Column by header name.
struct ColumnName
{
    std::string value;
};

// Sequence number of accepted rows (0, 1, 2, ...). x only.
struct SampleIndex
{};

using Selector = std::variant<ColumnIndex, ColumnName, SampleIndex>;

// Reserved selector text for SampleIndex.
inline constexpr const char* kSampleIndexName = "_index";

// "2" / "-1" -> ColumnIndex, "_index" -> SampleIndex, anything else is a
// name. Throws ConfigError on an empty selector.
Selector parseSelector(const std::string& text);

// Each item may itself be a comma-separated list ("a,b").
std::vector<Selector> parseSelectorList(const std::vector<std::string>& items);

std::string describe(const Selector& sel);

// Startup check of the x/y pairing rule: one x for every y, or one x per
// y. Throws ConfigError naming the offending option.
void validateSelectors(const std::vector<Selector>& x,
                       const std::vector<Selector>& y);

} // namespace logplot::series
