#include "selector.hpp"

#include "../core/errors.hpp"
#include "../core/numeric.hpp"
#include "../parse/row_parser.hpp"

#include <algorithm>

namespace logplot::series
{

Selector parseSelector(const std::string& text)
{
    const std::string t = numeric::trim(text);
    if (t.empty())
        throw ConfigError("empty column selector");
    if (t == kSampleIndexName)
        return SampleIndex{};
    if (auto idx = numeric::parseInteger(t))
        return ColumnIndex{*idx};
    return ColumnName{t};
}

std::vector<Selector> parseSelectorList(const std::vector<std::string>& items)
{
    std::vector<Selector> out;
    for (const auto& item : items)
    {
        auto pieces = parse::splitFields(item);
        // "a,b," tolerates the trailing comma
        if (pieces.size() > 1 && pieces.back().empty())
            pieces.pop_back();
        for (const auto& piece : pieces)
            out.push_back(parseSelector(piece));
    }
    return out;
}

std::string describe(const Selector& sel)
{
    if (auto idx = std::get_if<ColumnIndex>(&sel))
        return std::to_string(idx->value);
    if (auto name = std::get_if<ColumnName>(&sel))
        return "'" + name->value + "'";
    return kSampleIndexName;
}

void validateSelectors(const std::vector<Selector>& x,
                       const std::vector<Selector>& y)
{
    const bool sampleInY =
        std::any_of(y.begin(), y.end(), [](const Selector& s) {
            return std::holds_alternative<SampleIndex>(s);
        });
    if (sampleInY)
    {
        throw ConfigError(std::string("y-cols: ") + kSampleIndexName +
                          " can only be used as an x-col");
    }

    if (y.empty() && x.size() > 1)
    {
        throw ConfigError("x-cols: " + std::to_string(x.size()) +
                          " selectors given without y-cols; give one x-col "
                          "or one y-col per x-col");
    }

    if (!y.empty() && x.size() > 1 && x.size() != y.size())
    {
        throw ConfigError("x-cols: " + std::to_string(x.size()) +
                          " selectors cannot pair with " +
                          std::to_string(y.size()) +
                          " y-cols; give one x-col or one per y-col");
    }
}

} // namespace logplot::series
