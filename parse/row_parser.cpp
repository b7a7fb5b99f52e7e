#include "row_parser.hpp"

#include "../core/numeric.hpp"

#include <algorithm>
#include <numeric>
#include <utility>

namespace logplot::parse
{

std::vector<std::string> splitFields(const std::string& line, char delim)
{
    std::vector<std::string> parts;
    std::size_t start = 0;
    for (;;)
    {
        const auto pos = line.find(delim, start);
        if (pos == std::string::npos)
        {
            parts.push_back(numeric::trim(line.substr(start)));
            break;
        }
        parts.push_back(numeric::trim(line.substr(start, pos - start)));
        start = pos + 1;
    }
    return parts;
}

RowParser::RowParser(SchemaListener onSchema, log::Diagnostics* diag) :
    onSchema(std::move(onSchema)), diag(diag)
{}

void RowParser::establish(Schema s)
{
    established = std::move(s);
    if (onSchema)
    {
        required = onSchema(*established);
    }
    else
    {
        required.resize(established->columns);
        std::iota(required.begin(), required.end(), std::size_t{0});
    }
}

void RowParser::reset()
{
    established.reset();
    required.clear();
    acceptedCount = 0;
    skippedCount = 0;
}

ParseResult RowParser::skip(SkipReason reason, const std::string& line,
                            std::size_t detail)
{
    ++skippedCount;
    ParseResult r;
    r.status = Status::Skip;
    r.reason = reason;
    r.column = detail;

    if (diag && reason != SkipReason::Blank)
    {
        const std::string shown =
            line.size() > 60 ? line.substr(0, 60) + "..." : line;
        if (reason == SkipReason::ColumnCount)
        {
            diag->once("columns:" + std::to_string(detail),
                       "Skipping row with " + std::to_string(detail) +
                           " columns (expected " +
                           std::to_string(established->columns) +
                           "): " + shown);
        }
        else
        {
            diag->once("nonnumeric:" + std::to_string(detail),
                       "Skipping row with non-numeric column " +
                           std::to_string(detail) + ": " + shown);
        }
    }
    return r;
}

ParseResult RowParser::parse(const std::string& line)
{
    auto fields = splitFields(line);
    const bool blank = std::all_of(fields.begin(), fields.end(),
                                   [](const auto& f) { return f.empty(); });
    if (blank)
        return skip(SkipReason::Blank, line, 0);

    // A trailing delimiter ("1,2,") does not add a column.
    if (fields.size() > 1 && fields.back().empty() &&
        (!established || fields.size() == established->columns + 1))
        fields.pop_back();

    Record rec;
    rec.fields.reserve(fields.size());
    for (const auto& f : fields)
        rec.fields.push_back(numeric::parseDouble(f));

    if (!established)
    {
        const bool anyNumeric =
            std::any_of(rec.fields.begin(), rec.fields.end(),
                        [](const auto& v) { return v.has_value(); });
        Schema s;
        s.columns = fields.size();
        if (!anyNumeric)
        {
            s.header = fields;
            establish(std::move(s));
            ParseResult r;
            r.status = Status::Header;
            return r;
        }
        establish(std::move(s));
    }

    if (rec.columns() != established->columns)
        return skip(SkipReason::ColumnCount, line, rec.columns());

    for (auto col : required)
    {
        if (col >= rec.columns() || !rec.fields[col])
            return skip(SkipReason::NonNumeric, line, col);
    }

    ++acceptedCount;
    ParseResult r;
    r.status = Status::Record;
    r.record = std::move(rec);
    return r;
}

} // namespace logplot::parse
