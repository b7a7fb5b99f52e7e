#include "series_router.hpp"

#include "../core/errors.hpp"

#include <algorithm>
#include <utility>

namespace logplot::series
{

SeriesRouter::SeriesRouter(std::vector<Selector> x, std::vector<Selector> y) :
    xSel(std::move(x)), ySel(std::move(y))
{
    validateSelectors(xSel, ySel);
}

std::size_t SeriesRouter::resolveColumn(const Selector& sel,
                                        const parse::Schema& schema,
                                        const char* option) const
{
    if (auto idx = std::get_if<ColumnIndex>(&sel))
    {
        long v = idx->value;
        if (v < 0)
            v += static_cast<long>(schema.columns);
        if (v < 0 || v >= static_cast<long>(schema.columns))
        {
            throw ConfigError(std::string(option) + ": index " +
                              std::to_string(idx->value) +
                              " out of range (log has " +
                              std::to_string(schema.columns) + " columns)");
        }
        return static_cast<std::size_t>(v);
    }

    if (auto name = std::get_if<ColumnName>(&sel))
    {
        if (!schema.header)
        {
            throw ConfigError(std::string(option) + ": column name '" +
                              name->value +
                              "' needs a header line, but the log has none");
        }
        const auto& hdr = *schema.header;
        auto it = std::find(hdr.begin(), hdr.end(), name->value);
        if (it == hdr.end())
        {
            std::string known;
            for (const auto& h : hdr)
                known += (known.empty() ? "" : ", ") + h;
            throw ConfigError(std::string(option) + ": column '" +
                              name->value + "' not found in header [" +
                              known + "]");
        }
        return static_cast<std::size_t>(it - hdr.begin());
    }

    throw ConfigError(std::string(option) + ": " + kSampleIndexName +
                      " is not a column");
}

std::optional<std::size_t>
    SeriesRouter::resolveX(const Selector& sel,
                           const parse::Schema& schema) const
{
    if (std::holds_alternative<SampleIndex>(sel))
        return std::nullopt;
    return resolveColumn(sel, schema, "x-cols");
}

std::string SeriesRouter::columnName(std::size_t col) const
{
    if (resolvedSchema.header && col < resolvedSchema.header->size() &&
        !(*resolvedSchema.header)[col].empty())
    {
        return (*resolvedSchema.header)[col];
    }
    return "col" + std::to_string(col);
}

SeriesBinding SeriesRouter::bind(std::size_t id, std::optional<std::size_t> x,
                                 std::size_t y) const
{
    SeriesBinding b;
    b.id = id;
    b.xColumn = x;
    b.yColumn = y;
    b.label = x ? columnName(*x) + " vs. " + columnName(y) : columnName(y);
    return b;
}

const std::vector<SeriesBinding>&
    SeriesRouter::resolve(const parse::Schema& schema)
{
    if (isResolved)
        return series;

    if (schema.columns == 0)
        throw ConfigError("log has no columns");

    // Labels read the header through columnName().
    resolvedSchema = schema;

    // Nothing is kept unless every selector resolves.
    std::vector<SeriesBinding> bound;
    auto add = [&](std::optional<std::size_t> x, std::size_t y) {
        bound.push_back(bind(bound.size(), x, y));
    };

    if (xSel.empty() && ySel.empty())
    {
        if (schema.columns == 1)
            add(std::nullopt, 0);
        else
            add(0, 1);
    }
    else if (ySel.empty())
    {
        const auto x = resolveX(xSel.front(), schema);
        for (std::size_t c = 0; c < schema.columns; ++c)
        {
            if (!x || c != *x)
                add(x, c);
        }
        if (bound.empty())
        {
            throw ConfigError("x-cols: no y column left besides " +
                              describe(xSel.front()));
        }
    }
    else
    {
        for (std::size_t i = 0; i < ySel.size(); ++i)
        {
            std::optional<std::size_t> x;
            if (!xSel.empty())
                x = resolveX(xSel.size() == 1 ? xSel.front() : xSel[i],
                             schema);
            add(x, resolveColumn(ySel[i], schema, "y-cols"));
        }
    }

    series = std::move(bound);
    isResolved = true;
    return series;
}

void SeriesRouter::reset()
{
    isResolved = false;
    resolvedSchema = parse::Schema{};
    series.clear();
    sampleIndex = 0;
}

std::vector<Sample> SeriesRouter::route(const parse::Record& rec)
{
    std::vector<Sample> out;
    if (!isResolved)
        return out;

    out.reserve(series.size());
    const double seq = static_cast<double>(sampleIndex);
    for (const auto& b : series)
    {
        if (b.yColumn >= rec.columns() || !rec.fields[b.yColumn])
            continue;
        double x = seq;
        if (b.xColumn)
        {
            if (*b.xColumn >= rec.columns() || !rec.fields[*b.xColumn])
                continue;
            x = *rec.fields[*b.xColumn];
        }
        out.push_back({b.id, x, *rec.fields[b.yColumn]});
    }
    ++sampleIndex;
    return out;
}

std::vector<std::size_t> SeriesRouter::requiredColumns() const
{
    std::vector<std::size_t> cols;
    for (const auto& b : series)
    {
        cols.push_back(b.yColumn);
        if (b.xColumn)
            cols.push_back(*b.xColumn);
    }
    std::sort(cols.begin(), cols.end());
    cols.erase(std::unique(cols.begin(), cols.end()), cols.end());
    return cols;
}

std::string SeriesRouter::xAxisLabel() const
{
    std::vector<std::string> names;
    for (const auto& b : series)
    {
        std::string n = b.xColumn ? columnName(*b.xColumn) : "Sample";
        if (std::find(names.begin(), names.end(), n) == names.end())
            names.push_back(std::move(n));
    }
    std::string out;
    for (const auto& n : names)
        out += (out.empty() ? "" : ", ") + n;
    return out.empty() ? "Sample" : out;
}

} // namespace logplot::series
