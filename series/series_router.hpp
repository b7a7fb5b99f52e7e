#pragma once

#include "../parse/row_parser.hpp"
#include "selector.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace logplot::series
{

// One plotted trace, fixed for the lifetime of the run.
struct SeriesBinding
{
    std::size_t id{0};
    std::optional<std::size_t> xColumn; // empty: sample index
    std::size_t yColumn{0};
    std::string label;
};

struct Sample
{
    std::size_t series{0};
    double x{0.0};
    double y{0.0};
};

// Turns configured selectors into concrete column pairs and fans each
// accepted record out into one sample per series.
//
// Defaults when nothing is configured:
//   one column       -> x = sample index, y = column 0
//   two or more      -> x = column 0,     y = column 1
// Only y given  -> x = sample index for every y.
// Only x given  -> y = every other column.
class SeriesRouter
{
  public:
    // Throws ConfigError on an invalid x/y pairing.
    SeriesRouter(std::vector<Selector> x, std::vector<Selector> y);

    // Resolve against the established schema. Runs once; later calls
    // return the first result. Throws ConfigError on an unknown name or
    // an out-of-range index.
    const std::vector<SeriesBinding>& resolve(const parse::Schema& schema);

    std::vector<Sample> route(const parse::Record& rec);

    // Drop the bindings and the sample index so the next schema is
    // resolved from scratch.
    void reset();

    bool resolved() const
    {
        return isResolved;
    }

    const std::vector<SeriesBinding>& bindings() const
    {
        return series;
    }

    // Sorted, de-duplicated columns referenced by any series.
    std::vector<std::size_t> requiredColumns() const;

    // "Sample" for the sample index, else the distinct x column names.
    std::string xAxisLabel() const;

  private:
    std::optional<std::size_t> resolveX(const Selector& sel,
                                        const parse::Schema& schema) const;
    std::size_t resolveColumn(const Selector& sel, const parse::Schema& schema,
                              const char* option) const;
    std::string columnName(std::size_t col) const;
    SeriesBinding bind(std::size_t id, std::optional<std::size_t> x,
                       std::size_t y) const;

    std::vector<Selector> xSel;
    std::vector<Selector> ySel;
    bool isResolved{false};
    parse::Schema resolvedSchema;
    std::vector<SeriesBinding> series;
    std::size_t sampleIndex{0};
};

} // namespace logplot::series
