#pragma once

#include "../core/logging.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace logplot::parse
{

// Column layout fixed by the first non-blank line of the log.
struct Schema
{
    std::size_t columns{0};
    // Present when the first line was a header (no numeric field at all).
    std::optional<std::vector<std::string>> header;
};

struct Record
{
    // One entry per column; empty where the field is not a number.
    std::vector<std::optional<double>> fields;

    std::size_t columns() const
    {
        return fields.size();
    }
};

enum class Status
{
    Record,
    Header,
    Skip
};

enum class SkipReason
{
    None,
    Blank,
    ColumnCount,
    NonNumeric
};

struct ParseResult
{
    Status status{Status::Skip};
    SkipReason reason{SkipReason::None};
    Record record;
    std::size_t column{0}; // offending column for NonNumeric
};

// Called once when the schema is established; returns the columns every
// later data row must carry as numbers. May throw ConfigError.
using SchemaListener =
    std::function<std::vector<std::size_t>(const Schema&)>;

// Split on the delimiter and trim each field. Empty fields are kept.
std::vector<std::string> splitFields(const std::string& line,
                                     char delim = ',');

class RowParser
{
  public:
    // Without a listener every column is required.
    explicit RowParser(SchemaListener onSchema = {},
                       log::Diagnostics* diag = nullptr);

    ParseResult parse(const std::string& line);

    // Forget the schema and counters; the next line is treated as the
    // first line of a new log.
    void reset();

    const std::optional<Schema>& schema() const
    {
        return established;
    }

    std::size_t accepted() const
    {
        return acceptedCount;
    }

    std::size_t skipped() const
    {
        return skippedCount;
    }

  private:
    void establish(Schema s);
    ParseResult skip(SkipReason reason, const std::string& line,
                     std::size_t detail);

    SchemaListener onSchema;
    log::Diagnostics* diag;
    std::optional<Schema> established;
    std::vector<std::size_t> required;
    std::size_t acceptedCount{0};
    std::size_t skippedCount{0};
};

} // namespace logplot::parse
