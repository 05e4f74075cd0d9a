#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "common/models.hpp"

namespace jobhist {

// Parsed "[width][.precision][type]" suffix of a column, e.g. "elapsed:m".
// type letters: s text, d integer, f float, t duration HH:MM:SS,
// m duration HH:MM, h duration in decimal hours, T timestamp, D date.
struct DisplaySpec {
    std::optional<int> width;
    std::optional<int> precision;
    char type = '\0';
};

struct Column {
    FieldSpec field;
    DisplaySpec spec;
    std::string label;
};

// resolveField() plus the derived display fields waittime and type.
std::optional<FieldSpec> resolveDisplayField(std::string_view name);

// "user,numcpus,elapsed:m,memory:.2f". Throws UnknownFieldError for unknown
// names and UnsupportedFormatSpecifierError for a specifier that does not
// parse or does not fit the field's kind.
std::vector<Column> parseColumnList(const std::string &text);

// Stored, pseudo or derived value of a column on a record.
std::optional<FieldValue> displayValue(const Record &record, const FieldSpec &field);

struct FormatterOptions {
    bool header = true;
    bool average = false;
};

// Streams records in one output mode. Only running sums and counts are kept
// between records, never the records themselves.
class RecordFormatter {
public:
    RecordFormatter(OutputMode mode,
                    std::vector<Column> columns,
                    std::ostream &out,
                    FormatterOptions options = {});

    void begin();
    void write(const Record &record);
    void finish();

    std::size_t recordsWritten() const { return m_count; }
    const std::vector<Column> &columns() const { return m_columns; }

private:
    struct Accumulator {
        double sum = 0.0;
        std::size_t count = 0;
    };

    std::vector<std::optional<FieldValue>> valuesOf(const Record &record) const;
    // title heads a long block, or labels the summary row when summary is set.
    void writeRow(const std::vector<std::optional<FieldValue>> &values,
                  const std::string &title,
                  bool summary);
    void writeTabularLine(const std::vector<std::string> &cells, bool truncate = true);
    void accumulate(const std::vector<std::optional<FieldValue>> &values);
    std::vector<std::optional<FieldValue>> averages() const;

    OutputMode m_mode;
    std::vector<Column> m_columns;
    std::vector<int> m_widths;
    std::ostream &m_out;
    FormatterOptions m_options;
    std::vector<Accumulator> m_sums;
    std::size_t m_count = 0;
    bool m_begun = false;
    bool m_finished = false;
};

// Cell text for one value under a column's specifier, without padding.
std::string formatCell(const FieldValue &value, const Column &column);
std::string csvEscape(const std::string &text);

} // namespace jobhist
