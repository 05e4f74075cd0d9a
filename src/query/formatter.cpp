#include "query/formatter.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <regex>
#include <sstream>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "query/record_model.hpp"

namespace jobhist {

namespace {

constexpr int kDefaultPrecision = 2;

bool isNumericKind(FieldKind kind)
{
    return kind == FieldKind::Integer || kind == FieldKind::Float
        || kind == FieldKind::Memory || kind == FieldKind::Duration;
}

char defaultType(FieldKind kind)
{
    switch (kind) {
    case FieldKind::Integer:
        return 'd';
    case FieldKind::Float:
    case FieldKind::Memory:
        return 'f';
    case FieldKind::Duration:
        return 't';
    case FieldKind::Timestamp:
        return 'T';
    case FieldKind::Text:
        return 's';
    }
    return 's';
}

char effectiveType(const Column &column)
{
    return column.spec.type != '\0' ? column.spec.type : defaultType(column.field.kind);
}

bool typeFitsKind(char type, FieldKind kind)
{
    switch (type) {
    case 's':
        return true;
    case 'd':
        return kind == FieldKind::Integer;
    case 'f':
        return kind == FieldKind::Integer || kind == FieldKind::Float
            || kind == FieldKind::Memory;
    case 't':
    case 'm':
    case 'h':
        return kind == FieldKind::Duration;
    case 'T':
    case 'D':
        return kind == FieldKind::Timestamp;
    default:
        return false;
    }
}

int defaultWidth(const Column &column)
{
    const char type = effectiveType(column);
    if (type == 's') {
        if (column.field.kind != FieldKind::Text) {
            return defaultWidth(Column{column.field, DisplaySpec{}, column.label});
        }
        return column.field.logName == "id" ? 20 : 12;
    }
    switch (type) {
    case 'd':
        return 8;
    case 'f':
        return 10;
    case 't':
        return 10;
    case 'm':
    case 'h':
        return 8;
    case 'T':
        return 19;
    case 'D':
        return 10;
    default:
        return 12;
    }
}

std::string fixed(double value, int precision)
{
    return QString::number(value, 'f', precision).toStdString();
}

std::string clockText(Duration duration, bool withSeconds)
{
    std::int64_t seconds = duration.count();
    const bool negative = seconds < 0;
    if (negative) {
        seconds = -seconds;
    }
    std::ostringstream out;
    if (negative) {
        out << '-';
    }
    out << std::setfill('0') << std::setw(2) << seconds / 3600 << ':' << std::setw(2)
        << (seconds / 60) % 60;
    if (withSeconds) {
        out << ':' << std::setw(2) << seconds % 60;
    }
    return out.str();
}

std::string plainText(const FieldValue &value)
{
    return std::visit(
        [](const auto &v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::int64_t>) {
                return std::to_string(v);
            } else if constexpr (std::is_same_v<T, double>) {
                return fixed(v, kDefaultPrecision);
            } else if constexpr (std::is_same_v<T, Duration>) {
                return clockText(v, true);
            } else if constexpr (std::is_same_v<T, Timestamp>) {
                return toIso8601Local(v);
            } else {
                return v;
            }
        },
        value);
}

nlohmann::ordered_json jsonCell(const std::optional<FieldValue> &value)
{
    if (!value.has_value()) {
        return nullptr;
    }
    return toJsonValue(*value);
}

DisplaySpec parseDisplaySpec(const std::string &name, const std::string &text)
{
    static const std::regex pattern(R"(^(\d+)?(?:\.(\d+))?([sdftmhTD])?$)");
    std::smatch match;
    if (text.empty() || !std::regex_match(text, match, pattern)) {
        throw UnsupportedFormatSpecifierError("invalid format specifier '" + text
                                              + "' for column '" + name + "'");
    }

    DisplaySpec spec;
    try {
        if (match[1].matched) {
            spec.width = std::stoi(match[1].str());
        }
        if (match[2].matched) {
            spec.precision = std::stoi(match[2].str());
        }
    } catch (const std::out_of_range &) {
        throw UnsupportedFormatSpecifierError("format specifier '" + text
                                              + "' is out of range for column '" + name
                                              + "'");
    }
    if (match[3].matched) {
        spec.type = match[3].str().front();
    }
    return spec;
}

std::string trim(const std::string &value)
{
    const auto first = value.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t");
    return value.substr(first, last - first + 1);
}

} // namespace

std::optional<FieldSpec> resolveDisplayField(std::string_view name)
{
    if (name == "waittime") {
        return FieldSpec{std::string(name), "waittime", FieldKind::Duration,
                         FieldOrigin::Derived};
    }
    if (name == "type") {
        return FieldSpec{std::string(name), "type", FieldKind::Text, FieldOrigin::Derived};
    }
    return resolveField(name);
}

std::vector<Column> parseColumnList(const std::string &text)
{
    std::vector<Column> columns;
    std::stringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = trim(item);
        if (item.empty()) {
            continue;
        }

        const auto colon = item.find(':');
        const std::string name = trim(item.substr(0, colon));
        const auto field = resolveDisplayField(name);
        if (!field.has_value()) {
            throw UnknownFieldError(name);
        }

        Column column{*field, DisplaySpec{}, name};
        if (colon != std::string::npos) {
            column.spec = parseDisplaySpec(name, trim(item.substr(colon + 1)));
        }
        if (!typeFitsKind(effectiveType(column), column.field.kind)) {
            throw UnsupportedFormatSpecifierError(
                std::string("specifier '") + column.spec.type + "' does not apply to "
                + toFieldKindString(column.field.kind) + " column '" + name + "'");
        }
        columns.push_back(std::move(column));
    }

    if (columns.empty()) {
        throw UnsupportedFormatSpecifierError("no output columns in '" + text + "'");
    }
    return columns;
}

std::optional<FieldValue> displayValue(const Record &record, const FieldSpec &field)
{
    if (field.origin != FieldOrigin::Derived) {
        return lookupValue(record, field);
    }

    if (field.logName == "type") {
        return FieldValue{toRecordTypeName(record.type())};
    }
    if (field.logName == "waittime") {
        const FieldValue *start = record.field("start");
        const FieldValue *eligible = record.field("etime");
        if (!eligible || !std::holds_alternative<Timestamp>(*eligible)) {
            eligible = record.field("qtime");
        }
        if (!start || !eligible || !std::holds_alternative<Timestamp>(*start)
            || !std::holds_alternative<Timestamp>(*eligible)) {
            return std::nullopt;
        }
        return FieldValue{std::chrono::duration_cast<Duration>(
            std::get<Timestamp>(*start) - std::get<Timestamp>(*eligible))};
    }
    return std::nullopt;
}

std::string formatCell(const FieldValue &value, const Column &column)
{
    const char type = effectiveType(column);
    const int precision = column.spec.precision.value_or(kDefaultPrecision);

    switch (type) {
    case 'd':
        if (const auto *number = std::get_if<double>(&value)) {
            return fixed(*number, precision);
        }
        break;
    case 'f':
        if (const auto *number = std::get_if<std::int64_t>(&value)) {
            return fixed(static_cast<double>(*number), precision);
        }
        if (const auto *number = std::get_if<double>(&value)) {
            return fixed(*number, precision);
        }
        break;
    case 't':
    case 'm':
        if (const auto *duration = std::get_if<Duration>(&value)) {
            return clockText(*duration, type == 't');
        }
        break;
    case 'h':
        if (const auto *duration = std::get_if<Duration>(&value)) {
            return fixed(static_cast<double>(duration->count()) / 3600.0, precision);
        }
        break;
    case 'T':
        if (const auto *timestamp = std::get_if<Timestamp>(&value)) {
            return toIso8601Local(*timestamp);
        }
        break;
    case 'D':
        if (const auto *timestamp = std::get_if<Timestamp>(&value)) {
            return toDateLocal(*timestamp);
        }
        break;
    default:
        break;
    }
    return plainText(value);
}

std::string csvEscape(const std::string &text)
{
    if (text.find_first_of(",\"\r\n") == std::string::npos) {
        return text;
    }
    std::string escaped = "\"";
    for (char c : text) {
        if (c == '"') {
            escaped += '"';
        }
        escaped += c;
    }
    escaped += '"';
    return escaped;
}

RecordFormatter::RecordFormatter(OutputMode mode,
                                 std::vector<Column> columns,
                                 std::ostream &out,
                                 FormatterOptions options)
    : m_mode(mode)
    , m_columns(std::move(columns))
    , m_out(out)
    , m_options(options)
    , m_sums(m_columns.size())
{
    if (m_columns.empty()) {
        throw UnsupportedFormatSpecifierError("no output columns");
    }
    for (const auto &column : m_columns) {
        if (!typeFitsKind(effectiveType(column), column.field.kind)) {
            throw UnsupportedFormatSpecifierError(
                std::string("specifier '") + effectiveType(column) + "' does not apply to "
                + toFieldKindString(column.field.kind) + " column '" + column.label + "'");
        }
        const int width = column.spec.width.value_or(defaultWidth(column));
        m_widths.push_back(std::max(width, static_cast<int>(column.label.size())));
    }
}

void RecordFormatter::begin()
{
    if (m_begun) {
        return;
    }
    m_begun = true;

    switch (m_mode) {
    case OutputMode::Tabular:
        if (m_options.header) {
            std::vector<std::string> labels;
            std::vector<std::string> rules;
            for (size_t i = 0; i < m_columns.size(); ++i) {
                labels.push_back(m_columns[i].label);
                rules.push_back(std::string(static_cast<size_t>(m_widths[i]), '-'));
            }
            writeTabularLine(labels);
            writeTabularLine(rules);
        }
        break;
    case OutputMode::Csv:
        if (m_options.header) {
            for (size_t i = 0; i < m_columns.size(); ++i) {
                m_out << (i == 0 ? "" : ",") << csvEscape(m_columns[i].label);
            }
            m_out << "\n";
        }
        break;
    case OutputMode::Json:
        m_out << "{\"records\":[";
        break;
    case OutputMode::Long:
        break;
    }
}

void RecordFormatter::write(const Record &record)
{
    if (m_finished) {
        return;
    }
    begin();

    const auto values = valuesOf(record);
    if (m_options.average) {
        accumulate(values);
    }

    if (m_mode == OutputMode::Json) {
        nlohmann::ordered_json object = nlohmann::ordered_json::object();
        for (size_t i = 0; i < m_columns.size(); ++i) {
            object[m_columns[i].label] = jsonCell(values[i]);
        }
        m_out << (m_count == 0 ? "\n" : ",\n")
              << object.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
    } else {
        writeRow(values, record.jobId(), false);
    }
    ++m_count;
}

void RecordFormatter::finish()
{
    if (m_finished) {
        return;
    }
    begin();
    m_finished = true;

    const bool summary = m_options.average && m_count > 0;
    if (m_mode == OutputMode::Json) {
        m_out << (m_count == 0 ? "]" : "\n]") << ",\"count\":" << m_count;
        if (m_options.average) {
            nlohmann::ordered_json object = nlohmann::ordered_json::object();
            const auto means = averages();
            for (size_t i = 0; i < m_columns.size(); ++i) {
                if (isNumericKind(m_columns[i].field.kind)) {
                    object[m_columns[i].label] = jsonCell(means[i]);
                }
            }
            m_out << ",\"average\":" << object.dump();
        }
        m_out << "}\n";
    } else if (summary) {
        if (m_mode == OutputMode::Tabular) {
            std::vector<std::string> rules;
            for (int width : m_widths) {
                rules.push_back(std::string(static_cast<size_t>(width), '-'));
            }
            writeTabularLine(rules);
        }
        writeRow(averages(), "Average", true);
    }
    m_out.flush();

    JLOG_DEBUG(QStringLiteral("RecordFormatter"),
               QStringLiteral("finish"),
               QStringLiteral("output_finished"),
               QStringLiteral("query_output"),
               (nlohmann::json{{"mode", toOutputModeString(m_mode)},
                               {"records", m_count},
                               {"average", summary}}));
}

std::vector<std::optional<FieldValue>> RecordFormatter::valuesOf(const Record &record) const
{
    std::vector<std::optional<FieldValue>> values;
    values.reserve(m_columns.size());
    for (const auto &column : m_columns) {
        values.push_back(displayValue(record, column.field));
    }
    return values;
}

void RecordFormatter::writeRow(const std::vector<std::optional<FieldValue>> &values,
                               const std::string &title,
                               bool summary)
{
    std::vector<std::string> cells;
    cells.reserve(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        if (!values[i].has_value()) {
            cells.push_back(m_mode == OutputMode::Csv ? std::string() : std::string("-"));
        } else {
            cells.push_back(formatCell(*values[i], m_columns[i]));
        }
    }

    switch (m_mode) {
    case OutputMode::Tabular: {
        if (summary) {
            if (isNumericKind(m_columns.front().field.kind)) {
                m_out << title << "\n";
            } else {
                cells.front() = title;
            }
            for (size_t i = 0; i < cells.size(); ++i) {
                if (!isNumericKind(m_columns[i].field.kind) && cells[i] == "-") {
                    cells[i].clear();
                }
            }
        }
        writeTabularLine(cells, !summary);
        break;
    }
    case OutputMode::Csv:
        if (summary) {
            for (size_t i = 0; i < cells.size(); ++i) {
                if (!isNumericKind(m_columns[i].field.kind)) {
                    cells[i] = i == 0 ? title : std::string();
                }
            }
        }
        for (size_t i = 0; i < cells.size(); ++i) {
            m_out << (i == 0 ? "" : ",") << csvEscape(cells[i]);
        }
        m_out << "\n";
        break;
    case OutputMode::Long: {
        size_t labelWidth = 0;
        for (const auto &column : m_columns) {
            labelWidth = std::max(labelWidth, column.label.size());
        }
        m_out << title << "\n";
        for (size_t i = 0; i < cells.size(); ++i) {
            if (summary && !isNumericKind(m_columns[i].field.kind)) {
                continue;
            }
            m_out << "  " << std::left << std::setw(static_cast<int>(labelWidth))
                  << m_columns[i].label << std::right << " = " << cells[i] << "\n";
        }
        m_out << "\n";
        break;
    }
    case OutputMode::Json:
        break;
    }
}

void RecordFormatter::writeTabularLine(const std::vector<std::string> &cells, bool truncate)
{
    std::string line;
    for (size_t i = 0; i < cells.size(); ++i) {
        const size_t width = static_cast<size_t>(m_widths[i]);
        std::string cell = cells[i];
        const bool rightAlign = isNumericKind(m_columns[i].field.kind);
        if (truncate && !rightAlign && cell.size() > width) {
            cell.resize(width);
        }
        const std::string padding(cell.size() < width ? width - cell.size() : 0, ' ');
        if (i > 0) {
            line += ' ';
        }
        line += rightAlign ? padding + cell : cell + padding;
    }
    const auto end = line.find_last_not_of(' ');
    line.erase(end == std::string::npos ? 0 : end + 1);
    m_out << line << "\n";
}

void RecordFormatter::accumulate(const std::vector<std::optional<FieldValue>> &values)
{
    for (size_t i = 0; i < values.size(); ++i) {
        if (!values[i].has_value() || !isNumericKind(m_columns[i].field.kind)) {
            continue;
        }
        const FieldValue &value = *values[i];
        if (const auto *number = std::get_if<std::int64_t>(&value)) {
            m_sums[i].sum += static_cast<double>(*number);
        } else if (const auto *number = std::get_if<double>(&value)) {
            m_sums[i].sum += *number;
        } else if (const auto *duration = std::get_if<Duration>(&value)) {
            m_sums[i].sum += static_cast<double>(duration->count());
        } else {
            continue;
        }
        ++m_sums[i].count;
    }
}

std::vector<std::optional<FieldValue>> RecordFormatter::averages() const
{
    std::vector<std::optional<FieldValue>> means(m_columns.size());
    for (size_t i = 0; i < m_columns.size(); ++i) {
        if (m_sums[i].count == 0) {
            continue;
        }
        const double mean = m_sums[i].sum / static_cast<double>(m_sums[i].count);
        if (m_columns[i].field.kind == FieldKind::Duration) {
            means[i] = FieldValue{Duration{std::llround(mean)}};
        } else {
            means[i] = FieldValue{mean};
        }
    }
    return means;
}

} // namespace jobhist
