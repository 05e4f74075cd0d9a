#include "query/record_model.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>

#include <QDateTime>

#include "common/diagnostics.hpp"
#include "common/errors.hpp"
#include "common/json_utils.hpp"

namespace jobhist {

Record::Record(RecordType type,
               std::string typeTag,
               Timestamp timestamp,
               std::string jobId,
               std::string shortJobId,
               FieldMap fields)
    : m_type(type)
    , m_typeTag(std::move(typeTag))
    , m_timestamp(timestamp)
    , m_jobId(std::move(jobId))
    , m_shortJobId(std::move(shortJobId))
    , m_fields(std::move(fields))
{
}

const FieldValue *Record::field(const std::string &name) const
{
    auto it = m_fields.find(name);
    if (it == m_fields.end()) {
        return nullptr;
    }
    return &it->second;
}

namespace {

std::string trim(const std::string &value)
{
    size_t start = 0;
    while (start < value.size()
           && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    size_t end = value.size();
    while (end > start
           && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(start, end - start);
}

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::optional<std::int64_t> parseUnsignedPart(const std::string &text)
{
    if (text.empty()) {
        return std::nullopt;
    }
    std::int64_t value = 0;
    const char *first = text.data();
    const char *last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || value < 0) {
        return std::nullopt;
    }
    return value;
}

double unitScale(const std::string &suffix, MemoryUnit defaultUnit)
{
    constexpr double kKiB = 1024.0;
    if (suffix.empty()) {
        switch (defaultUnit) {
        case MemoryUnit::Bytes:
            return 1.0;
        case MemoryUnit::Kilobytes:
            return kKiB;
        case MemoryUnit::Megabytes:
            return kKiB * kKiB;
        case MemoryUnit::Gigabytes:
            return kKiB * kKiB * kKiB;
        }
        return 1.0;
    }
    if (suffix == "b") {
        return 1.0;
    }
    if (suffix == "w") {
        return 8.0;
    }

    // Remaining suffixes are a scale letter, optionally followed by b or w.
    const char scale = suffix.front();
    const std::string unit = suffix.substr(1);
    if (unit.size() > 1 || (!unit.empty() && unit != "b" && unit != "w")) {
        return -1.0;
    }
    const double wordSize = unit == "w" ? 8.0 : 1.0;
    switch (scale) {
    case 'k':
        return wordSize * kKiB;
    case 'm':
        return wordSize * kKiB * kKiB;
    case 'g':
        return wordSize * kKiB * kKiB * kKiB;
    case 't':
        return wordSize * kKiB * kKiB * kKiB * kKiB;
    case 'p':
        return wordSize * kKiB * kKiB * kKiB * kKiB * kKiB;
    default:
        return -1.0;
    }
}

FieldValue typedOrRaw(FieldKind kind, const FieldValue &value)
{
    if (!std::holds_alternative<std::string>(value)) {
        return value;
    }
    auto coerced = coerceText(kind, std::get<std::string>(value));
    return coerced.has_value() ? *coerced : value;
}

} // namespace

std::optional<FieldSpec> resolveField(std::string_view name)
{
    if (name == "record_type" || name == "id" || name == "short_id") {
        return FieldSpec{std::string(name), std::string(name), FieldKind::Text,
                         FieldOrigin::Pseudo};
    }
    if (name == "timestamp") {
        return FieldSpec{std::string(name), std::string(name), FieldKind::Timestamp,
                         FieldOrigin::Pseudo};
    }

    const std::string_view logName = resolveAlias(name);
    const auto kind = coercionKindFor(logName);
    if (!kind.has_value()) {
        return std::nullopt;
    }
    return FieldSpec{std::string(name), std::string(logName), *kind, FieldOrigin::Logged};
}

std::optional<std::int64_t> parseInteger(const std::string &text)
{
    std::string value = trim(text);
    if (!value.empty() && value.front() == '+') {
        value.erase(0, 1);
    }
    if (value.empty()) {
        return std::nullopt;
    }
    std::int64_t result = 0;
    const char *last = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(value.data(), last, result);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return result;
}

std::optional<double> parseFloat(const std::string &text)
{
    std::string value = trim(text);
    if (!value.empty() && value.front() == '+') {
        value.erase(0, 1);
    }
    if (value.empty()) {
        return std::nullopt;
    }
    double result = 0.0;
    const char *last = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(value.data(), last, result);
    if (ec != std::errc() || ptr != last || !std::isfinite(result)) {
        return std::nullopt;
    }
    return result;
}

std::optional<Duration> parseDuration(const std::string &text)
{
    const std::string value = trim(text);
    if (value.empty()) {
        return std::nullopt;
    }

    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        const size_t colon = value.find(':', start);
        parts.push_back(value.substr(start, colon - start));
        if (colon == std::string::npos) {
            break;
        }
        start = colon + 1;
    }
    if (parts.size() > 3) {
        return std::nullopt;
    }

    std::vector<std::int64_t> numbers;
    for (const auto &part : parts) {
        auto number = parseUnsignedPart(part);
        if (!number.has_value()) {
            return std::nullopt;
        }
        numbers.push_back(*number);
    }

    // Leading component is unbounded (hours may exceed 24); the rest are base 60.
    for (size_t i = 1; i < numbers.size(); ++i) {
        if (numbers[i] >= 60) {
            return std::nullopt;
        }
    }

    std::int64_t seconds = 0;
    for (std::int64_t number : numbers) {
        if (seconds > (std::numeric_limits<std::int64_t>::max() - number) / 60) {
            return std::nullopt;
        }
        seconds = seconds * 60 + number;
    }
    return Duration{seconds};
}

std::optional<double> parseMemoryGiB(const std::string &text, MemoryUnit defaultUnit)
{
    const std::string value = toLower(trim(text));
    size_t suffixStart = value.size();
    while (suffixStart > 0
           && std::isalpha(static_cast<unsigned char>(value[suffixStart - 1]))) {
        --suffixStart;
    }

    const auto amount = parseFloat(value.substr(0, suffixStart));
    if (!amount.has_value() || *amount < 0.0) {
        return std::nullopt;
    }

    const double scale = unitScale(value.substr(suffixStart), defaultUnit);
    if (scale < 0.0) {
        return std::nullopt;
    }
    constexpr double kGiB = 1024.0 * 1024.0 * 1024.0;
    return *amount * scale / kGiB;
}

std::optional<Timestamp> parseLogTimestamp(const std::string &text)
{
    const QDateTime dt = QDateTime::fromString(QString::fromStdString(trim(text)),
                                               QStringLiteral("MM/dd/yyyy HH:mm:ss"));
    if (!dt.isValid()) {
        return std::nullopt;
    }
    return Timestamp{std::chrono::seconds{dt.toSecsSinceEpoch()}};
}

std::optional<Timestamp> parseEpochSeconds(const std::string &text)
{
    const auto seconds = parseInteger(text);
    if (!seconds.has_value() || *seconds < 0) {
        return std::nullopt;
    }
    return Timestamp{std::chrono::seconds{*seconds}};
}

std::optional<FieldValue> coerceText(FieldKind kind, const std::string &raw)
{
    switch (kind) {
    case FieldKind::Integer:
        if (auto value = parseInteger(raw)) {
            return FieldValue{*value};
        }
        return std::nullopt;
    case FieldKind::Float:
        if (auto value = parseFloat(raw)) {
            return FieldValue{*value};
        }
        return std::nullopt;
    case FieldKind::Duration:
        if (auto value = parseDuration(raw)) {
            return FieldValue{*value};
        }
        return std::nullopt;
    case FieldKind::Memory:
        if (auto value = parseMemoryGiB(raw, MemoryUnit::Bytes)) {
            return FieldValue{*value};
        }
        return std::nullopt;
    case FieldKind::Timestamp:
        if (auto value = parseEpochSeconds(raw)) {
            return FieldValue{*value};
        }
        return std::nullopt;
    case FieldKind::Text:
        return FieldValue{raw};
    }
    return std::nullopt;
}

FieldValue coerceValue(FieldKind kind, const FieldValue &value)
{
    if ((kind == FieldKind::Float || kind == FieldKind::Memory)
        && std::holds_alternative<std::int64_t>(value)) {
        return FieldValue{static_cast<double>(std::get<std::int64_t>(value))};
    }
    return typedOrRaw(kind, value);
}

std::string shortJobIdOf(const std::string &jobId)
{
    size_t end = 0;
    while (end < jobId.size() && std::isdigit(static_cast<unsigned char>(jobId[end]))) {
        ++end;
    }
    if (end == 0) {
        return jobId.substr(0, jobId.find('.'));
    }
    if (end < jobId.size() && jobId[end] == '[') {
        const size_t close = jobId.find(']', end);
        if (close != std::string::npos) {
            end = close + 1;
        }
    }
    return jobId.substr(0, end);
}

Record makeRecord(const std::string &typeTag,
                  const std::string &timestampText,
                  const std::string &jobId,
                  const RawFields &rawFields,
                  DiagnosticSink *diagnostics,
                  const Diagnostic &origin)
{
    const std::string tag = trim(typeTag);
    if (tag.empty()) {
        throw MalformedRecordError("missing record type");
    }

    const auto timestamp = parseLogTimestamp(timestampText);
    if (!timestamp.has_value()) {
        throw MalformedRecordError("unparseable timestamp '" + timestampText + "'");
    }

    const std::string id = trim(jobId);
    if (id.empty()) {
        throw MalformedRecordError("missing job id");
    }

    FieldMap fields;
    fields.reserve(rawFields.size());
    for (const auto &[key, raw] : rawFields) {
        const FieldKind kind = coercionKindFor(key).value_or(FieldKind::Text);
        auto coerced = coerceText(kind, raw);
        if (coerced.has_value()) {
            fields.insert_or_assign(key, std::move(*coerced));
            continue;
        }

        fields.insert_or_assign(key, FieldValue{raw});
        if (diagnostics) {
            Diagnostic diagnostic = origin;
            diagnostic.kind = DiagnosticKind::FieldCoercion;
            diagnostic.message = "job " + id + ": field '" + key + "' value '" + raw
                + "' is not a valid " + toFieldKindString(kind) + "; kept as text";
            diagnostics->report(diagnostic);
        }
    }

    return Record(parseRecordTypeTag(tag), tag, *timestamp, id, shortJobIdOf(id),
                  std::move(fields));
}

std::optional<FieldValue> lookupValue(const Record &record, const FieldSpec &spec)
{
    if (spec.origin == FieldOrigin::Pseudo) {
        if (spec.logName == "record_type") {
            return FieldValue{record.typeTag()};
        }
        if (spec.logName == "id") {
            return FieldValue{record.jobId()};
        }
        if (spec.logName == "short_id") {
            return FieldValue{record.shortJobId()};
        }
        if (spec.logName == "timestamp") {
            return FieldValue{record.timestamp()};
        }
        return std::nullopt;
    }
    if (spec.origin == FieldOrigin::Derived) {
        return std::nullopt;
    }

    const FieldValue *value = record.field(spec.logName);
    if (!value) {
        return std::nullopt;
    }
    return *value;
}

} // namespace jobhist
