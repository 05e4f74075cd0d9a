#include "query/filter.hpp"

#include <array>
#include <cctype>
#include <string_view>

#include <QDateTime>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "query/record_model.hpp"

namespace jobhist {

namespace {

std::string trim(std::string_view value)
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
    return std::string(value.substr(start, end - start));
}

// Three-way comparison of a record value with a literal of the same kind.
// nullopt when the alternatives cannot be compared, e.g. a value that was
// kept as raw text because it failed coercion.
std::optional<int> compareValues(const FieldValue &value, const FieldValue &literal)
{
    auto order = [](const auto &a, const auto &b) {
        if (a < b) {
            return -1;
        }
        return b < a ? 1 : 0;
    };

    if (value.index() == literal.index()) {
        return std::visit(
            [&](const auto &a) -> int {
                using T = std::decay_t<decltype(a)>;
                return order(a, std::get<T>(literal));
            },
            value);
    }

    // Integer and float only mix when a Float field logged a whole number.
    const bool valueNumeric = std::holds_alternative<std::int64_t>(value)
        || std::holds_alternative<double>(value);
    const bool literalNumeric = std::holds_alternative<std::int64_t>(literal)
        || std::holds_alternative<double>(literal);
    if (valueNumeric && literalNumeric) {
        auto asDouble = [](const FieldValue &v) {
            if (const auto *i = std::get_if<std::int64_t>(&v)) {
                return static_cast<double>(*i);
            }
            return std::get<double>(v);
        };
        return order(asDouble(value), asDouble(literal));
    }
    return std::nullopt;
}

bool testEqual(const FieldValue &value, const FieldValue &literal)
{
    const auto ordering = compareValues(value, literal);
    return ordering.has_value() && *ordering == 0;
}

bool testNotEqual(const FieldValue &value, const FieldValue &literal)
{
    const auto ordering = compareValues(value, literal);
    return ordering.has_value() && *ordering != 0;
}

bool testGreater(const FieldValue &value, const FieldValue &literal)
{
    const auto ordering = compareValues(value, literal);
    return ordering.has_value() && *ordering > 0;
}

bool testGreaterEqual(const FieldValue &value, const FieldValue &literal)
{
    const auto ordering = compareValues(value, literal);
    return ordering.has_value() && *ordering >= 0;
}

bool testLess(const FieldValue &value, const FieldValue &literal)
{
    const auto ordering = compareValues(value, literal);
    return ordering.has_value() && *ordering < 0;
}

bool testLessEqual(const FieldValue &value, const FieldValue &literal)
{
    const auto ordering = compareValues(value, literal);
    return ordering.has_value() && *ordering <= 0;
}

bool testContains(const FieldValue &value, const FieldValue &literal)
{
    const auto *text = std::get_if<std::string>(&value);
    const auto *needle = std::get_if<std::string>(&literal);
    return text && needle && text->find(*needle) != std::string::npos;
}

struct OperatorEntry {
    std::string_view symbol;
    FilterOp op;
    bool (*test)(const FieldValue &, const FieldValue &);
};

// Two-character symbols come first so ">=" is never read as ">".
constexpr std::array<OperatorEntry, 7> kOperators{{
    {"==", FilterOp::Equal, &testEqual},
    {"!=", FilterOp::NotEqual, &testNotEqual},
    {">=", FilterOp::GreaterEqual, &testGreaterEqual},
    {"<=", FilterOp::LessEqual, &testLessEqual},
    {"=~", FilterOp::Contains, &testContains},
    {">", FilterOp::Greater, &testGreater},
    {"<", FilterOp::Less, &testLess},
}};

const OperatorEntry &operatorFor(FilterOp op)
{
    for (const auto &entry : kOperators) {
        if (entry.op == op) {
            return entry;
        }
    }
    return kOperators.front();
}

// Splits on ';' outside double quotes.
std::vector<std::string> splitClauses(const std::string &text)
{
    std::vector<std::string> clauses;
    std::string current;
    bool inQuotes = false;
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '\\' && inQuotes && i + 1 < text.size()) {
            current.push_back(c);
            current.push_back(text[++i]);
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
        }
        if (c == ';' && !inQuotes) {
            clauses.push_back(current);
            current.clear();
            continue;
        }
        current.push_back(c);
    }
    if (inQuotes) {
        throw FilterSyntaxError("unterminated quote in filter '" + text + "'");
    }
    clauses.push_back(current);
    return clauses;
}

std::string unquote(const std::string &literal, bool &quoted)
{
    quoted = literal.size() >= 2 && literal.front() == '"' && literal.back() == '"';
    if (!quoted) {
        return literal;
    }
    std::string value;
    for (size_t i = 1; i + 1 < literal.size(); ++i) {
        if (literal[i] == '\\' && i + 2 < literal.size()) {
            ++i;
        }
        value.push_back(literal[i]);
    }
    return value;
}

FilterClause compileClause(const std::string &clause)
{
    size_t opPos = std::string::npos;
    const OperatorEntry *found = nullptr;
    for (size_t i = 0; i < clause.size() && !found; ++i) {
        if (clause[i] == '"') {
            break;
        }
        for (const auto &entry : kOperators) {
            if (clause.compare(i, entry.symbol.size(), entry.symbol) == 0) {
                opPos = i;
                found = &entry;
                break;
            }
        }
    }
    if (!found) {
        throw FilterSyntaxError("no comparison operator in clause '" + clause + "'");
    }

    const std::string name = trim(std::string_view(clause).substr(0, opPos));
    if (name.empty()) {
        throw FilterSyntaxError("missing field name in clause '" + clause + "'");
    }
    const auto spec = resolveField(name);
    if (!spec.has_value()) {
        throw UnknownFieldError(name);
    }
    if (found->op == FilterOp::Contains && spec->kind != FieldKind::Text) {
        throw FilterSyntaxError("'=~' needs a text field, '" + name + "' is "
                                + toFieldKindString(spec->kind));
    }

    bool quoted = false;
    const std::string literalText =
        unquote(trim(std::string_view(clause).substr(opPos + found->symbol.size())), quoted);
    if (literalText.empty() && !quoted) {
        throw FilterSyntaxError("missing value in clause '" + clause + "'");
    }

    auto literal = parseFilterLiteral(spec->kind, literalText);
    if (!literal.has_value()) {
        throw InvalidLiteralError("'" + literalText + "' is not a valid "
                                  + toFieldKindString(spec->kind) + " for field '" + name
                                  + "'");
    }
    return FilterClause{found->op, *spec, std::move(*literal)};
}

std::optional<Timestamp> parseTimestampLiteral(const std::string &text)
{
    const QString value = QString::fromStdString(text);
    QDateTime dt;
    if (text.size() == 10) {
        dt = QDateTime(QDate::fromString(value, QStringLiteral("yyyy-MM-dd")), QTime(0, 0));
    } else if (text.size() == 19) {
        dt = QDateTime::fromString(value, QStringLiteral("yyyy-MM-ddTHH:mm:ss"));
    }
    if (dt.isValid()) {
        return Timestamp{std::chrono::seconds{dt.toSecsSinceEpoch()}};
    }
    return parseEpochSeconds(text);
}

} // namespace

FilterProgram::FilterProgram(std::vector<FilterClause> clauses)
    : m_clauses(std::move(clauses))
{
}

bool FilterProgram::matches(const Record &record) const
{
    for (const auto &clause : m_clauses) {
        const auto value = lookupValue(record, clause.field);
        if (!value.has_value()) {
            return false;
        }
        if (!operatorFor(clause.op).test(*value, clause.literal)) {
            return false;
        }
    }
    return true;
}

std::optional<std::set<RecordType>> FilterProgram::recordTypes() const
{
    std::optional<std::set<RecordType>> types;
    for (const auto &clause : m_clauses) {
        if (clause.field.origin != FieldOrigin::Pseudo || clause.field.logName != "record_type"
            || clause.op != FilterOp::Equal) {
            continue;
        }
        const RecordType type = parseRecordTypeTag(std::get<std::string>(clause.literal));
        if (!types.has_value()) {
            types = std::set<RecordType>{type};
        } else if (!types->contains(type)) {
            types->clear();
        }
    }
    return types;
}

FilterProgram compileFilter(const std::string &text)
{
    std::vector<FilterClause> clauses;
    for (const auto &part : splitClauses(text)) {
        const std::string clause = trim(part);
        if (clause.empty()) {
            continue;
        }
        clauses.push_back(compileClause(clause));
    }

    nlohmann::json described = nlohmann::json::array();
    for (const auto &clause : clauses) {
        described.push_back(std::string(clause.field.logName) + toFilterOpSymbol(clause.op));
    }

    JLOG_DEBUG(QStringLiteral("filter"),
               QStringLiteral("compileFilter"),
               QStringLiteral("filter_compiled"),
               QStringLiteral("query_setup"),
               (nlohmann::json{{"filter", text}, {"clauses", described}}));
    return FilterProgram(std::move(clauses));
}

bool evaluate(const Record &record, const FilterProgram &program)
{
    return program.matches(record);
}

std::optional<FieldValue> parseFilterLiteral(FieldKind kind, const std::string &text)
{
    switch (kind) {
    case FieldKind::Memory:
        if (auto value = parseMemoryGiB(text, MemoryUnit::Gigabytes)) {
            return FieldValue{*value};
        }
        return std::nullopt;
    case FieldKind::Timestamp:
        if (auto value = parseTimestampLiteral(trim(text))) {
            return FieldValue{*value};
        }
        return std::nullopt;
    default:
        return coerceText(kind, text);
    }
}

std::string toFilterOpSymbol(FilterOp op)
{
    return std::string(operatorFor(op).symbol);
}

} // namespace jobhist
