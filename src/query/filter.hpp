#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace jobhist {

// A conjunction of typed clauses. Evaluation only dispatches through the
// closed operator table; nothing from the filter text is executed.
class FilterProgram {
public:
    FilterProgram() = default;
    explicit FilterProgram(std::vector<FilterClause> clauses);

    bool matches(const Record &record) const;

    const std::vector<FilterClause> &clauses() const { return m_clauses; }
    bool empty() const { return m_clauses.empty(); }

    // Record types implied by record_type==X clauses, for push-down into the
    // readers. nullopt when no clause constrains the type; an empty set when
    // the clauses contradict each other.
    std::optional<std::set<RecordType>> recordTypes() const;

private:
    std::vector<FilterClause> m_clauses;
};

// "field op literal; field op literal; ..." with op one of == != > >= < <= =~.
// Throws UnknownFieldError, InvalidLiteralError or FilterSyntaxError.
FilterProgram compileFilter(const std::string &text);

bool evaluate(const Record &record, const FilterProgram &program);

// Coerces a literal typed by a user to the kind of the field it is compared
// with. Memory without a suffix is GiB; timestamps accept YYYY-MM-DD,
// YYYY-MM-DDTHH:MM:SS (local time) or epoch seconds.
std::optional<FieldValue> parseFilterLiteral(FieldKind kind, const std::string &text);

std::string toFilterOpSymbol(FilterOp op);

} // namespace jobhist
