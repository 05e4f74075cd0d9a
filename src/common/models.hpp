#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include <QDate>
#include <QString>

#include "common/enums.hpp"

namespace jobhist {

using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::seconds;

// Memory values are stored as Float in GiB.
using FieldValue = std::variant<std::int64_t, double, Duration, Timestamp, std::string>;
using FieldMap = std::unordered_map<std::string, FieldValue>;

// One decoded accounting event. Built once by makeRecord() and never modified.
class Record {
public:
    Record(RecordType type,
           std::string typeTag,
           Timestamp timestamp,
           std::string jobId,
           std::string shortJobId,
           FieldMap fields);

    RecordType type() const { return m_type; }
    const std::string &typeTag() const { return m_typeTag; }
    Timestamp timestamp() const { return m_timestamp; }
    const std::string &jobId() const { return m_jobId; }
    const std::string &shortJobId() const { return m_shortJobId; }

    // Lookup by the exact logged key. Returns nullptr when absent.
    const FieldValue *field(const std::string &name) const;
    const FieldMap &fields() const { return m_fields; }

private:
    RecordType m_type;
    std::string m_typeTag;
    Timestamp m_timestamp;
    std::string m_jobId;
    std::string m_shortJobId;
    FieldMap m_fields;
};

// A name a user may type in a filter or column list, resolved to what it reads.
struct FieldSpec {
    std::string name;
    std::string logName;
    FieldKind kind = FieldKind::Text;
    FieldOrigin origin = FieldOrigin::Logged;
};

struct LogFileRef {
    QString path;
    QDate date;
};

struct DateWindow {
    QDate start;
    QDate end;
    Direction direction = Direction::Forward;

    qint64 dayCount() const { return start.daysTo(end) + 1; }
};

struct FilterClause {
    FilterOp op = FilterOp::Equal;
    FieldSpec field;
    FieldValue literal;
};

struct Diagnostic {
    DiagnosticKind kind = DiagnosticKind::MalformedRecord;
    std::string message;
    std::string path;
    std::string date;
    // Line number for forward reads, byte offset for reverse reads, -1 if unknown.
    std::int64_t location = -1;
};

} // namespace jobhist
