#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

#include <QDateTime>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace jobhist {

// Accounting logs are written in the server's local time; display follows suit.
inline std::string toIso8601Local(Timestamp timestamp)
{
    const qint64 seconds =
        std::chrono::duration_cast<std::chrono::seconds>(timestamp.time_since_epoch())
            .count();
    return QDateTime::fromSecsSinceEpoch(seconds)
        .toString(QStringLiteral("yyyy-MM-ddTHH:mm:ss"))
        .toStdString();
}

inline std::string toDateLocal(Timestamp timestamp)
{
    return toIso8601Local(timestamp).substr(0, 10);
}

inline std::string toRecordTypeTag(RecordType type)
{
    switch (type) {
    case RecordType::Queued:
        return "Q";
    case RecordType::Started:
        return "S";
    case RecordType::Ended:
        return "E";
    case RecordType::Rerun:
        return "R";
    case RecordType::Deleted:
        return "D";
    case RecordType::Aborted:
        return "A";
    case RecordType::Checkpointed:
        return "C";
    case RecordType::Restarted:
        return "T";
    case RecordType::Moved:
        return "M";
    case RecordType::License:
        return "L";
    case RecordType::ReservationBegin:
        return "B";
    case RecordType::ReservationUnconfirmed:
        return "U";
    case RecordType::ReservationConfirmed:
        return "Y";
    case RecordType::ReservationRemoved:
        return "K";
    case RecordType::Unknown:
        return "?";
    }
    return "?";
}

inline std::string toRecordTypeName(RecordType type)
{
    switch (type) {
    case RecordType::Queued:
        return "queued";
    case RecordType::Started:
        return "started";
    case RecordType::Ended:
        return "ended";
    case RecordType::Rerun:
        return "rerun";
    case RecordType::Deleted:
        return "deleted";
    case RecordType::Aborted:
        return "aborted";
    case RecordType::Checkpointed:
        return "checkpointed";
    case RecordType::Restarted:
        return "restarted";
    case RecordType::Moved:
        return "moved";
    case RecordType::License:
        return "license";
    case RecordType::ReservationBegin:
        return "reservation_begin";
    case RecordType::ReservationUnconfirmed:
        return "reservation_unconfirmed";
    case RecordType::ReservationConfirmed:
        return "reservation_confirmed";
    case RecordType::ReservationRemoved:
        return "reservation_removed";
    case RecordType::Unknown:
        return "unknown";
    }
    return "unknown";
}

inline RecordType parseRecordTypeTag(const std::string &tag)
{
    if (tag.size() != 1) {
        return RecordType::Unknown;
    }
    switch (tag.front()) {
    case 'Q':
        return RecordType::Queued;
    case 'S':
        return RecordType::Started;
    case 'E':
        return RecordType::Ended;
    case 'R':
        return RecordType::Rerun;
    case 'D':
        return RecordType::Deleted;
    case 'A':
        return RecordType::Aborted;
    case 'C':
        return RecordType::Checkpointed;
    case 'T':
        return RecordType::Restarted;
    case 'M':
        return RecordType::Moved;
    case 'L':
        return RecordType::License;
    case 'B':
        return RecordType::ReservationBegin;
    case 'U':
        return RecordType::ReservationUnconfirmed;
    case 'Y':
        return RecordType::ReservationConfirmed;
    case 'K':
        return RecordType::ReservationRemoved;
    default:
        return RecordType::Unknown;
    }
}

inline std::string toFieldKindString(FieldKind kind)
{
    switch (kind) {
    case FieldKind::Integer:
        return "integer";
    case FieldKind::Float:
        return "float";
    case FieldKind::Duration:
        return "duration";
    case FieldKind::Memory:
        return "memory";
    case FieldKind::Timestamp:
        return "timestamp";
    case FieldKind::Text:
        return "text";
    }
    return "text";
}

inline std::string toOutputModeString(OutputMode mode)
{
    switch (mode) {
    case OutputMode::Tabular:
        return "table";
    case OutputMode::Long:
        return "long";
    case OutputMode::Csv:
        return "csv";
    case OutputMode::Json:
        return "json";
    }
    return "table";
}

inline std::optional<OutputMode> parseOutputMode(const std::string &value)
{
    if (value == "table" || value == "tabular") {
        return OutputMode::Tabular;
    }
    if (value == "long") {
        return OutputMode::Long;
    }
    if (value == "csv") {
        return OutputMode::Csv;
    }
    if (value == "json") {
        return OutputMode::Json;
    }
    return std::nullopt;
}

// Durations serialize as whole seconds, timestamps as local ISO-8601.
inline nlohmann::ordered_json toJsonValue(const FieldValue &value)
{
    nlohmann::ordered_json j;
    std::visit([&j](const auto &v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Duration>) {
            j = v.count();
        } else if constexpr (std::is_same_v<T, Timestamp>) {
            j = toIso8601Local(v);
        } else {
            j = v;
        }
    }, value);
    return j;
}

} // namespace jobhist
