#pragma once

namespace jobhist {

// Accounting record kinds, keyed by the tag in the second column of a log line.
enum class RecordType {
    Queued,
    Started,
    Ended,
    Rerun,
    Deleted,
    Aborted,
    Checkpointed,
    Restarted,
    Moved,
    License,
    ReservationBegin,
    ReservationUnconfirmed,
    ReservationConfirmed,
    ReservationRemoved,
    Unknown
};

enum class FieldKind {
    Integer,
    Float,
    Duration,
    Memory,
    Timestamp,
    Text
};

enum class FieldOrigin {
    Logged,
    Pseudo,
    Derived
};

enum class Direction {
    Forward,
    Reverse
};

enum class OutputMode {
    Tabular,
    Long,
    Csv,
    Json
};

enum class FilterOp {
    Equal,
    NotEqual,
    Greater,
    GreaterEqual,
    Less,
    LessEqual,
    Contains
};

enum class DiagnosticKind {
    MissingFile,
    MalformedRecord,
    FieldCoercion
};

} // namespace jobhist
