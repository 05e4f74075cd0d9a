#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <vector>

#include <QString>

#include "common/models.hpp"
#include "query/formatter.hpp"
#include "query/stream_reader.hpp"

namespace jobhist {

class DiagnosticSink;

// Job end records, the ones carrying resource usage.
inline const std::set<RecordType> kDefaultRecordTypes{RecordType::Ended};

struct QueryRequest {
    QString logRoot;
    DateWindow window;
    std::string filter;
    // nullopt: the filter's record_type== clauses, else kDefaultRecordTypes.
    // An empty set means every record type.
    std::optional<std::set<RecordType>> recordTypes;
    // When non-empty, only records whose id or short id is listed.
    std::vector<std::string> jobIds;
    OutputMode mode = OutputMode::Tabular;
    std::vector<Column> columns;
    FormatterOptions formatOptions;
    std::size_t blockSize = kDefaultBlockSize;
};

struct QueryStats {
    std::size_t filesInWindow = 0;
    std::size_t recordsRead = 0;
    std::size_t recordsMatched = 0;
    std::size_t peakBufferedBytes = 0;
};

// Compiles the filter and validates the columns before anything is written,
// so setup errors (QueryError subclasses) leave `out` untouched. Explicit
// record types that share nothing with the filter's record_type== clauses are
// a FilterSyntaxError. Records are
// then pulled one at a time from the sequencer into the formatter.
QueryStats runQuery(const QueryRequest &request, std::ostream &out, DiagnosticSink &diagnostics);

} // namespace jobhist
