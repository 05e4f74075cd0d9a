#include "query/query_runner.hpp"

#include <algorithm>
#include <iterator>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "query/file_sequencer.hpp"
#include "query/filter.hpp"

namespace jobhist {

namespace {

std::string typeTags(const std::set<RecordType> &types)
{
    std::string tags;
    for (RecordType type : types) {
        tags += toRecordTypeTag(type);
    }
    return tags;
}

std::set<RecordType> pushDownTypes(const std::optional<std::set<RecordType>> &requested,
                                   const std::optional<std::set<RecordType>> &fromFilter)
{
    const bool filterNamesTypes = fromFilter.has_value() && !fromFilter->empty();
    if (!requested.has_value()) {
        return filterNamesTypes ? *fromFilter : kDefaultRecordTypes;
    }
    if (requested->empty()) {
        return filterNamesTypes ? *fromFilter : std::set<RecordType>{};
    }
    if (!filterNamesTypes) {
        return *requested;
    }

    std::set<RecordType> both;
    std::set_intersection(requested->begin(), requested->end(), fromFilter->begin(),
                          fromFilter->end(), std::inserter(both, both.begin()));
    if (both.empty()) {
        throw FilterSyntaxError("record types '" + typeTags(*requested)
                                + "' share nothing with the filter's record_type '"
                                + typeTags(*fromFilter) + "'");
    }
    return both;
}

bool matchesJobIds(const Record &record, const std::vector<std::string> &jobIds)
{
    if (jobIds.empty()) {
        return true;
    }
    return std::any_of(jobIds.begin(), jobIds.end(), [&](const std::string &id) {
        return id == record.jobId() || id == record.shortJobId();
    });
}

nlohmann::json typesToJson(const std::set<RecordType> &types)
{
    nlohmann::json tags = nlohmann::json::array();
    for (RecordType type : types) {
        tags.push_back(toRecordTypeTag(type));
    }
    return tags;
}

} // namespace

QueryStats runQuery(const QueryRequest &request, std::ostream &out, DiagnosticSink &diagnostics)
{
    const FilterProgram filter = compileFilter(request.filter);
    RecordFormatter formatter(request.mode, request.columns, out, request.formatOptions);

    ReaderOptions options;
    options.blockSize = request.blockSize;
    options.recordTypes = pushDownTypes(request.recordTypes, filter.recordTypes());
    options.diagnostics = &diagnostics;

    FileSequencer sequencer(request.logRoot, request.window, options);

    QueryStats stats;
    stats.filesInWindow = static_cast<std::size_t>(sequencer.dayCount());

    JLOG_INFO(QStringLiteral("QueryRunner"),
              QStringLiteral("runQuery"),
              QStringLiteral("query_started"),
              QStringLiteral("user_invocation"),
              (nlohmann::json{{"root", request.logRoot.toStdString()},
                              {"start", request.window.start.toString(Qt::ISODate).toStdString()},
                              {"end", request.window.end.toString(Qt::ISODate).toStdString()},
                              {"reverse", request.window.direction == Direction::Reverse},
                              {"filter", request.filter},
                              {"types", typesToJson(options.recordTypes)},
                              {"mode", toOutputModeString(request.mode)}}));

    formatter.begin();
    while (auto record = sequencer.next()) {
        ++stats.recordsRead;
        if (!matchesJobIds(*record, request.jobIds) || !filter.matches(*record)) {
            continue;
        }
        formatter.write(*record);
        ++stats.recordsMatched;
    }
    formatter.finish();
    stats.peakBufferedBytes = sequencer.peakBufferedBytes();

    JLOG_INFO(QStringLiteral("QueryRunner"),
              QStringLiteral("runQuery"),
              QStringLiteral("query_finished"),
              QStringLiteral("user_invocation"),
              (nlohmann::json{{"files", stats.filesInWindow},
                              {"read", stats.recordsRead},
                              {"matched", stats.recordsMatched},
                              {"peakBufferedBytes", stats.peakBufferedBytes}}));
    return stats;
}

} // namespace jobhist
