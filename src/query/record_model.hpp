#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "common/models.hpp"

namespace jobhist {

class DiagnosticSink;

struct CoercionEntry {
    std::string_view name;
    FieldKind kind;
};

struct FieldAlias {
    std::string_view alias;
    std::string_view logName;
};

// Closed coercion table. Keys match the log exactly; anything not listed
// stays text.
inline constexpr std::array<CoercionEntry, 36> kCoercionTable{{
    {"Exit_status", FieldKind::Integer},
    {"run_count", FieldKind::Integer},
    {"session", FieldKind::Integer},
    {"Resource_List.ncpus", FieldKind::Integer},
    {"Resource_List.nodect", FieldKind::Integer},
    {"Resource_List.ngpus", FieldKind::Integer},
    {"Resource_List.mpiprocs", FieldKind::Integer},
    {"resources_used.ncpus", FieldKind::Integer},
    {"resources_used.cpupercent", FieldKind::Integer},
    {"resources_used.ngpus", FieldKind::Integer},
    {"Resource_List.walltime", FieldKind::Duration},
    {"resources_used.walltime", FieldKind::Duration},
    {"resources_used.cput", FieldKind::Duration},
    {"Resource_List.mem", FieldKind::Memory},
    {"resources_used.mem", FieldKind::Memory},
    {"resources_used.vmem", FieldKind::Memory},
    {"ctime", FieldKind::Timestamp},
    {"qtime", FieldKind::Timestamp},
    {"etime", FieldKind::Timestamp},
    {"start", FieldKind::Timestamp},
    {"end", FieldKind::Timestamp},
    {"user", FieldKind::Text},
    {"group", FieldKind::Text},
    {"account", FieldKind::Text},
    {"project", FieldKind::Text},
    {"jobname", FieldKind::Text},
    {"queue", FieldKind::Text},
    {"exec_host", FieldKind::Text},
    {"exec_vnode", FieldKind::Text},
    {"Resource_List.select", FieldKind::Text},
    {"Resource_List.place", FieldKind::Text},
    {"owner", FieldKind::Text},
    {"requestor", FieldKind::Text},
    {"resvname", FieldKind::Text},
    {"resvID", FieldKind::Text},
    {"message", FieldKind::Text},
}};

inline constexpr std::array<FieldAlias, 12> kFieldAliases{{
    {"numcpus", "Resource_List.ncpus"},
    {"numnodes", "Resource_List.nodect"},
    {"numgpus", "Resource_List.ngpus"},
    {"reqmem", "Resource_List.mem"},
    {"memory", "resources_used.mem"},
    {"walltime", "Resource_List.walltime"},
    {"elapsed", "resources_used.walltime"},
    {"cputime", "resources_used.cput"},
    {"cpupercent", "resources_used.cpupercent"},
    {"status", "Exit_status"},
    {"name", "jobname"},
    {"eligible", "etime"},
}};

constexpr std::optional<FieldKind> coercionKindFor(std::string_view name)
{
    for (const auto &entry : kCoercionTable) {
        if (entry.name == name) {
            return entry.kind;
        }
    }
    return std::nullopt;
}

constexpr std::string_view resolveAlias(std::string_view name)
{
    for (const auto &entry : kFieldAliases) {
        if (entry.alias == name) {
            return entry.logName;
        }
    }
    return name;
}

static_assert(coercionKindFor("resources_used.walltime") == FieldKind::Duration);
static_assert(resolveAlias("numcpus") == "Resource_List.ncpus");

// Resolves aliases, table entries and the pseudo fields record_type, id,
// short_id and timestamp. Returns nullopt for anything else.
std::optional<FieldSpec> resolveField(std::string_view name);

enum class MemoryUnit {
    Bytes,
    Kilobytes,
    Megabytes,
    Gigabytes
};

std::optional<std::int64_t> parseInteger(const std::string &text);
std::optional<double> parseFloat(const std::string &text);
// HH:MM:SS (hours may exceed 24), MM:SS, or plain seconds.
std::optional<Duration> parseDuration(const std::string &text);
// Value with optional b/kb/mb/gb/tb/pb suffix (w/kw words are 8 bytes), in GiB.
std::optional<double> parseMemoryGiB(const std::string &text, MemoryUnit defaultUnit);
// MM/DD/YYYY HH:MM:SS in local time.
std::optional<Timestamp> parseLogTimestamp(const std::string &text);
std::optional<Timestamp> parseEpochSeconds(const std::string &text);

// Coerces raw log text to the kind's variant alternative.
std::optional<FieldValue> coerceText(FieldKind kind, const std::string &raw);
// Idempotent: a value that already holds the kind's alternative is returned as is.
FieldValue coerceValue(FieldKind kind, const FieldValue &value);

std::string shortJobIdOf(const std::string &jobId);

using RawFields = std::vector<std::pair<std::string, std::string>>;

// Builds a Record from decoded columns. Throws MalformedRecordError when the
// timestamp, type tag or job id is missing or unparseable. Other fields that
// fail coercion stay raw text and are reported to diagnostics when given.
Record makeRecord(const std::string &typeTag,
                  const std::string &timestampText,
                  const std::string &jobId,
                  const RawFields &rawFields,
                  DiagnosticSink *diagnostics = nullptr,
                  const Diagnostic &origin = {});

// Value a resolved logged or pseudo field has on a record; nullopt if absent.
std::optional<FieldValue> lookupValue(const Record &record, const FieldSpec &spec);

} // namespace jobhist
