#pragma once

#include <cstddef>
#include <string>

#include <QString>

#include "common/enums.hpp"
#include "query/stream_reader.hpp"

namespace jobhist {

inline constexpr const char *kDefaultLogRoot = "/var/spool/pbs/server_priv/accounting";

struct QueryConfig {
    QString logRoot = QString::fromLatin1(kDefaultLogRoot);
    OutputMode format = OutputMode::Tabular;
    std::string tableFields =
        "short_id,user,queue,numnodes,numcpus,numgpus,memory:.1f,elapsed:m,status";
    std::string longFields =
        "id,type,user,account,queue,jobname,eligible,start,end,numnodes,numcpus,numgpus,"
        "reqmem:.2f,memory:.2f,walltime,elapsed,cputime,cpupercent,waittime,status,exec_host";
    std::string csvFields =
        "id,user,account,queue,jobname,start,end,numnodes,numcpus,numgpus,reqmem,memory,"
        "walltime,elapsed,waittime,status";
    std::size_t blockSize = kDefaultBlockSize;
    bool reverse = false;

    // Column list used for a mode; json shares the long list.
    const std::string &fieldsFor(OutputMode mode) const;
};

// Reads the JSON file at path, or $JOBHIST_CONFIG when path is empty, then
// applies $JOBHIST_LOG_ROOT. No file at all means built-in defaults.
// Throws ConfigError for an unreadable file, invalid JSON or a wrong-typed key.
QueryConfig loadQueryConfig(const QString &path = QString());

// Applies the keys of one JSON document on top of config.
void applyConfigJson(QueryConfig &config, const std::string &text, const QString &origin);

} // namespace jobhist
