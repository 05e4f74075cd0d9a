#pragma once

#include <set>
#include <string>

#include <QDate>
#include <QString>
#include <QStringList>

#include "common/enums.hpp"

namespace jobhist {

class HistoryCli
{
public:
    explicit HistoryCli(QDate today = QDate::currentDate());

    // Parses arguments, runs one query and writes records to stdout and
    // warnings to stderr. returns exit code
    int run(int argc, char *argv[]);
    int run(const QStringList &args);

private:
    QDate m_today;
};

// "E", "E,S", "ESQ" or "all". Throws FilterSyntaxError for unknown tags.
std::set<RecordType> parseRecordTypeList(const QString &text);

// Adds a field==value clause, quoting the value, to a filter string.
std::string appendEqualityClause(const std::string &filter,
                                 const std::string &field,
                                 const QString &value);

} // namespace jobhist
