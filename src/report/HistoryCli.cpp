#include "report/HistoryCli.hpp"

#include <cstddef>
#include <iostream>
#include <optional>
#include <vector>

#include <QCommandLineOption>
#include <QCommandLineParser>

#include <nlohmann/json.hpp>

#include "common/diagnostics.hpp"
#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "config/query_config.hpp"
#include "query/formatter.hpp"
#include "query/query_runner.hpp"
#include "query/time_window.hpp"

namespace jobhist {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  jobhist [options] [jobid...]\n"
        "\n"
        "Date window (default: today):\n"
        "  --period A-B           explicit dates, YYYYMMDD or YYYY-MM-DD; one date for one day\n"
        "  --days N               N days before the anchor up to the anchor\n"
        "  --anchor DATE          last day of a --days window (default: today)\n"
        "  --reverse              newest records first\n"
        "\n"
        "Selection:\n"
        "  --user U, --queue Q, --account A\n"
        "  --filter EXPR          field op value; ...   ops: == != > >= < <= =~\n"
        "  --types LIST           record types, e.g. E or E,S or all\n"
        "                         (default: the filter's record_type, else E)\n"
        "\n"
        "Output:\n"
        "  --list FIELDS          columns, e.g. user,numcpus,elapsed:m,memory:.2f\n"
        "  --format table|long|csv|json, or --csv, --json, --long\n"
        "  --average              append the average of numeric columns\n"
        "  --no-header            omit the table or csv header\n"
        "\n"
        "Other:\n"
        "  --root DIR             accounting log directory\n"
        "  --block-size N         reverse read block size in bytes\n"
        "  --config PATH          JSON configuration file\n"
        "  --trace                write debug events to the event log\n");
}

void printError(const std::string &message)
{
    std::cerr << "jobhist: error: " << message << std::endl;
}

std::string quoteLiteral(const QString &value)
{
    std::string quoted = "\"";
    for (char c : value.toStdString()) {
        if (c == '"' || c == '\\') {
            quoted += '\\';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::optional<std::size_t> parseBlockSize(const QString &text)
{
    bool ok = false;
    const qulonglong value = text.toULongLong(&ok);
    if (!ok || value == 0) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(value);
}

} // namespace

std::set<RecordType> parseRecordTypeList(const QString &text)
{
    const QString value = text.trimmed();
    if (value.compare(QStringLiteral("all"), Qt::CaseInsensitive) == 0) {
        return {};
    }

    std::set<RecordType> types;
    for (const QChar c : value) {
        if (c == QLatin1Char(',') || c.isSpace()) {
            continue;
        }
        const std::string tag(1, c.toUpper().toLatin1());
        const RecordType type = parseRecordTypeTag(tag);
        if (type == RecordType::Unknown) {
            throw FilterSyntaxError("unknown record type '" + QString(c).toStdString() + "'");
        }
        types.insert(type);
    }
    if (types.empty()) {
        throw FilterSyntaxError("empty record type list");
    }
    return types;
}

std::string appendEqualityClause(const std::string &filter,
                                 const std::string &field,
                                 const QString &value)
{
    std::string clause = field + "==" + quoteLiteral(value);
    if (filter.empty()) {
        return clause;
    }
    return filter + ";" + clause;
}

HistoryCli::HistoryCli(QDate today)
    : m_today(today)
{
}

int HistoryCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }
    return run(args);
}

int HistoryCli::run(const QStringList &args)
{
    QCommandLineParser parser;
    parser.setSingleDashWordOptionMode(QCommandLineParser::ParseAsLongOptions);

    const QCommandLineOption helpOption({QStringLiteral("h"), QStringLiteral("help")},
                                        QStringLiteral("Show usage."));
    const QCommandLineOption rootOption(QStringLiteral("root"), QString(), QStringLiteral("dir"));
    const QCommandLineOption periodOption(QStringLiteral("period"), QString(),
                                          QStringLiteral("range"));
    const QCommandLineOption daysOption(QStringLiteral("days"), QString(), QStringLiteral("n"));
    const QCommandLineOption anchorOption(QStringLiteral("anchor"), QString(),
                                          QStringLiteral("date"));
    const QCommandLineOption userOption(QStringLiteral("user"), QString(), QStringLiteral("user"));
    const QCommandLineOption queueOption(QStringLiteral("queue"), QString(),
                                         QStringLiteral("queue"));
    const QCommandLineOption accountOption(QStringLiteral("account"), QString(),
                                           QStringLiteral("account"));
    const QCommandLineOption filterOption(QStringLiteral("filter"), QString(),
                                          QStringLiteral("expr"));
    const QCommandLineOption typesOption(QStringLiteral("types"), QString(),
                                         QStringLiteral("list"));
    const QCommandLineOption listOption(QStringLiteral("list"), QString(), QStringLiteral("fields"));
    const QCommandLineOption formatOption(QStringLiteral("format"), QString(),
                                          QStringLiteral("mode"));
    const QCommandLineOption csvOption(QStringLiteral("csv"));
    const QCommandLineOption jsonOption(QStringLiteral("json"));
    const QCommandLineOption longOption(QStringLiteral("long"));
    const QCommandLineOption averageOption(QStringLiteral("average"));
    const QCommandLineOption reverseOption(QStringLiteral("reverse"));
    const QCommandLineOption noHeaderOption(QStringLiteral("no-header"));
    const QCommandLineOption blockSizeOption(QStringLiteral("block-size"), QString(),
                                             QStringLiteral("bytes"));
    const QCommandLineOption configOption(QStringLiteral("config"), QString(),
                                          QStringLiteral("path"));
    const QCommandLineOption traceOption(QStringLiteral("trace"));

    parser.addOptions({helpOption, rootOption, periodOption, daysOption, anchorOption,
                       userOption, queueOption, accountOption, filterOption, typesOption,
                       listOption, formatOption, csvOption, jsonOption, longOption,
                       averageOption, reverseOption, noHeaderOption, blockSizeOption,
                       configOption, traceOption});
    parser.addPositionalArgument(QStringLiteral("jobid"), QString(), QStringLiteral("[jobid...]"));

    if (!parser.parse(args)) {
        printError(parser.errorText().toStdString());
        std::cerr << usageText().toStdString();
        return 1;
    }
    if (parser.isSet(helpOption)) {
        std::cout << usageText().toStdString();
        return 0;
    }

    QueryRequest request;
    try {
        const QueryConfig config = loadQueryConfig(parser.value(configOption));

        WindowIntent intent;
        intent.direction = parser.isSet(reverseOption) || config.reverse ? Direction::Reverse
                                                                          : Direction::Forward;
        if (parser.isSet(periodOption)) {
            if (parser.isSet(daysOption) || parser.isSet(anchorOption)) {
                throw InvalidWindowError("--period cannot be combined with --days or --anchor");
            }
            const auto range = parsePeriod(parser.value(periodOption));
            if (!range.has_value()) {
                throw InvalidWindowError("invalid period '"
                                         + parser.value(periodOption).toStdString() + "'");
            }
            intent.explicitRange = *range;
        } else {
            if (parser.isSet(anchorOption)) {
                const auto anchor = parseDate(parser.value(anchorOption));
                if (!anchor.has_value()) {
                    throw InvalidWindowError("invalid date '"
                                             + parser.value(anchorOption).toStdString() + "'");
                }
                intent.anchor = *anchor;
            }
            if (parser.isSet(daysOption)) {
                bool ok = false;
                const int days = parser.value(daysOption).toInt(&ok);
                if (!ok) {
                    throw InvalidWindowError("invalid day count '"
                                             + parser.value(daysOption).toStdString() + "'");
                }
                intent.daysBack = days;
            }
        }
        request.window = resolveWindow(intent, m_today);

        request.logRoot = parser.isSet(rootOption) ? parser.value(rootOption) : config.logRoot;

        request.mode = config.format;
        if (parser.isSet(formatOption)) {
            const auto mode = parseOutputMode(parser.value(formatOption).toLower().toStdString());
            if (!mode.has_value()) {
                printError("invalid format '" + parser.value(formatOption).toStdString()
                           + "'; use table, long, csv or json");
                return 1;
            }
            request.mode = *mode;
        } else if (parser.isSet(csvOption)) {
            request.mode = OutputMode::Csv;
        } else if (parser.isSet(jsonOption)) {
            request.mode = OutputMode::Json;
        } else if (parser.isSet(longOption)) {
            request.mode = OutputMode::Long;
        }

        const std::string fields = parser.isSet(listOption)
            ? parser.value(listOption).toStdString()
            : config.fieldsFor(request.mode);
        request.columns = parseColumnList(fields);
        request.formatOptions.header = !parser.isSet(noHeaderOption);
        request.formatOptions.average = parser.isSet(averageOption);

        std::string filter;
        if (parser.isSet(userOption)) {
            filter = appendEqualityClause(filter, "user", parser.value(userOption));
        }
        if (parser.isSet(queueOption)) {
            filter = appendEqualityClause(filter, "queue", parser.value(queueOption));
        }
        if (parser.isSet(accountOption)) {
            filter = appendEqualityClause(filter, "account", parser.value(accountOption));
        }
        if (parser.isSet(filterOption)) {
            const std::string expression = parser.value(filterOption).toStdString();
            filter = filter.empty() ? expression : filter + ";" + expression;
        }
        request.filter = filter;
        if (parser.isSet(typesOption)) {
            request.recordTypes = parseRecordTypeList(parser.value(typesOption));
        }

        for (const QString &jobId : parser.positionalArguments()) {
            request.jobIds.push_back(jobId.toStdString());
        }

        request.blockSize = config.blockSize;
        if (parser.isSet(blockSizeOption)) {
            const auto blockSize = parseBlockSize(parser.value(blockSizeOption));
            if (!blockSize.has_value()) {
                printError("invalid block size '" + parser.value(blockSizeOption).toStdString()
                           + "'");
                return 1;
            }
            request.blockSize = *blockSize;
        }
    } catch (const QueryError &error) {
        printError(error.what());
        return 1;
    }

    StreamDiagnosticSink diagnostics(std::cerr);
    try {
        const QueryStats stats = runQuery(request, std::cout, diagnostics);
        JLOG_INFO(QStringLiteral("HistoryCli"),
                  QStringLiteral("run"),
                  QStringLiteral("history_query"),
                  QStringLiteral("user_invocation"),
                  (nlohmann::json{{"matched", stats.recordsMatched},
                                  {"read", stats.recordsRead},
                                  {"warnings", diagnostics.count()}}));
    } catch (const QueryError &error) {
        printError(error.what());
        return 1;
    }
    return 0;
}

} // namespace jobhist
