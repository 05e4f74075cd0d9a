#include "query/stream_reader.hpp"

#include <algorithm>
#include <cctype>

#include <QFileInfo>

#include <nlohmann/json.hpp>

#include "common/diagnostics.hpp"
#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "query/line_decoder.hpp"

namespace jobhist {

namespace {

void stripLineEnding(std::string &text)
{
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
}

bool isBlank(std::string_view text)
{
    return std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isspace(c);
    });
}

std::string trim(std::string_view value)
{
    size_t start = 0;
    while (start < value.size()
           && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    size_t end = value.size();
    while (end > start
           && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return std::string(value.substr(start, end - start));
}

} // namespace

ForwardLineReader::ForwardLineReader(const QString &path)
    : m_file(path)
{
}

bool ForwardLineReader::open()
{
    m_lineNumber = 0;
    m_offset = 0;
    return m_file.open(QIODevice::ReadOnly);
}

std::optional<RawLine> ForwardLineReader::nextLine()
{
    while (m_file.isOpen() && !m_file.atEnd()) {
        const QByteArray bytes = m_file.readLine();
        if (bytes.isEmpty()) {
            return std::nullopt;
        }

        ++m_lineNumber;
        const std::int64_t offset = m_offset;
        m_offset += bytes.size();
        m_peakBuffered = std::max(m_peakBuffered, static_cast<std::size_t>(bytes.size()));

        std::string text(bytes.constData(), static_cast<size_t>(bytes.size()));
        stripLineEnding(text);
        if (isBlank(text)) {
            continue;
        }
        return RawLine{std::move(text), m_lineNumber, offset};
    }
    return std::nullopt;
}

void ForwardLineReader::close()
{
    m_file.close();
}

QString ForwardLineReader::errorString() const
{
    return m_file.errorString();
}

BackwardLineReader::BackwardLineReader(const QString &path, std::size_t blockSize)
    : m_file(path)
    , m_blockSize(std::max<std::size_t>(blockSize, 1))
{
}

bool BackwardLineReader::open()
{
    if (!m_file.open(QIODevice::ReadOnly | QIODevice::Unbuffered)) {
        return false;
    }
    m_pos = m_file.size();
    m_carry.clear();
    m_carryOffset = m_pos;
    m_pending.clear();
    return true;
}

std::optional<RawLine> BackwardLineReader::nextLine()
{
    while (m_file.isOpen()) {
        if (!m_pending.empty()) {
            RawLine line = std::move(m_pending.back());
            m_pending.pop_back();
            return line;
        }

        if (m_pos <= 0) {
            // Whatever is left in the carry is the first line of the file.
            std::string text = std::move(m_carry);
            m_carry.clear();
            stripLineEnding(text);
            if (isBlank(text)) {
                return std::nullopt;
            }
            return RawLine{std::move(text), -1, m_carryOffset};
        }

        if (!readBlock()) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

bool BackwardLineReader::readBlock()
{
    const qint64 readSize = std::min<qint64>(static_cast<qint64>(m_blockSize), m_pos);
    const qint64 start = m_pos - readSize;

    QByteArray block;
    if (m_file.seek(start)) {
        block = m_file.read(readSize);
    }
    if (block.size() != readSize) {
        JLOG_ERROR(QStringLiteral("BackwardLineReader"),
                   QStringLiteral("readBlock"),
                   QStringLiteral("block_read_failed"),
                   QStringLiteral("reverse_stream"),
                   (nlohmann::json{{"path", m_file.fileName().toStdString()},
                                   {"offset", start},
                                   {"size", readSize},
                                   {"error", m_file.errorString().toStdString()}}));
        m_pos = 0;
        m_carry.clear();
        return false;
    }
    m_pos = start;

    std::string buffer;
    buffer.reserve(static_cast<size_t>(readSize) + m_carry.size());
    buffer.append(block.constData(), static_cast<size_t>(block.size()));
    buffer.append(m_carry);
    m_carry.clear();
    m_peakBuffered = std::max(m_peakBuffered, buffer.size());

    const size_t firstNewline = buffer.find('\n');
    m_carryOffset = start;
    if (firstNewline == std::string::npos) {
        m_carry = std::move(buffer);
        return true;
    }
    m_carry = buffer.substr(0, firstNewline);

    // Every segment after a newline is complete: its end was either EOF or a
    // newline already seen in a later block.
    size_t lineStart = firstNewline + 1;
    while (lineStart < buffer.size()) {
        const size_t newline = buffer.find('\n', lineStart);
        const size_t lineEnd = newline == std::string::npos ? buffer.size() : newline;
        std::string text = buffer.substr(lineStart, lineEnd - lineStart);
        stripLineEnding(text);
        if (!isBlank(text)) {
            m_pending.push_back(RawLine{std::move(text), -1,
                                        start + static_cast<qint64>(lineStart)});
        }
        if (newline == std::string::npos) {
            break;
        }
        lineStart = newline + 1;
    }
    return true;
}

void BackwardLineReader::close()
{
    m_file.close();
    m_pending.clear();
    m_carry.clear();
}

QString BackwardLineReader::errorString() const
{
    return m_file.errorString();
}

LogStreamReader::LogStreamReader(LogFileRef file, Direction direction, ReaderOptions options)
    : m_file(std::move(file))
    , m_direction(direction)
    , m_options(std::move(options))
{
}

std::optional<Record> LogStreamReader::next()
{
    if (m_state == State::Exhausted) {
        return std::nullopt;
    }
    if (m_state == State::Pending && !openFile()) {
        m_state = State::Exhausted;
        return std::nullopt;
    }

    while (auto line = m_lines->nextLine()) {
        if (!acceptsTag(line->text)) {
            continue;
        }

        Diagnostic origin = diagnosticFor(DiagnosticKind::MalformedRecord, std::string());
        origin.location = m_direction == Direction::Forward ? line->lineNumber : line->offset;
        try {
            Record record = decodeRecord(line->text, m_options.diagnostics, origin);
            if (!m_options.recordTypes.empty()
                && !m_options.recordTypes.contains(record.type())) {
                continue;
            }
            ++m_recordsProduced;
            return record;
        } catch (const MalformedRecordError &error) {
            if (m_options.diagnostics) {
                origin.message = std::string("skipped malformed line: ") + error.what();
                m_options.diagnostics->report(origin);
            }
        }
    }

    finish();
    return std::nullopt;
}

std::size_t LogStreamReader::peakBufferedBytes() const
{
    if (m_lines) {
        return std::max(m_peakBuffered, m_lines->peakBufferedBytes());
    }
    return m_peakBuffered;
}

bool LogStreamReader::openFile()
{
    if (!QFileInfo::exists(m_file.path)) {
        if (m_options.diagnostics) {
            m_options.diagnostics->report(
                diagnosticFor(DiagnosticKind::MissingFile, "log file not found; day skipped"));
        }
        return false;
    }

    if (m_direction == Direction::Forward) {
        m_lines = std::make_unique<ForwardLineReader>(m_file.path);
    } else {
        m_lines = std::make_unique<BackwardLineReader>(m_file.path, m_options.blockSize);
    }

    if (!m_lines->open()) {
        if (m_options.diagnostics) {
            m_options.diagnostics->report(diagnosticFor(
                DiagnosticKind::MissingFile,
                "cannot open log file (" + m_lines->errorString().toStdString()
                    + "); day skipped"));
        }
        m_lines.reset();
        return false;
    }

    m_state = State::Open;
    JLOG_DEBUG(QStringLiteral("LogStreamReader"),
               QStringLiteral("openFile"),
               QStringLiteral("log_file_opened"),
               QStringLiteral("query_stream"),
               (nlohmann::json{{"path", m_file.path.toStdString()},
                               {"reverse", m_direction == Direction::Reverse}}));
    return true;
}

void LogStreamReader::finish()
{
    if (m_lines) {
        m_peakBuffered = std::max(m_peakBuffered, m_lines->peakBufferedBytes());
        m_lines->close();
        m_lines.reset();
    }
    m_state = State::Exhausted;
    JLOG_DEBUG(QStringLiteral("LogStreamReader"),
               QStringLiteral("finish"),
               QStringLiteral("log_file_closed"),
               QStringLiteral("query_stream"),
               (nlohmann::json{{"path", m_file.path.toStdString()},
                               {"records", m_recordsProduced}}));
}

bool LogStreamReader::acceptsTag(std::string_view line) const
{
    if (m_options.recordTypes.empty()) {
        return true;
    }
    const auto tag = peekTypeTag(line);
    if (!tag.has_value()) {
        // Let the decoder report it.
        return true;
    }
    return m_options.recordTypes.contains(parseRecordTypeTag(trim(*tag)));
}

Diagnostic LogStreamReader::diagnosticFor(DiagnosticKind kind, const std::string &message) const
{
    Diagnostic diagnostic;
    diagnostic.kind = kind;
    diagnostic.message = message;
    diagnostic.path = m_file.path.toStdString();
    diagnostic.date = m_file.date.toString(Qt::ISODate).toStdString();
    return diagnostic;
}

} // namespace jobhist
