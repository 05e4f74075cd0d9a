#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <QFile>
#include <QString>

#include "common/models.hpp"
#include "query/record_source.hpp"

namespace jobhist {

class DiagnosticSink;

inline constexpr std::size_t kDefaultBlockSize = 64 * 1024;

struct RawLine {
    std::string text;
    // 1-based physical line number; only known when reading forward.
    std::int64_t lineNumber = -1;
    std::int64_t offset = -1;
};

// Non-blank lines of one file, without the line terminator.
class LineReader {
public:
    virtual ~LineReader() = default;

    virtual bool open() = 0;
    virtual std::optional<RawLine> nextLine() = 0;
    virtual void close() = 0;
    virtual QString errorString() const = 0;
    virtual std::size_t peakBufferedBytes() const = 0;
};

class ForwardLineReader : public LineReader {
public:
    explicit ForwardLineReader(const QString &path);

    bool open() override;
    std::optional<RawLine> nextLine() override;
    void close() override;
    QString errorString() const override;
    std::size_t peakBufferedBytes() const override { return m_peakBuffered; }

private:
    QFile m_file;
    std::int64_t m_lineNumber = 0;
    std::int64_t m_offset = 0;
    std::size_t m_peakBuffered = 0;
};

// Reads fixed-size blocks from the end of the file towards the start. The
// part of a block before its first newline may continue in the previous
// block, so it is carried over and prepended to the next read.
class BackwardLineReader : public LineReader {
public:
    BackwardLineReader(const QString &path, std::size_t blockSize);

    bool open() override;
    std::optional<RawLine> nextLine() override;
    void close() override;
    QString errorString() const override;
    std::size_t peakBufferedBytes() const override { return m_peakBuffered; }

private:
    bool readBlock();

    QFile m_file;
    std::size_t m_blockSize;
    qint64 m_pos = 0;
    std::string m_carry;
    qint64 m_carryOffset = 0;
    // Complete lines of the current block, oldest first; consumed from the back.
    std::vector<RawLine> m_pending;
    std::size_t m_peakBuffered = 0;
};

struct ReaderOptions {
    std::size_t blockSize = kDefaultBlockSize;
    // Empty means every record type. Lines with other tags are skipped
    // before they are decoded.
    std::set<RecordType> recordTypes;
    DiagnosticSink *diagnostics = nullptr;
};

// Records of one daily log file. The file is opened on the first next() call
// and closed as soon as it is exhausted or the reader is destroyed. A missing
// file yields one MissingFile diagnostic and an empty sequence; malformed
// lines are reported and skipped.
class LogStreamReader : public RecordSource {
public:
    LogStreamReader(LogFileRef file, Direction direction, ReaderOptions options = {});

    std::optional<Record> next() override;

    bool isOpen() const { return m_state == State::Open; }
    std::size_t peakBufferedBytes() const;
    std::size_t recordsProduced() const { return m_recordsProduced; }

private:
    enum class State {
        Pending,
        Open,
        Exhausted
    };

    bool openFile();
    void finish();
    bool acceptsTag(std::string_view line) const;
    Diagnostic diagnosticFor(DiagnosticKind kind, const std::string &message) const;

    LogFileRef m_file;
    Direction m_direction;
    ReaderOptions m_options;
    std::unique_ptr<LineReader> m_lines;
    State m_state = State::Pending;
    std::size_t m_peakBuffered = 0;
    std::size_t m_recordsProduced = 0;
};

} // namespace jobhist
