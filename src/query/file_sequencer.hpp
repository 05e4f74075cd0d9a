#pragma once

#include <cstddef>
#include <memory>
#include <optional>

#include <QDir>
#include <QString>

#include "common/models.hpp"
#include "query/record_source.hpp"
#include "query/stream_reader.hpp"

namespace jobhist {

// Daily accounting files are named after their date: YYYYMMDD.
QString logFileName(const QDate &date);

// The index-th file of the window, counting from the oldest day for Forward
// and from the newest for Reverse. nullopt past the last day. Existence is not
// checked here.
std::optional<LogFileRef> logFileAt(const QDir &root, const DateWindow &window, qint64 index);

// Chains one LogStreamReader per day. The current file is closed before the
// next one is opened, so a query never holds more than one descriptor.
class FileSequencer : public RecordSource {
public:
    FileSequencer(const QString &root, const DateWindow &window, ReaderOptions options = {});

    std::optional<Record> next() override;

    qint64 dayCount() const;
    qint64 filesStarted() const { return m_index; }
    bool hasOpenFile() const { return m_current && m_current->isOpen(); }
    std::size_t peakBufferedBytes() const;

private:
    void closeCurrent();

    QDir m_root;
    DateWindow m_window;
    ReaderOptions m_options;
    std::unique_ptr<LogStreamReader> m_current;
    qint64 m_index = 0;
    std::size_t m_peakBuffered = 0;
};

} // namespace jobhist
