#include "query/file_sequencer.hpp"

#include <algorithm>

namespace jobhist {

QString logFileName(const QDate &date)
{
    return date.toString(QStringLiteral("yyyyMMdd"));
}

std::optional<LogFileRef> logFileAt(const QDir &root, const DateWindow &window, qint64 index)
{
    if (!window.start.isValid() || !window.end.isValid() || window.start > window.end) {
        return std::nullopt;
    }
    if (index < 0 || index >= window.dayCount()) {
        return std::nullopt;
    }

    const QDate day = window.direction == Direction::Reverse
        ? window.end.addDays(-index)
        : window.start.addDays(index);
    return LogFileRef{root.filePath(logFileName(day)), day};
}

FileSequencer::FileSequencer(const QString &root, const DateWindow &window, ReaderOptions options)
    : m_root(root)
    , m_window(window)
    , m_options(std::move(options))
{
}

qint64 FileSequencer::dayCount() const
{
    if (!m_window.start.isValid() || !m_window.end.isValid() || m_window.start > m_window.end) {
        return 0;
    }
    return m_window.dayCount();
}

std::optional<Record> FileSequencer::next()
{
    while (true) {
        if (!m_current) {
            const auto file = logFileAt(m_root, m_window, m_index);
            if (!file.has_value()) {
                return std::nullopt;
            }
            m_current = std::make_unique<LogStreamReader>(*file, m_window.direction, m_options);
            ++m_index;
        }

        if (auto record = m_current->next()) {
            return record;
        }
        closeCurrent();
    }
}

std::size_t FileSequencer::peakBufferedBytes() const
{
    if (m_current) {
        return std::max(m_peakBuffered, m_current->peakBufferedBytes());
    }
    return m_peakBuffered;
}

void FileSequencer::closeCurrent()
{
    if (m_current) {
        m_peakBuffered = std::max(m_peakBuffered, m_current->peakBufferedBytes());
        m_current.reset();
    }
}

} // namespace jobhist
