#include "query/time_window.hpp"

#include <QRegularExpression>

#include "common/errors.hpp"

namespace jobhist {

namespace {

// Accounting logs carry epoch timestamps; no day before the epoch can exist.
const QDate kEarliestLogDate(1970, 1, 1);

std::string isoDate(const QDate &date)
{
    return date.toString(Qt::ISODate).toStdString();
}

} // namespace

DateWindow resolveWindow(const WindowIntent &intent, const QDate &today)
{
    DateWindow window;
    window.direction = intent.direction;

    if (intent.explicitRange.has_value()) {
        window.start = intent.explicitRange->first;
        window.end = intent.explicitRange->second;
    } else {
        const QDate anchor = intent.anchor.value_or(today);
        const int daysBack = intent.daysBack.value_or(0);
        if (daysBack < 0) {
            throw InvalidWindowError("day count must not be negative (got "
                                     + std::to_string(daysBack) + ")");
        }
        window.start = anchor.addDays(-daysBack);
        window.end = anchor;
    }

    if (!window.start.isValid() || !window.end.isValid()) {
        throw InvalidWindowError("invalid date in query window");
    }
    if (window.start > window.end) {
        throw InvalidWindowError("window start " + isoDate(window.start)
                                 + " is after window end " + isoDate(window.end));
    }
    if (window.start < kEarliestLogDate) {
        throw InvalidWindowError("window start " + isoDate(window.start)
                                 + " is before " + isoDate(kEarliestLogDate));
    }
    if (window.end > today) {
        throw InvalidWindowError("window end " + isoDate(window.end)
                                 + " is in the future (today is " + isoDate(today) + ")");
    }
    return window;
}

std::optional<QDate> parseDate(const QString &text)
{
    const QString value = text.trimmed();
    QDate date;
    if (value.size() == 8) {
        date = QDate::fromString(value, QStringLiteral("yyyyMMdd"));
    } else if (value.size() == 10) {
        date = QDate::fromString(value, QStringLiteral("yyyy-MM-dd"));
    }
    if (!date.isValid()) {
        return std::nullopt;
    }
    return date;
}

std::optional<std::pair<QDate, QDate>> parsePeriod(const QString &text)
{
    static const QRegularExpression pattern(
        QStringLiteral(R"(^\s*(\d{8}|\d{4}-\d{2}-\d{2})\s*(?:-\s*(\d{8}|\d{4}-\d{2}-\d{2})\s*)?$)"));

    const QRegularExpressionMatch match = pattern.match(text);
    if (!match.hasMatch()) {
        return std::nullopt;
    }

    const auto start = parseDate(match.captured(1));
    if (!start.has_value()) {
        return std::nullopt;
    }
    if (match.captured(2).isEmpty()) {
        return std::make_pair(*start, *start);
    }
    const auto end = parseDate(match.captured(2));
    if (!end.has_value()) {
        return std::nullopt;
    }
    return std::make_pair(*start, *end);
}

} // namespace jobhist
