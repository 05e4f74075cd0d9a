#pragma once

#include <optional>
#include <utility>

#include <QDate>
#include <QString>

#include "common/models.hpp"

namespace jobhist {

// What the caller asked for, before validation.
struct WindowIntent {
    std::optional<QDate> anchor;
    std::optional<int> daysBack;
    std::optional<std::pair<QDate, QDate>> explicitRange;
    Direction direction = Direction::Forward;
};

// An explicit range wins and is used as is. Otherwise the window ends on the
// anchor (today when unset) and starts daysBack days earlier:
// [anchor - daysBack, anchor], so daysBack = 0 is the anchor day alone.
// Throws InvalidWindowError for start > end, negative daysBack, invalid
// dates, or any date after today.
DateWindow resolveWindow(const WindowIntent &intent, const QDate &today);

// YYYYMMDD or YYYY-MM-DD.
std::optional<QDate> parseDate(const QString &text);

// "A-B" or a single date meaning one day. Either date form is accepted.
std::optional<std::pair<QDate, QDate>> parsePeriod(const QString &text);

} // namespace jobhist
