#include "whenami/core/TimeWindowResolver.hpp"

#include <QRegularExpression>

#include "whenami/core/Logging.hpp"

namespace whenami {
namespace core {

namespace {
constexpr int TWO_DIGIT_YEAR_PIVOT = 69;

bool isWorkDay(const QDate &date)
{
    return date.dayOfWeek() <= Qt::Friday;
}
} // namespace

TimeWindowResolver::TimeWindowResolver(Qt::DayOfWeek weekStart, bool workDaysOnly)
    : m_weekStart(weekStart)
    , m_workDaysOnly(workDaysOnly)
{
}

std::optional<TimeWindow> TimeWindowResolver::resolve(const DateSelector &selector, const QDateTime &referenceNow,
                                                      const QTimeZone &zone, EngineError *error) const
{
    if (!zone.isValid()) {
        setError(error, ErrorCode::InvalidTimezone, QStringLiteral("Invalid timezone for date resolution"));
        return std::nullopt;
    }
    const QDate today = referenceNow.toTimeZone(zone).date();

    switch (selector.kind) {
    case DateSelector::Kind::Today:
        return buildWindow(today, today, zone);
    case DateSelector::Kind::Tomorrow:
        return buildWindow(today.addDays(1), today.addDays(1), zone);
    case DateSelector::Kind::NextWeek: {
        int daysAhead = (static_cast<int>(m_weekStart) - today.dayOfWeek() + 7) % 7;
        if (daysAhead == 0) {
            daysAhead = 7;
        }
        const QDate first = today.addDays(daysAhead);
        return buildWindow(first, first.addDays(6), zone);
    }
    case DateSelector::Kind::NextTwoWeeks:
        return buildWindow(today, today.addDays(13), zone);
    case DateSelector::Kind::Date: {
        const auto date = parseDate(selector.first);
        if (!date) {
            setError(error, ErrorCode::InvalidDateFormat,
                     QStringLiteral("Invalid date format '%1'. Please use DD/MM/YYYY, DD-MM-YYYY, DD/MM/YY, or DD-MM-YY.")
                         .arg(selector.first));
            return std::nullopt;
        }
        return buildWindow(*date, *date, zone);
    }
    case DateSelector::Kind::DateRange: {
        const auto first = parseDate(selector.first);
        const auto last = parseDate(selector.last);
        if (!first || !last) {
            setError(error, ErrorCode::InvalidDateFormat,
                     QStringLiteral("Invalid date range format '%1,%2'. Please use 'DD/MM/YYYY,DD/MM/YYYY' or 'DD/MM/YY,DD/MM/YY'.")
                         .arg(selector.first, selector.last));
            return std::nullopt;
        }
        if (*last < *first) {
            setError(error, ErrorCode::InvalidRange,
                     QStringLiteral("Date range end %1 precedes start %2")
                         .arg(last->toString(Qt::ISODate), first->toString(Qt::ISODate)));
            return std::nullopt;
        }
        return buildWindow(*first, *last, zone);
    }
    }
    setError(error, ErrorCode::InvalidDateFormat, QStringLiteral("Unknown date selector"));
    return std::nullopt;
}

std::optional<QDate> TimeWindowResolver::parseDate(const QString &text)
{
    static const QRegularExpression pattern(QStringLiteral("^(\\d{1,2})[/-](\\d{1,2})[/-](\\d{4}|\\d{2})$"));
    const auto match = pattern.match(text.trimmed());
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    const int day = match.captured(1).toInt();
    const int month = match.captured(2).toInt();
    int year = match.captured(3).toInt();
    if (match.captured(3).size() == 2) {
        year += year < TWO_DIGIT_YEAR_PIVOT ? 2000 : 1900;
    }
    if (!QDate::isValid(year, month, day)) {
        return std::nullopt;
    }
    return QDate(year, month, day);
}

TimeWindow TimeWindowResolver::buildWindow(const QDate &first, const QDate &last, const QTimeZone &zone) const
{
    TimeWindow window;
    window.zone = zone;
    window.range = TimeRange(startOfDay(first, zone), startOfDay(last.addDays(1), zone));
    for (QDate date = first; date <= last; date = date.addDays(1)) {
        if (m_workDaysOnly && !isWorkDay(date)) {
            continue;
        }
        window.days.push_back(DayBucket{date, localDay(date, zone)});
    }
    qCDebug(lcCore) << "Resolved window" << window.range << "with" << window.days.size() << "day buckets in"
                    << zone.id();
    return window;
}

} // namespace core
} // namespace whenami
