#include "whenami/core/TimeRange.hpp"

#include <algorithm>
#include <utility>

namespace whenami {
namespace core {

TimeRange::TimeRange(QDateTime rangeStart, QDateTime rangeEnd)
    : start(std::move(rangeStart))
    , end(std::move(rangeEnd))
{
}

bool TimeRange::isValid() const
{
    return start.isValid() && end.isValid() && start <= end;
}

bool TimeRange::isEmpty() const
{
    return !isValid() || start == end;
}

bool TimeRange::overlaps(const TimeRange &other) const
{
    return start < other.end && other.start < end;
}

bool TimeRange::touches(const TimeRange &other) const
{
    return end == other.start || other.end == start;
}

TimeRange TimeRange::intersected(const TimeRange &other) const
{
    const QDateTime from = std::max(start, other.start);
    const QDateTime to = std::min(end, other.end);
    if (to < from) {
        return TimeRange(from, from);
    }
    return TimeRange(from, to);
}

qint64 TimeRange::durationSecs() const
{
    if (!isValid()) {
        return 0;
    }
    return start.secsTo(end);
}

TimeRange TimeRange::toUtc() const
{
    return TimeRange(start.toUTC(), end.toUTC());
}

TimeRange TimeRange::toTimeZone(const QTimeZone &zone) const
{
    return TimeRange(start.toTimeZone(zone), end.toTimeZone(zone));
}

bool TimeRange::operator==(const TimeRange &other) const
{
    return start == other.start && end == other.end;
}

QDateTime startOfDay(const QDate &date, const QTimeZone &zone)
{
    return date.startOfDay(zone).toUTC();
}

TimeRange localDay(const QDate &date, const QTimeZone &zone)
{
    return TimeRange(startOfDay(date, zone), startOfDay(date.addDays(1), zone));
}

} // namespace core
} // namespace whenami

QDebug operator<<(QDebug debug, const whenami::core::TimeRange &range)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << "TimeRange(" << range.start.toString(Qt::ISODate) << ", "
                    << range.end.toString(Qt::ISODate) << ')';
    return debug;
}
