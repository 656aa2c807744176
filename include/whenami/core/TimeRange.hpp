#pragma once

#include <QDateTime>
#include <QDebug>
#include <QTimeZone>

namespace whenami {
namespace core {

// Half-open [start, end). Inside the core both ends are kept in UTC.
struct TimeRange
{
    QDateTime start;
    QDateTime end;

    TimeRange() = default;
    TimeRange(QDateTime rangeStart, QDateTime rangeEnd);

    bool isValid() const;
    bool isEmpty() const;
    bool overlaps(const TimeRange &other) const;
    bool touches(const TimeRange &other) const;
    TimeRange intersected(const TimeRange &other) const;
    qint64 durationSecs() const;

    TimeRange toUtc() const;
    TimeRange toTimeZone(const QTimeZone &zone) const;

    bool operator==(const TimeRange &other) const;
    bool operator!=(const TimeRange &other) const { return !(*this == other); }
};

// Local midnight of date in zone, as a UTC instant.
QDateTime startOfDay(const QDate &date, const QTimeZone &zone);

// [startOfDay(date), startOfDay(date + 1)) in zone.
TimeRange localDay(const QDate &date, const QTimeZone &zone);

} // namespace core
} // namespace whenami

QDebug operator<<(QDebug debug, const whenami::core::TimeRange &range);
