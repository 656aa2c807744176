#pragma once

#include <QDateTime>
#include <QString>
#include <QTimeZone>
#include <QVector>

namespace whenami {
namespace data {

struct SourceEvent
{
    QString id;
    QString calendarId;
    QString calendarName;
    QString title;
    // Timed events: zone-aware instants. A Qt::LocalTime value is a floating
    // time in sourceTimezone. All-day events: only the dates count, end exclusive.
    QDateTime start;
    QDateTime end;
    QTimeZone sourceTimezone;
    bool isAllDay = false;

    bool sameEvent(const SourceEvent &other) const;
};

struct CalendarSnapshot
{
    QString calendarId;
    QString calendarName;
    QTimeZone nativeTimezone;
    QVector<SourceEvent> events;
};

} // namespace data
} // namespace whenami
