#pragma once

#include <QString>
#include <QVector>
#include <optional>

#include "whenami/core/BusyInterval.hpp"
#include "whenami/core/EngineError.hpp"
#include "whenami/data/SourceEvent.hpp"

namespace whenami {
namespace core {

struct EventWarning
{
    QString calendarId;
    QString calendarName;
    QString eventTitle;
    QString message;
};

struct NormalizedCalendar
{
    QVector<BusyInterval> intervals;
    QVector<EventWarning> warnings;
};

class EventNormalizer
{
public:
    static std::optional<BusyInterval> normalize(const data::SourceEvent &event, EngineError *error = nullptr);

    // Malformed events are dropped and reported as warnings for their calendar.
    static NormalizedCalendar normalizeCalendar(const data::CalendarSnapshot &snapshot);

private:
    static std::optional<QDateTime> toUtcInstant(const QDateTime &value, const QTimeZone &sourceZone);
};

} // namespace core
} // namespace whenami
