#include "whenami/core/EventNormalizer.hpp"

#include "whenami/core/Logging.hpp"

namespace whenami {
namespace core {

namespace {
QString describe(const data::SourceEvent &event)
{
    return event.title.isEmpty() ? event.id : event.title;
}
} // namespace

std::optional<BusyInterval> EventNormalizer::normalize(const data::SourceEvent &event, EngineError *error)
{
    if (!event.start.isValid()) {
        setError(error, ErrorCode::MalformedEvent,
                 QStringLiteral("Event '%1' has no valid start").arg(describe(event)));
        return std::nullopt;
    }

    BusyInterval interval;
    if (event.isAllDay) {
        if (!event.sourceTimezone.isValid()) {
            setError(error, ErrorCode::MalformedEvent,
                     QStringLiteral("All-day event '%1' has no valid source timezone").arg(describe(event)));
            return std::nullopt;
        }
        const QDate firstDay = event.start.date();
        QDate endDay = event.end.isValid() ? event.end.date() : firstDay.addDays(1);
        if (endDay < firstDay) {
            setError(error, ErrorCode::MalformedEvent,
                     QStringLiteral("All-day event '%1' ends before it starts").arg(describe(event)));
            return std::nullopt;
        }
        if (endDay == firstDay) {
            endDay = firstDay.addDays(1);
        }
        interval.range = TimeRange(startOfDay(firstDay, event.sourceTimezone),
                                   startOfDay(endDay, event.sourceTimezone));
    } else {
        if (!event.end.isValid()) {
            setError(error, ErrorCode::MalformedEvent,
                     QStringLiteral("Event '%1' has no valid end").arg(describe(event)));
            return std::nullopt;
        }
        const auto start = toUtcInstant(event.start, event.sourceTimezone);
        const auto end = toUtcInstant(event.end, event.sourceTimezone);
        if (!start || !end) {
            setError(error, ErrorCode::MalformedEvent,
                     QStringLiteral("Event '%1' has a floating time but no valid source timezone")
                         .arg(describe(event)));
            return std::nullopt;
        }
        if (*end < *start) {
            setError(error, ErrorCode::MalformedEvent,
                     QStringLiteral("Event '%1' ends before it starts (%2 < %3)")
                         .arg(describe(event), end->toString(Qt::ISODate), start->toString(Qt::ISODate)));
            return std::nullopt;
        }
        interval.range = TimeRange(*start, *end);
    }
    interval.contributors.push_back(event);
    return interval;
}

NormalizedCalendar EventNormalizer::normalizeCalendar(const data::CalendarSnapshot &snapshot)
{
    NormalizedCalendar result;
    result.intervals.reserve(snapshot.events.size());
    for (data::SourceEvent event : snapshot.events) {
        if (event.calendarId.isEmpty()) {
            event.calendarId = snapshot.calendarId;
        }
        if (event.calendarName.isEmpty()) {
            event.calendarName = snapshot.calendarName;
        }
        if (!event.sourceTimezone.isValid()) {
            event.sourceTimezone = snapshot.nativeTimezone;
        }

        EngineError error;
        auto interval = normalize(event, &error);
        if (!interval) {
            qCWarning(lcCore).noquote() << "Skipping event in calendar" << snapshot.calendarName << ':'
                                        << error.message;
            result.warnings.push_back(EventWarning{snapshot.calendarId, snapshot.calendarName, event.title,
                                                   error.message});
            continue;
        }
        result.intervals.push_back(std::move(*interval));
    }
    qCDebug(lcCore) << "Normalized" << result.intervals.size() << "busy periods from" << snapshot.calendarName;
    return result;
}

std::optional<QDateTime> EventNormalizer::toUtcInstant(const QDateTime &value, const QTimeZone &sourceZone)
{
    if (value.timeSpec() != Qt::LocalTime) {
        return value.toUTC();
    }
    if (!sourceZone.isValid()) {
        return std::nullopt;
    }
    return QDateTime(value.date(), value.time(), sourceZone).toUTC();
}

} // namespace core
} // namespace whenami
