#include "whenami/data/InMemoryCalendarSource.hpp"

#include <QUuid>
#include <utility>

namespace whenami {
namespace data {

InMemoryCalendarSource::InMemoryCalendarSource(QString calendarId, QString calendarName, QTimeZone nativeTimezone)
    : m_calendarId(std::move(calendarId))
    , m_calendarName(std::move(calendarName))
    , m_nativeTimezone(std::move(nativeTimezone))
{
}

InMemoryCalendarSource::~InMemoryCalendarSource() = default;

QString InMemoryCalendarSource::calendarId() const
{
    return m_calendarId;
}

std::optional<CalendarSnapshot> InMemoryCalendarSource::fetch(const core::TimeRange &range,
                                                              core::EngineError *error) const
{
    Q_UNUSED(error);
    CalendarSnapshot snapshot;
    snapshot.calendarId = m_calendarId;
    snapshot.calendarName = m_calendarName;
    snapshot.nativeTimezone = m_nativeTimezone;
    for (const auto &event : m_events) {
        if (eventOverlaps(event, range)) {
            snapshot.events.push_back(event);
        }
    }
    return snapshot;
}

SourceEvent InMemoryCalendarSource::addEvent(SourceEvent event)
{
    if (event.id.isEmpty()) {
        event.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    }
    event.calendarId = m_calendarId;
    event.calendarName = m_calendarName;
    if (!event.sourceTimezone.isValid()) {
        event.sourceTimezone = m_nativeTimezone;
    }
    m_events.push_back(event);
    return event;
}

int InMemoryCalendarSource::eventCount() const
{
    return m_events.size();
}

} // namespace data
} // namespace whenami
