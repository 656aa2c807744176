#pragma once

#include <QVector>

#include "whenami/data/CalendarSource.hpp"

namespace whenami {
namespace data {

class InMemoryCalendarSource : public CalendarSource
{
public:
    InMemoryCalendarSource(QString calendarId, QString calendarName, QTimeZone nativeTimezone);
    ~InMemoryCalendarSource() override;

    QString calendarId() const override;
    std::optional<CalendarSnapshot> fetch(const core::TimeRange &range,
                                          core::EngineError *error = nullptr) const override;

    SourceEvent addEvent(SourceEvent event);
    int eventCount() const;

private:
    QString m_calendarId;
    QString m_calendarName;
    QTimeZone m_nativeTimezone;
    QVector<SourceEvent> m_events;
};

} // namespace data
} // namespace whenami
