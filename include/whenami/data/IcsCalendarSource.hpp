#pragma once

#include <QString>
#include <QTimeZone>
#include <optional>

#include "whenami/data/CalendarSource.hpp"

namespace whenami {
namespace data {

// Reads VEVENTs from a local iCalendar export.
class IcsCalendarSource : public CalendarSource
{
public:
    IcsCalendarSource(QString calendarId, QString filePath, QString calendarName = QString(),
                      QTimeZone nativeTimezone = QTimeZone());
    ~IcsCalendarSource() override = default;

    QString calendarId() const override;
    std::optional<CalendarSnapshot> fetch(const core::TimeRange &range,
                                          core::EngineError *error = nullptr) const override;

private:
    struct DateValue
    {
        QDateTime value;
        bool dateOnly = false;
    };

    // Nominal days (weeks folded in) plus exact seconds.
    struct Duration
    {
        int days = 0;
        qint64 secs = 0;
    };

    static QString decodeText(const QString &text);
    static DateValue parseDateTime(const QString &value, const QString &parameters, const QTimeZone &fallbackZone);
    static std::optional<Duration> parseDuration(const QString &value);
    static QString parameterValue(const QString &parameters, const QString &name);

    QString m_calendarId;
    QString m_filePath;
    QString m_calendarName;
    QTimeZone m_nativeTimezone;
};

} // namespace data
} // namespace whenami
