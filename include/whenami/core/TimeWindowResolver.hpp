#pragma once

#include <QDate>
#include <QDateTime>
#include <QTimeZone>
#include <QVector>
#include <optional>

#include "whenami/core/EngineError.hpp"
#include "whenami/core/Query.hpp"
#include "whenami/core/TimeRange.hpp"

namespace whenami {
namespace core {

struct DayBucket
{
    QDate date;
    TimeRange range;
};

struct TimeWindow
{
    TimeRange range;
    QVector<DayBucket> days;
    QTimeZone zone;
};

class TimeWindowResolver
{
public:
    explicit TimeWindowResolver(Qt::DayOfWeek weekStart = Qt::Monday, bool workDaysOnly = false);

    std::optional<TimeWindow> resolve(const DateSelector &selector, const QDateTime &referenceNow,
                                      const QTimeZone &zone, EngineError *error = nullptr) const;

    // DD/MM/YYYY, DD/MM/YY, DD-MM-YYYY, DD-MM-YY.
    static std::optional<QDate> parseDate(const QString &text);

private:
    TimeWindow buildWindow(const QDate &first, const QDate &last, const QTimeZone &zone) const;

    Qt::DayOfWeek m_weekStart = Qt::Monday;
    bool m_workDaysOnly = false;
};

} // namespace core
} // namespace whenami
