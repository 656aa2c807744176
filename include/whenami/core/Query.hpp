#pragma once

#include <QString>
#include <QTime>
#include <QTimeZone>
#include <optional>

namespace whenami {
namespace core {

struct DateSelector
{
    enum class Kind
    {
        Today,
        Tomorrow,
        NextWeek,
        NextTwoWeeks,
        Date,
        DateRange,
    };

    Kind kind = Kind::Today;
    QString first;
    QString last;

    static DateSelector today() { return DateSelector{}; }
    static DateSelector tomorrow();
    static DateSelector nextWeek();
    static DateSelector nextTwoWeeks();
    static DateSelector date(const QString &text);
    // Accepts either two arguments or "first,last" in first.
    static DateSelector dateRange(const QString &first, const QString &last = QString());
};

enum class HoursPolicy
{
    Work,
    Personal,
    All,
};

// Local time-of-day window. end <= start wraps past midnight.
struct HoursFilter
{
    QTime start;
    QTime end;
    QTime breakStart;
    QTime breakEnd;

    bool hasBreak() const;
};

enum class OutputMode
{
    Free,
    Busy,
    Both,
    BothSplit,
};

struct Query
{
    DateSelector dateSelector;
    HoursPolicy hoursPolicy = HoursPolicy::Personal;
    OutputMode outputMode = OutputMode::Both;
    bool showEventNames = false;
    bool workDaysOnly = false;
    std::optional<QTimeZone> outputTimezone;

    bool wantsBusy() const { return outputMode != OutputMode::Free; }
    bool wantsFree() const { return outputMode != OutputMode::Busy; }
};

struct EngineSettings
{
    HoursFilter workHours{QTime(9, 0), QTime(17, 0), QTime(), QTime()};
    HoursFilter personalHours{QTime(8, 0), QTime(22, 0), QTime(), QTime()};
    int minimumSlotMinutes = 30;
    Qt::DayOfWeek weekStart = Qt::Monday;

    std::optional<HoursFilter> filterFor(HoursPolicy policy) const;
};

// "HH:mm" or "H:mm"; invalid QTime on failure.
QTime parseTimeOfDay(const QString &text);
std::optional<Qt::DayOfWeek> parseDayOfWeek(const QString &name);

} // namespace core
} // namespace whenami
