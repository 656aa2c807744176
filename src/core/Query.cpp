#include "whenami/core/Query.hpp"

#include <QStringList>

namespace whenami {
namespace core {

DateSelector DateSelector::tomorrow()
{
    DateSelector selector;
    selector.kind = Kind::Tomorrow;
    return selector;
}

DateSelector DateSelector::nextWeek()
{
    DateSelector selector;
    selector.kind = Kind::NextWeek;
    return selector;
}

DateSelector DateSelector::nextTwoWeeks()
{
    DateSelector selector;
    selector.kind = Kind::NextTwoWeeks;
    return selector;
}

DateSelector DateSelector::date(const QString &text)
{
    DateSelector selector;
    selector.kind = Kind::Date;
    selector.first = text.trimmed();
    return selector;
}

DateSelector DateSelector::dateRange(const QString &first, const QString &last)
{
    DateSelector selector;
    selector.kind = Kind::DateRange;
    if (last.isEmpty() && first.contains(',')) {
        selector.first = first.section(',', 0, 0).trimmed();
        selector.last = first.section(',', 1).trimmed();
    } else {
        selector.first = first.trimmed();
        selector.last = last.trimmed();
    }
    return selector;
}

bool HoursFilter::hasBreak() const
{
    return breakStart.isValid() && breakEnd.isValid() && breakStart < breakEnd;
}

std::optional<HoursFilter> EngineSettings::filterFor(HoursPolicy policy) const
{
    switch (policy) {
    case HoursPolicy::Work:
        return workHours;
    case HoursPolicy::Personal:
        return personalHours;
    case HoursPolicy::All:
        break;
    }
    return std::nullopt;
}

QTime parseTimeOfDay(const QString &text)
{
    const QString trimmed = text.trimmed();
    QTime time = QTime::fromString(trimmed, QStringLiteral("HH:mm"));
    if (!time.isValid()) {
        time = QTime::fromString(trimmed, QStringLiteral("H:mm"));
    }
    return time;
}

std::optional<Qt::DayOfWeek> parseDayOfWeek(const QString &name)
{
    static const QStringList names = {
        QStringLiteral("monday"), QStringLiteral("tuesday"), QStringLiteral("wednesday"),
        QStringLiteral("thursday"), QStringLiteral("friday"), QStringLiteral("saturday"),
        QStringLiteral("sunday"),
    };
    const int index = names.indexOf(name.trimmed().toLower());
    if (index < 0) {
        return std::nullopt;
    }
    return static_cast<Qt::DayOfWeek>(index + 1);
}

} // namespace core
} // namespace whenami
