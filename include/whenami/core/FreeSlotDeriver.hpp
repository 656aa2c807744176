#pragma once

#include <QTimeZone>
#include <QVector>
#include <optional>

#include "whenami/core/BusyInterval.hpp"
#include "whenami/core/Query.hpp"
#include "whenami/core/TimeRange.hpp"

namespace whenami {
namespace core {

class FreeSlotDeriver
{
public:
    // Splits bound into local days of zone and keeps, per day, the part allowed
    // by filter minus its mid-day break. No filter keeps whole days.
    static QVector<TimeRange> windows(const TimeRange &bound, const std::optional<HoursFilter> &filter,
                                      const QTimeZone &zone);

    // Busy intervals cut to the windows; contributors are carried along.
    static QVector<BusyInterval> clipBusy(const QVector<BusyInterval> &busy, const QVector<TimeRange> &windows);

    // Gaps inside the windows not covered by busy. busy must be merged.
    static QVector<FreeInterval> complement(const QVector<BusyInterval> &busy, const QVector<TimeRange> &windows);

    static QVector<FreeInterval> dropShorterThan(const QVector<FreeInterval> &free, int minDurationMinutes);

    static QVector<FreeInterval> deriveFree(const QVector<BusyInterval> &busy, const TimeRange &bound,
                                            const std::optional<HoursFilter> &filter, int minDurationMinutes,
                                            const QTimeZone &zone);

private:
    static QVector<TimeRange> dayWindows(const QDate &date, const TimeRange &day, const HoursFilter &filter,
                                         const QTimeZone &zone);
};

} // namespace core
} // namespace whenami
