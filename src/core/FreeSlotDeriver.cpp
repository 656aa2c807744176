#include "whenami/core/FreeSlotDeriver.hpp"

#include <algorithm>
#include <iterator>

namespace whenami {
namespace core {

namespace {
// A local time skipped by a DST gap maps to the transition that skips it.
QDateTime atLocalTime(const QDate &date, const QTime &time, const QTimeZone &zone)
{
    const QDateTime local(date, time, zone);
    if (local.isValid() && local.time() == time) {
        return local.toUTC();
    }
    const QTimeZone::OffsetData transition =
        zone.nextTransition(QDateTime(date, time, Qt::UTC).addDays(-1));
    if (transition.atUtc.isValid()) {
        return transition.atUtc.toUTC();
    }
    return local.toUTC();
}

void appendIfNotEmpty(QVector<TimeRange> &ranges, const TimeRange &range)
{
    if (!range.isEmpty()) {
        ranges.push_back(range);
    }
}
} // namespace

QVector<TimeRange> FreeSlotDeriver::windows(const TimeRange &bound, const std::optional<HoursFilter> &filter,
                                            const QTimeZone &zone)
{
    QVector<TimeRange> result;
    if (bound.isEmpty() || !zone.isValid()) {
        return result;
    }
    const QDate firstDate = bound.start.toTimeZone(zone).date();
    const QDate lastDate = bound.end.toTimeZone(zone).date();
    for (QDate date = firstDate; date <= lastDate; date = date.addDays(1)) {
        const TimeRange day = localDay(date, zone).intersected(bound);
        if (day.isEmpty()) {
            continue;
        }
        if (!filter) {
            result.push_back(day);
            continue;
        }
        for (const TimeRange &window : dayWindows(date, day, *filter, zone)) {
            appendIfNotEmpty(result, window);
        }
    }
    return result;
}

QVector<TimeRange> FreeSlotDeriver::dayWindows(const QDate &date, const TimeRange &day, const HoursFilter &filter,
                                               const QTimeZone &zone)
{
    const TimeRange fullDay = localDay(date, zone);
    QVector<TimeRange> parts;
    if (filter.start < filter.end) {
        parts.push_back(TimeRange(atLocalTime(date, filter.start, zone), atLocalTime(date, filter.end, zone)));
    } else {
        // Wraps past midnight: early-morning tail, then the evening head.
        appendIfNotEmpty(parts, TimeRange(fullDay.start, atLocalTime(date, filter.end, zone)));
        appendIfNotEmpty(parts, TimeRange(atLocalTime(date, filter.start, zone), fullDay.end));
    }

    QVector<TimeRange> clipped;
    for (const TimeRange &part : parts) {
        const TimeRange bounded = part.intersected(day);
        if (!filter.hasBreak()) {
            appendIfNotEmpty(clipped, bounded);
            continue;
        }
        const TimeRange pause(atLocalTime(date, filter.breakStart, zone), atLocalTime(date, filter.breakEnd, zone));
        if (!bounded.overlaps(pause)) {
            appendIfNotEmpty(clipped, bounded);
            continue;
        }
        appendIfNotEmpty(clipped, TimeRange(bounded.start, std::max(bounded.start, pause.start)));
        appendIfNotEmpty(clipped, TimeRange(std::min(bounded.end, pause.end), bounded.end));
    }
    return clipped;
}

QVector<BusyInterval> FreeSlotDeriver::clipBusy(const QVector<BusyInterval> &busy, const QVector<TimeRange> &windows)
{
    QVector<BusyInterval> clipped;
    for (const TimeRange &window : windows) {
        auto it = std::partition_point(busy.cbegin(), busy.cend(), [&window](const BusyInterval &interval) {
            return interval.range.end <= window.start;
        });
        for (; it != busy.cend() && it->range.start < window.end; ++it) {
            if (it->range.isEmpty() || !it->range.overlaps(window)) {
                continue;
            }
            BusyInterval part = *it;
            part.range = it->range.intersected(window);
            clipped.push_back(std::move(part));
        }
    }
    return clipped;
}

QVector<FreeInterval> FreeSlotDeriver::complement(const QVector<BusyInterval> &busy, const QVector<TimeRange> &windows)
{
    QVector<FreeInterval> free;
    for (const TimeRange &window : windows) {
        QDateTime cursor = window.start;
        auto it = std::partition_point(busy.cbegin(), busy.cend(), [&window](const BusyInterval &interval) {
            return interval.range.end <= window.start;
        });
        for (; it != busy.cend() && it->range.start < window.end; ++it) {
            if (it->range.isEmpty()) {
                continue;
            }
            if (cursor < it->range.start) {
                free.push_back(FreeInterval{TimeRange(cursor, it->range.start)});
            }
            cursor = std::max(cursor, it->range.end);
        }
        if (cursor < window.end) {
            free.push_back(FreeInterval{TimeRange(cursor, window.end)});
        }
    }
    return free;
}

QVector<FreeInterval> FreeSlotDeriver::dropShorterThan(const QVector<FreeInterval> &free, int minDurationMinutes)
{
    if (minDurationMinutes <= 0) {
        return free;
    }
    const qint64 minSecs = static_cast<qint64>(minDurationMinutes) * 60;
    QVector<FreeInterval> kept;
    std::copy_if(free.cbegin(), free.cend(), std::back_inserter(kept),
                 [minSecs](const FreeInterval &slot) { return slot.range.durationSecs() >= minSecs; });
    return kept;
}

QVector<FreeInterval> FreeSlotDeriver::deriveFree(const QVector<BusyInterval> &busy, const TimeRange &bound,
                                                  const std::optional<HoursFilter> &filter, int minDurationMinutes,
                                                  const QTimeZone &zone)
{
    return dropShorterThan(complement(busy, windows(bound, filter, zone)), minDurationMinutes);
}

} // namespace core
} // namespace whenami
