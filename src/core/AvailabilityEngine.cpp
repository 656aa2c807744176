#include "whenami/core/AvailabilityEngine.hpp"

#include <utility>

#include "whenami/core/FreeSlotDeriver.hpp"
#include "whenami/core/IntervalMerger.hpp"
#include "whenami/core/Logging.hpp"

namespace whenami {
namespace core {

AvailabilityEngine::AvailabilityEngine(EngineSettings settings)
    : m_settings(std::move(settings))
{
}

AvailabilityReport AvailabilityEngine::evaluate(const TimeWindow &window,
                                                const QVector<data::CalendarSnapshot> &calendars,
                                                const Query &query) const
{
    AvailabilityReport report;
    report.window = window;

    QVector<BusyInterval> intervals;
    for (const auto &calendar : calendars) {
        NormalizedCalendar normalized = EventNormalizer::normalizeCalendar(calendar);
        intervals += normalized.intervals;
        report.warnings += normalized.warnings;
    }
    report.mergedBusy = IntervalMerger::merge(std::move(intervals));

    const PresentationFormatter formatter(window.zone);
    const QTimeZone outputZone = formatter.outputZone(query);
    const auto filter = m_settings.filterFor(query.hoursPolicy);

    QVector<TimeRange> windows;
    for (const auto &day : window.days) {
        windows += FreeSlotDeriver::windows(day.range, filter, outputZone);
    }

    const QVector<BusyInterval> busy = FreeSlotDeriver::clipBusy(report.mergedBusy, windows);
    const QVector<FreeInterval> free = FreeSlotDeriver::dropShorterThan(
        FreeSlotDeriver::complement(report.mergedBusy, windows), m_settings.minimumSlotMinutes);
    qCDebug(lcCore) << "Found" << busy.size() << "busy and" << free.size() << "free slots across"
                    << windows.size() << "windows; minimum slot" << m_settings.minimumSlotMinutes << "minutes";

    report.records = formatter.format(busy, free, query);
    report.totals = PresentationFormatter::summarize(report.records);
    return report;
}

} // namespace core
} // namespace whenami
