#pragma once

#include <QVector>

#include "whenami/core/BusyInterval.hpp"
#include "whenami/core/EventNormalizer.hpp"
#include "whenami/core/PresentationFormatter.hpp"
#include "whenami/core/Query.hpp"
#include "whenami/core/TimeWindowResolver.hpp"
#include "whenami/data/SourceEvent.hpp"

namespace whenami {
namespace core {

struct AvailabilityReport
{
    TimeWindow window;
    QVector<BusyInterval> mergedBusy;
    QVector<DisplayRecord> records;
    QVector<EventWarning> warnings;
    ReportTotals totals;
};

class AvailabilityEngine
{
public:
    explicit AvailabilityEngine(EngineSettings settings);

    // window comes from TimeWindowResolver in the default zone; records are in
    // query.outputTimezone, or in window.zone when none is set.
    AvailabilityReport evaluate(const TimeWindow &window, const QVector<data::CalendarSnapshot> &calendars,
                                const Query &query) const;

private:
    EngineSettings m_settings;
};

} // namespace core
} // namespace whenami
