#pragma once

#include <QString>
#include <optional>

#include "whenami/core/EngineError.hpp"
#include "whenami/core/TimeRange.hpp"
#include "whenami/data/SourceEvent.hpp"

namespace whenami {
namespace data {

class CalendarSource
{
public:
    virtual ~CalendarSource() = default;

    virtual QString calendarId() const = 0;
    // Events overlapping range. Recurrences are expected to be expanded already.
    virtual std::optional<CalendarSnapshot> fetch(const core::TimeRange &range,
                                                  core::EngineError *error = nullptr) const = 0;
};

// Malformed events always pass so they can be reported downstream.
bool eventOverlaps(const SourceEvent &event, const core::TimeRange &range);

} // namespace data
} // namespace whenami
