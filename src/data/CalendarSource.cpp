#include "whenami/data/CalendarSource.hpp"

#include "whenami/core/EventNormalizer.hpp"

namespace whenami {
namespace data {

bool eventOverlaps(const SourceEvent &event, const core::TimeRange &range)
{
    const auto interval = core::EventNormalizer::normalize(event);
    if (!interval) {
        return true;
    }
    return interval->range.overlaps(range);
}

} // namespace data
} // namespace whenami
