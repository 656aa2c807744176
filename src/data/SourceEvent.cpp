#include "whenami/data/SourceEvent.hpp"

namespace whenami {
namespace data {

bool SourceEvent::sameEvent(const SourceEvent &other) const
{
    if (calendarId != other.calendarId) {
        return false;
    }
    if (!id.isEmpty() || !other.id.isEmpty()) {
        return id == other.id;
    }
    return title == other.title && start == other.start && end == other.end && isAllDay == other.isAllDay;
}

} // namespace data
} // namespace whenami
