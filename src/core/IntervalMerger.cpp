#include "whenami/core/IntervalMerger.hpp"

#include <algorithm>
#include <tuple>

#include "whenami/core/Logging.hpp"

namespace whenami {
namespace core {

namespace {
bool startsBefore(const BusyInterval &lhs, const BusyInterval &rhs)
{
    if (lhs.range.start != rhs.range.start) {
        return lhs.range.start < rhs.range.start;
    }
    if (lhs.range.end != rhs.range.end) {
        return lhs.range.end < rhs.range.end;
    }
    if (lhs.contributors.isEmpty() || rhs.contributors.isEmpty()) {
        return lhs.contributors.size() < rhs.contributors.size();
    }
    const auto &left = lhs.contributors.front();
    const auto &right = rhs.contributors.front();
    return std::tie(left.calendarId, left.id, left.title) < std::tie(right.calendarId, right.id, right.title);
}
} // namespace

QVector<BusyInterval> IntervalMerger::merge(QVector<BusyInterval> intervals)
{
    QVector<BusyInterval> merged;
    if (intervals.isEmpty()) {
        return merged;
    }
    std::stable_sort(intervals.begin(), intervals.end(), startsBefore);

    BusyInterval current = intervals.front();
    for (int i = 1; i < intervals.size(); ++i) {
        const BusyInterval &next = intervals.at(i);
        if (next.range.overlaps(current.range) || next.range.touches(current.range)) {
            current.absorb(next);
        } else {
            merged.push_back(std::move(current));
            current = next;
        }
    }
    merged.push_back(std::move(current));

    qCDebug(lcCore) << "Merged" << intervals.size() << "busy periods into" << merged.size();
    return merged;
}

bool IntervalMerger::isNormalized(const QVector<BusyInterval> &intervals)
{
    for (int i = 1; i < intervals.size(); ++i) {
        if (!(intervals.at(i - 1).range.end < intervals.at(i).range.start)) {
            return false;
        }
    }
    return std::all_of(intervals.cbegin(), intervals.cend(),
                       [](const BusyInterval &interval) { return interval.range.isValid(); });
}

} // namespace core
} // namespace whenami
