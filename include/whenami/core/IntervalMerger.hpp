#pragma once

#include <QVector>

#include "whenami/core/BusyInterval.hpp"

namespace whenami {
namespace core {

class IntervalMerger
{
public:
    // Sorted, pairwise disjoint and non-touching output; order of input is irrelevant.
    static QVector<BusyInterval> merge(QVector<BusyInterval> intervals);

    // Checks the merge output invariant: a.end < b.start for every neighbour pair.
    static bool isNormalized(const QVector<BusyInterval> &intervals);
};

} // namespace core
} // namespace whenami
