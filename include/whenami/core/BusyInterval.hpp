#pragma once

#include <QStringList>
#include <QVector>

#include "whenami/core/TimeRange.hpp"
#include "whenami/data/SourceEvent.hpp"

namespace whenami {
namespace core {

struct BusyInterval
{
    TimeRange range;
    // First-seen order, no duplicates.
    QVector<data::SourceEvent> contributors;

    void addContributor(const data::SourceEvent &event);
    void absorb(const BusyInterval &other);
    QStringList contributorTitles() const;
};

struct FreeInterval
{
    TimeRange range;

    bool operator==(const FreeInterval &other) const { return range == other.range; }
};

} // namespace core
} // namespace whenami
