#include "whenami/core/BusyInterval.hpp"

#include <algorithm>

namespace whenami {
namespace core {

namespace {
const QString UNTITLED_EVENT = QStringLiteral("Untitled Event");
} // namespace

void BusyInterval::addContributor(const data::SourceEvent &event)
{
    const auto existing = std::find_if(contributors.cbegin(), contributors.cend(),
                                       [&event](const data::SourceEvent &known) {
                                           return known.sameEvent(event);
                                       });
    if (existing == contributors.cend()) {
        contributors.push_back(event);
    }
}

void BusyInterval::absorb(const BusyInterval &other)
{
    range.end = std::max(range.end, other.range.end);
    for (const auto &event : other.contributors) {
        addContributor(event);
    }
}

QStringList BusyInterval::contributorTitles() const
{
    QStringList titles;
    for (const auto &event : contributors) {
        const QString title = event.title.trimmed().isEmpty() ? UNTITLED_EVENT : event.title.trimmed();
        if (!titles.contains(title)) {
            titles << title;
        }
    }
    return titles;
}

} // namespace core
} // namespace whenami
