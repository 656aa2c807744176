#include "whenami/core/PresentationFormatter.hpp"

#include <QStringList>
#include <algorithm>
#include <utility>

namespace whenami {
namespace core {

namespace {
constexpr auto INSTANT_FORMAT = "yyyy-MM-dd hh:mm";

QString pluralHours(qint64 hours)
{
    return hours == 1 ? QStringLiteral("1 hour") : QStringLiteral("%1 hours").arg(hours);
}
} // namespace

QString DisplayRecord::text() const
{
    return QStringLiteral("%1 to %2").arg(PresentationFormatter::formatInstant(range.start),
                                          PresentationFormatter::formatInstant(range.end));
}

PresentationFormatter::PresentationFormatter(QTimeZone fallbackZone)
    : m_fallbackZone(std::move(fallbackZone))
{
}

QTimeZone PresentationFormatter::outputZone(const Query &query) const
{
    if (query.outputTimezone && query.outputTimezone->isValid()) {
        return *query.outputTimezone;
    }
    return m_fallbackZone;
}

QVector<DisplayRecord> PresentationFormatter::format(const QVector<BusyInterval> &busy,
                                                     const QVector<FreeInterval> &free, const Query &query) const
{
    const QTimeZone zone = outputZone(query);
    QVector<DisplayRecord> busyRecords;
    QVector<DisplayRecord> freeRecords;

    if (query.wantsBusy()) {
        busyRecords.reserve(busy.size());
        for (const auto &interval : busy) {
            DisplayRecord record;
            record.kind = DisplayRecord::Kind::Busy;
            record.range = interval.range.toTimeZone(zone);
            if (query.showEventNames) {
                record.label = interval.contributorTitles().join(QStringLiteral(", "));
            }
            busyRecords.push_back(std::move(record));
        }
    }
    if (query.wantsFree()) {
        freeRecords.reserve(free.size());
        for (const auto &slot : free) {
            DisplayRecord record;
            record.kind = DisplayRecord::Kind::Free;
            record.range = slot.range.toTimeZone(zone);
            freeRecords.push_back(std::move(record));
        }
    }

    QVector<DisplayRecord> records = busyRecords;
    records += freeRecords;
    if (query.outputMode == OutputMode::Both) {
        std::stable_sort(records.begin(), records.end(), [](const DisplayRecord &lhs, const DisplayRecord &rhs) {
            return lhs.range.start < rhs.range.start;
        });
    }
    return records;
}

ReportTotals PresentationFormatter::summarize(const QVector<DisplayRecord> &records)
{
    ReportTotals totals;
    for (const auto &record : records) {
        if (record.isBusy()) {
            totals.busySecs += record.range.durationSecs();
        } else {
            totals.freeSecs += record.range.durationSecs();
        }
    }
    return totals;
}

QString PresentationFormatter::formatDuration(qint64 secs)
{
    const qint64 hours = secs / 3600;
    const qint64 minutes = (secs % 3600) / 60;
    if (hours == 0) {
        return QStringLiteral("%1 minutes").arg(minutes);
    }
    if (minutes == 0) {
        return pluralHours(hours);
    }
    return QStringLiteral("%1 %2 minutes").arg(pluralHours(hours)).arg(minutes);
}

QString PresentationFormatter::formatInstant(const QDateTime &instant)
{
    return QStringLiteral("%1 %2").arg(instant.toString(QLatin1String(INSTANT_FORMAT)),
                                       instant.timeZoneAbbreviation());
}

} // namespace core
} // namespace whenami
