#pragma once

#include <QString>
#include <QTimeZone>
#include <QVector>

#include "whenami/core/BusyInterval.hpp"
#include "whenami/core/Query.hpp"
#include "whenami/core/TimeRange.hpp"

namespace whenami {
namespace core {

struct DisplayRecord
{
    enum class Kind
    {
        Busy,
        Free,
    };

    Kind kind = Kind::Free;
    TimeRange range; // in the output zone
    QString label;

    bool isBusy() const { return kind == Kind::Busy; }
    QString text() const;
};

struct ReportTotals
{
    qint64 busySecs = 0;
    qint64 freeSecs = 0;
};

class PresentationFormatter
{
public:
    // fallbackZone is used when the query carries no output timezone.
    explicit PresentationFormatter(QTimeZone fallbackZone);

    QVector<DisplayRecord> format(const QVector<BusyInterval> &busy, const QVector<FreeInterval> &free,
                                  const Query &query) const;

    QTimeZone outputZone(const Query &query) const;

    static ReportTotals summarize(const QVector<DisplayRecord> &records);
    static QString formatDuration(qint64 secs);
    static QString formatInstant(const QDateTime &instant);

private:
    QTimeZone m_fallbackZone;
};

} // namespace core
} // namespace whenami
