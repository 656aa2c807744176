#pragma once

#include <QString>
#include <QTextStream>
#include <QVector>

#include "whenami/core/AvailabilityEngine.hpp"
#include "whenami/core/Query.hpp"

namespace whenami {
namespace cli {

class ReportPrinter
{
public:
    explicit ReportPrinter(QTextStream &out, bool useColor = true);

    void print(const core::AvailabilityReport &report, const core::Query &query);

private:
    void printSection(const QString &title, const QVector<core::DisplayRecord> &records, bool busy, qint64 totalSecs);
    void printRecords(const QVector<core::DisplayRecord> &records);
    void printTotal(bool busy, qint64 totalSecs);
    QString recordLine(const core::DisplayRecord &record) const;
    QString separator(const QVector<core::DisplayRecord> &records) const;
    QString paint(const QString &text, const char *color) const;

    QTextStream &m_out;
    bool m_useColor = true;
};

} // namespace cli
} // namespace whenami
