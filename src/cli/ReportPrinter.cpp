#include "whenami/cli/ReportPrinter.hpp"

#include <algorithm>

namespace whenami {
namespace cli {

namespace {
constexpr auto RESET = "\033[0m";
constexpr auto BOLD = "\033[1m";
constexpr auto GREEN = "\033[92m";
constexpr auto RED = "\033[91m";

const QString BULLET = QStringLiteral("• ");
const QChar RULE(0x2500);
} // namespace

ReportPrinter::ReportPrinter(QTextStream &out, bool useColor)
    : m_out(out)
    , m_useColor(useColor)
{
}

void ReportPrinter::print(const core::AvailabilityReport &report, const core::Query &query)
{
    if (report.records.isEmpty()) {
        m_out << "No slots to display" << Qt::endl;
        return;
    }

    m_out << '\n' << "WHENAMI " << paint(QStringLiteral("free"), GREEN) << '/' << paint(QStringLiteral("busy"), RED)
          << '?' << Qt::endl;

    if (query.outputMode == core::OutputMode::BothSplit) {
        QVector<core::DisplayRecord> busy;
        QVector<core::DisplayRecord> free;
        for (const auto &record : report.records) {
            (record.isBusy() ? busy : free).push_back(record);
        }
        if (!busy.isEmpty()) {
            printSection(QStringLiteral("Busy"), busy, true, report.totals.busySecs);
        }
        if (!free.isEmpty()) {
            printSection(QStringLiteral("Free"), free, false, report.totals.freeSecs);
        }
        return;
    }

    printRecords(report.records);
    if (query.wantsFree()) {
        printTotal(false, report.totals.freeSecs);
    }
    if (query.wantsBusy()) {
        printTotal(true, report.totals.busySecs);
    }
}

void ReportPrinter::printSection(const QString &title, const QVector<core::DisplayRecord> &records, bool busy,
                                 qint64 totalSecs)
{
    m_out << '\n' << paint(title, busy ? RED : GREEN) << " slots" << Qt::endl;
    printRecords(records);
    printTotal(busy, totalSecs);
}

void ReportPrinter::printRecords(const QVector<core::DisplayRecord> &records)
{
    const QString rule = separator(records);
    m_out << rule << Qt::endl;
    for (const auto &record : records) {
        m_out << paint(recordLine(record), record.isBusy() ? RED : GREEN) << Qt::endl;
    }
    m_out << rule << Qt::endl;
}

void ReportPrinter::printTotal(bool busy, qint64 totalSecs)
{
    const char *color = busy ? RED : GREEN;
    QString amount = core::PresentationFormatter::formatDuration(totalSecs);
    if (m_useColor) {
        amount = QLatin1String(BOLD) + amount;
    }
    m_out << "Total " << paint(busy ? QStringLiteral("busy") : QStringLiteral("free"), color) << " time: "
          << paint(amount, color) << Qt::endl;
}

QString ReportPrinter::recordLine(const core::DisplayRecord &record) const
{
    QString line = BULLET + record.text();
    if (record.isBusy() && !record.label.isEmpty()) {
        line += QStringLiteral(" - ") + record.label;
    }
    return line;
}

QString ReportPrinter::separator(const QVector<core::DisplayRecord> &records) const
{
    int width = 0;
    for (const auto &record : records) {
        width = std::max(width, (BULLET + record.text()).size());
    }
    return QString(width, RULE);
}

QString ReportPrinter::paint(const QString &text, const char *color) const
{
    if (!m_useColor) {
        return text;
    }
    return QLatin1String(color) + text + QLatin1String(RESET);
}

} // namespace cli
} // namespace whenami
