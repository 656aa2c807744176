#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QTextStream>
#include <QTimeZone>
#include <memory>
#include <vector>

#include "version.h"

#include "whenami/cli/ReportPrinter.hpp"
#include "whenami/config/AppConfig.hpp"
#include "whenami/core/AvailabilityEngine.hpp"
#include "whenami/core/Logging.hpp"
#include "whenami/core/TimeWindowResolver.hpp"
#include "whenami/data/IcsCalendarSource.hpp"

using namespace whenami;

namespace {

int fail(const QString &message)
{
    QTextStream err(stderr);
    err << "[ERROR] " << message << Qt::endl;
    return 1;
}

core::OutputMode outputModeFor(bool free, bool busy, bool split)
{
    if (free && !busy) {
        return core::OutputMode::Free;
    }
    if (busy && !free) {
        return core::OutputMode::Busy;
    }
    return split ? core::OutputMode::BothSplit : core::OutputMode::Both;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("whenami"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kWhenamiVersion));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Find free slots in your calendar"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption todayOption(QStringLiteral("today"), QStringLiteral("Show free slots for today"));
    const QCommandLineOption tomorrowOption(QStringLiteral("tomorrow"), QStringLiteral("Show free slots for tomorrow"));
    const QCommandLineOption nextWeekOption(QStringLiteral("next-week"), QStringLiteral("Show free slots for next week"));
    const QCommandLineOption nextTwoWeeksOption(QStringLiteral("next-two-weeks"),
                                                QStringLiteral("Show free slots for next two weeks"));
    const QCommandLineOption dateOption(QStringLiteral("date"),
                                        QStringLiteral("Show slots for a date (DD/MM/YYYY, DD-MM-YY, ...)"),
                                        QStringLiteral("date"));
    const QCommandLineOption dateRangeOption(QStringLiteral("date-range"),
                                             QStringLiteral("Show slots for a date range (DD/MM/YYYY,DD/MM/YYYY)"),
                                             QStringLiteral("range"));
    const QCommandLineOption workDaysOption(QStringLiteral("work-days"), QStringLiteral("Show only Monday-Friday slots"));
    const QCommandLineOption workHoursOption(QStringLiteral("work-hours"),
                                             QStringLiteral("Show only work hours (default: 9-5)"));
    const QCommandLineOption personalHoursOption(QStringLiteral("personal-hours"),
                                                 QStringLiteral("Show only personal hours (default: 8-22)"));
    const QCommandLineOption allHoursOption(QStringLiteral("all-hours"), QStringLiteral("Show all hours of the day"));
    const QCommandLineOption convertTzOption(QStringLiteral("convert-tz"),
                                             QStringLiteral("Convert output to timezone (e.g., America/Sao_Paulo)"),
                                             QStringLiteral("zone"));
    const QCommandLineOption listTzOption(QStringLiteral("list-tz"), QStringLiteral("List all available timezones"));
    const QCommandLineOption freeOption(QStringLiteral("free"), QStringLiteral("Show only free slots"));
    const QCommandLineOption busyOption(QStringLiteral("busy"), QStringLiteral("Show only busy slots"));
    const QCommandLineOption splitOption(QStringLiteral("split"),
                                         QStringLiteral("Split busy and free slots into separate sections"));
    const QCommandLineOption eventNameOption(QStringLiteral("event-name"),
                                             QStringLiteral("Show event names alongside busy slots"));
    const QCommandLineOption noColorOption(QStringLiteral("no-color"), QStringLiteral("Disable ANSI colors"));
    const QCommandLineOption configOption(QStringLiteral("config"), QStringLiteral("Path to config.json"),
                                          QStringLiteral("path"));
    const QCommandLineOption debugOption(QStringLiteral("debug"), QStringLiteral("Show debug messages"));

    parser.addOptions({todayOption, tomorrowOption, nextWeekOption, nextTwoWeeksOption, dateOption, dateRangeOption,
                       workDaysOption, workHoursOption, personalHoursOption, allHoursOption, convertTzOption,
                       listTzOption, freeOption, busyOption, splitOption, eventNameOption, noColorOption,
                       configOption, debugOption});
    parser.process(app);

    core::enableDebugLogging(parser.isSet(debugOption));

    QTextStream out(stdout);
    out.setCodec("UTF-8");

    if (parser.isSet(listTzOption)) {
        for (const QByteArray &id : QTimeZone::availableTimeZoneIds()) {
            out << id << Qt::endl;
        }
        return 0;
    }

    const std::vector<const QCommandLineOption *> dateOptions = {&todayOption, &tomorrowOption, &nextWeekOption,
                                                                 &nextTwoWeeksOption, &dateOption, &dateRangeOption};
    int selectedDates = 0;
    for (const auto *option : dateOptions) {
        selectedDates += parser.isSet(*option) ? 1 : 0;
    }
    if (selectedDates > 1) {
        return fail(QStringLiteral("Only one of --today, --tomorrow, --next-week, --next-two-weeks, --date, "
                                   "--date-range may be given"));
    }

    core::EngineError error;
    const auto config = config::AppConfig::load(parser.value(configOption), &error);
    if (!config) {
        return fail(error.message);
    }
    const QTimeZone defaultZone = config::resolveDefaultTimezone(config->defaultTimezone);
    qCDebug(lcCore) << "Using timezone:" << defaultZone.id();

    core::Query query;
    if (parser.isSet(tomorrowOption)) {
        query.dateSelector = core::DateSelector::tomorrow();
    } else if (parser.isSet(nextWeekOption)) {
        query.dateSelector = core::DateSelector::nextWeek();
    } else if (parser.isSet(nextTwoWeeksOption)) {
        query.dateSelector = core::DateSelector::nextTwoWeeks();
    } else if (parser.isSet(dateOption)) {
        query.dateSelector = core::DateSelector::date(parser.value(dateOption));
    } else if (parser.isSet(dateRangeOption)) {
        query.dateSelector = core::DateSelector::dateRange(parser.value(dateRangeOption));
    }

    if (parser.isSet(allHoursOption)) {
        query.hoursPolicy = core::HoursPolicy::All;
    } else if (parser.isSet(workHoursOption)) {
        query.hoursPolicy = core::HoursPolicy::Work;
    } else {
        query.hoursPolicy = core::HoursPolicy::Personal;
    }
    query.outputMode = outputModeFor(parser.isSet(freeOption), parser.isSet(busyOption), parser.isSet(splitOption));
    query.showEventNames = parser.isSet(eventNameOption);
    query.workDaysOnly = parser.isSet(workDaysOption);

    if (parser.isSet(convertTzOption)) {
        const QTimeZone target(parser.value(convertTzOption).toUtf8());
        if (!target.isValid()) {
            return fail(QStringLiteral("Unknown timezone '%1'").arg(parser.value(convertTzOption)));
        }
        qCDebug(lcCore) << "Converting slots to timezone:" << target.id();
        query.outputTimezone = target;
    }

    const core::TimeWindowResolver resolver(config->engine.weekStart, query.workDaysOnly);
    const auto window = resolver.resolve(query.dateSelector, QDateTime::currentDateTimeUtc(), defaultZone, &error);
    if (!window) {
        return fail(error.message);
    }

    if (config->calendars.isEmpty()) {
        return fail(QStringLiteral("No calendars configured in %1").arg(config::AppConfig::userConfigPath()));
    }

    std::vector<std::unique_ptr<data::CalendarSource>> sources;
    for (const auto &calendar : config->calendars) {
        if (calendar.icsPath.isEmpty()) {
            qCWarning(lcData) << "Calendar" << calendar.id << "has no 'ics' source, skipping";
            continue;
        }
        sources.push_back(std::make_unique<data::IcsCalendarSource>(calendar.id, calendar.icsPath, calendar.name,
                                                                     QTimeZone(calendar.timezone.toUtf8())));
    }

    QVector<data::CalendarSnapshot> snapshots;
    for (const auto &source : sources) {
        core::EngineError fetchError;
        auto snapshot = source->fetch(window->range, &fetchError);
        if (!snapshot) {
            qCWarning(lcData).noquote() << "Failed to fetch calendar" << source->calendarId()
                                        << QStringLiteral("(%1):").arg(core::errorCodeName(fetchError.code))
                                        << fetchError.message;
            continue;
        }
        snapshots.push_back(std::move(*snapshot));
    }
    if (snapshots.isEmpty()) {
        return fail(QStringLiteral("No valid calendars found!"));
    }

    const core::AvailabilityEngine engine(config->engine);
    const core::AvailabilityReport report = engine.evaluate(*window, snapshots, query);

    cli::ReportPrinter printer(out, !parser.isSet(noColorOption));
    printer.print(report, query);
    return 0;
}
