#include "whenami/data/IcsCalendarSource.hpp"

#include <QDate>
#include <QFile>
#include <QRegularExpression>
#include <QStringList>
#include <QTextStream>
#include <QTime>
#include <utility>

#include "whenami/core/Logging.hpp"

namespace whenami {
namespace data {

namespace {
constexpr auto DATE_FORMAT = "yyyyMMdd";
constexpr auto TIME_FORMAT = "hhmmss";
} // namespace

IcsCalendarSource::IcsCalendarSource(QString calendarId, QString filePath, QString calendarName,
                                     QTimeZone nativeTimezone)
    : m_calendarId(std::move(calendarId))
    , m_filePath(std::move(filePath))
    , m_calendarName(std::move(calendarName))
    , m_nativeTimezone(std::move(nativeTimezone))
{
}

QString IcsCalendarSource::calendarId() const
{
    return m_calendarId;
}

std::optional<CalendarSnapshot> IcsCalendarSource::fetch(const core::TimeRange &range, core::EngineError *error) const
{
    QFile file(m_filePath);
    if (!file.exists()) {
        core::setError(error, core::ErrorCode::SourceError,
                       QStringLiteral("Calendar file %1 does not exist").arg(m_filePath));
        return std::nullopt;
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        core::setError(error, core::ErrorCode::SourceError,
                       QStringLiteral("Could not open calendar file %1: %2").arg(m_filePath, file.errorString()));
        return std::nullopt;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    CalendarSnapshot snapshot;
    snapshot.calendarId = m_calendarId;
    snapshot.calendarName = m_calendarName;
    snapshot.nativeTimezone = m_nativeTimezone;

    QVector<SourceEvent> parsed;
    bool inEvent = false;
    SourceEvent currentEvent;
    QString pendingStart;
    QString pendingStartParams;
    QString pendingEnd;
    QString pendingEndParams;
    std::optional<Duration> pendingDuration;

    auto finalizeEvent = [&]() {
        const QTimeZone zone = snapshot.nativeTimezone.isValid() ? snapshot.nativeTimezone : QTimeZone::utc();
        const DateValue start = parseDateTime(pendingStart, pendingStartParams, zone);
        const DateValue end = parseDateTime(pendingEnd, pendingEndParams, zone);
        currentEvent.start = start.value;
        currentEvent.isAllDay = start.dateOnly;
        if (!pendingEnd.isEmpty()) {
            currentEvent.end = end.value;
        } else if (pendingDuration) {
            currentEvent.end = start.value.addDays(pendingDuration->days);
            if (!start.dateOnly) {
                currentEvent.end = currentEvent.end.addSecs(pendingDuration->secs);
            }
        } else if (!start.dateOnly) {
            currentEvent.end = start.value;
        }
        currentEvent.calendarId = snapshot.calendarId;
        currentEvent.sourceTimezone = zone;
        parsed.push_back(currentEvent);
    };

    auto handleLine = [&](const QString &line) {
        if (line == QLatin1String("BEGIN:VEVENT")) {
            inEvent = true;
            currentEvent = SourceEvent{};
            pendingStart.clear();
            pendingStartParams.clear();
            pendingEnd.clear();
            pendingEndParams.clear();
            pendingDuration.reset();
            return;
        }
        if (line == QLatin1String("END:VEVENT")) {
            if (inEvent) {
                finalizeEvent();
            }
            inEvent = false;
            return;
        }

        const int colonIndex = line.indexOf(':');
        if (colonIndex <= 0) {
            return;
        }

        const QString property = line.left(colonIndex);
        const QString rawValue = line.mid(colonIndex + 1).trimmed();
        const QString name = property.section(';', 0, 0).toUpper();
        const QString parameters = property.contains(';') ? property.section(';', 1) : QString();

        if (!inEvent) {
            if (name == QLatin1String("X-WR-CALNAME") && snapshot.calendarName.isEmpty()) {
                snapshot.calendarName = decodeText(rawValue);
            } else if (name == QLatin1String("X-WR-TIMEZONE") && !snapshot.nativeTimezone.isValid()) {
                snapshot.nativeTimezone = QTimeZone(rawValue.toUtf8());
                if (!snapshot.nativeTimezone.isValid()) {
                    qCWarning(lcData) << "Unknown calendar timezone" << rawValue << "in" << m_filePath;
                }
            }
            return;
        }

        if (name == QLatin1String("UID")) {
            currentEvent.id = rawValue;
        } else if (name == QLatin1String("SUMMARY")) {
            currentEvent.title = decodeText(rawValue);
        } else if (name == QLatin1String("DTSTART")) {
            pendingStart = rawValue;
            pendingStartParams = parameters;
        } else if (name == QLatin1String("DTEND")) {
            pendingEnd = rawValue;
            pendingEndParams = parameters;
        } else if (name == QLatin1String("DURATION")) {
            pendingDuration = parseDuration(rawValue);
            if (!pendingDuration) {
                qCWarning(lcData) << "Invalid DURATION" << rawValue << "on" << currentEvent.id << "in" << m_filePath;
            }
        } else if (name == QLatin1String("RRULE")) {
            qCDebug(lcData) << "Ignoring RRULE of" << currentEvent.id << "- recurrences must be pre-expanded";
        }
    };

    QString accumulator;
    bool hasAccumulator = false;
    while (!stream.atEnd()) {
        QString line = stream.readLine();
        if (!line.isEmpty() && (line.startsWith(' ') || line.startsWith('\t'))) {
            if (hasAccumulator) {
                accumulator += line.mid(1);
            }
        } else {
            if (hasAccumulator) {
                handleLine(accumulator);
            }
            accumulator = line;
            hasAccumulator = true;
        }
    }
    if (hasAccumulator) {
        handleLine(accumulator);
    }

    if (snapshot.calendarName.isEmpty()) {
        snapshot.calendarName = m_calendarId;
    }
    for (SourceEvent &event : parsed) {
        event.calendarName = snapshot.calendarName;
        if (eventOverlaps(event, range)) {
            snapshot.events.push_back(std::move(event));
        }
    }
    qCDebug(lcData) << "Read" << parsed.size() << "events from" << m_filePath << "," << snapshot.events.size()
                    << "in range";
    return snapshot;
}

QString IcsCalendarSource::decodeText(const QString &text)
{
    QString decoded = text;
    decoded.replace("\\n", "\n", Qt::CaseInsensitive);
    decoded.replace("\\,", ",");
    decoded.replace("\\;", ";");
    decoded.replace("\\\\", "\\");
    return decoded;
}

std::optional<IcsCalendarSource::Duration> IcsCalendarSource::parseDuration(const QString &value)
{
    static const QRegularExpression pattern(
        QStringLiteral("^([+-])?P(?:(\\d+)W)?(?:(\\d+)D)?(?:T(?:(\\d+)H)?(?:(\\d+)M)?(?:(\\d+)S)?)?$"),
        QRegularExpression::CaseInsensitiveOption);
    const QRegularExpressionMatch match = pattern.match(value);
    if (!match.hasMatch() || value.endsWith('P', Qt::CaseInsensitive) || value.endsWith('T', Qt::CaseInsensitive)) {
        return std::nullopt;
    }
    const int sign = match.captured(1) == QLatin1String("-") ? -1 : 1;
    Duration duration;
    duration.days = sign * (match.captured(2).toInt() * 7 + match.captured(3).toInt());
    duration.secs = sign * (match.captured(4).toLongLong() * 3600 + match.captured(5).toLongLong() * 60
                            + match.captured(6).toLongLong());
    return duration;
}

QString IcsCalendarSource::parameterValue(const QString &parameters, const QString &name)
{
    const QStringList parts = parameters.split(';', Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        if (part.section('=', 0, 0).compare(name, Qt::CaseInsensitive) == 0) {
            QString value = part.section('=', 1);
            if (value.startsWith('"') && value.endsWith('"') && value.size() >= 2) {
                value = value.mid(1, value.size() - 2);
            }
            return value;
        }
    }
    return {};
}

IcsCalendarSource::DateValue IcsCalendarSource::parseDateTime(const QString &value, const QString &parameters,
                                                              const QTimeZone &fallbackZone)
{
    DateValue result;
    if (value.isEmpty()) {
        return result;
    }
    const QDate date = QDate::fromString(value.left(8), QLatin1String(DATE_FORMAT));
    if (!date.isValid()) {
        return result;
    }
    const bool dateOnlyParam = parameterValue(parameters, QStringLiteral("VALUE")).compare(
                                   QLatin1String("DATE"), Qt::CaseInsensitive) == 0;
    if (dateOnlyParam || value.size() == 8) {
        result.value = QDateTime(date, QTime(0, 0), Qt::UTC);
        result.dateOnly = true;
        return result;
    }

    const QTime time = QTime::fromString(value.mid(9, 6), QLatin1String(TIME_FORMAT));
    if (value.at(8) != 'T' || !time.isValid()) {
        return result;
    }
    if (value.endsWith('Z')) {
        result.value = QDateTime(date, time, Qt::UTC);
        return result;
    }

    QTimeZone zone = fallbackZone;
    const QString tzid = parameterValue(parameters, QStringLiteral("TZID"));
    if (!tzid.isEmpty()) {
        const QTimeZone named(tzid.toUtf8());
        if (named.isValid()) {
            zone = named;
        } else {
            qCWarning(lcData) << "Unknown TZID" << tzid << "- using calendar timezone" << fallbackZone.id();
        }
    }
    result.value = QDateTime(date, time, zone);
    return result;
}

} // namespace data
} // namespace whenami
