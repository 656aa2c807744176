#include "whenami/config/AppConfig.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStandardPaths>
#include <QStringList>

#include "whenami/core/Logging.hpp"

namespace whenami {
namespace config {

namespace {
constexpr auto CONFIG_FILE_NAME = "config.json";

bool readHours(const QJsonObject &root, const QString &key, core::HoursFilter &hours, core::EngineError *error)
{
    if (!root.contains(key)) {
        return true;
    }
    const QJsonObject object = root.value(key).toObject();
    auto readTime = [&](const QJsonObject &source, const QString &field, QTime &target) {
        if (!source.contains(field) || source.value(field).isNull()) {
            return true;
        }
        const QTime parsed = core::parseTimeOfDay(source.value(field).toString());
        if (!parsed.isValid()) {
            core::setError(error, core::ErrorCode::ConfigError,
                           QStringLiteral("Invalid time '%1' for %2.%3, expected HH:MM")
                               .arg(source.value(field).toString(), key, field));
            return false;
        }
        target = parsed;
        return true;
    };

    if (!readTime(object, QStringLiteral("start"), hours.start) || !readTime(object, QStringLiteral("end"), hours.end)) {
        return false;
    }
    const QJsonObject pause = object.value(QStringLiteral("mid_day_break")).toObject();
    return readTime(pause, QStringLiteral("start"), hours.breakStart)
        && readTime(pause, QStringLiteral("end"), hours.breakEnd);
}
} // namespace

std::optional<AppConfig> AppConfig::fromJson(const QByteArray &json, const QString &baseDir, core::EngineError *error)
{
    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        core::setError(error, core::ErrorCode::ConfigError,
                       QStringLiteral("Invalid config JSON: %1").arg(parseError.errorString()));
        return std::nullopt;
    }
    const QJsonObject root = document.object();

    AppConfig config;
    const QDir dir(baseDir.isEmpty() ? QDir::currentPath() : baseDir);
    for (const QJsonValue &value : root.value(QStringLiteral("calendars")).toArray()) {
        const QJsonObject object = value.toObject();
        CalendarConfig calendar;
        calendar.id = object.value(QStringLiteral("id")).toString();
        if (calendar.id.isEmpty()) {
            core::setError(error, core::ErrorCode::ConfigError, QStringLiteral("Calendar entry without an id"));
            return std::nullopt;
        }
        calendar.name = object.value(QStringLiteral("name")).toString(calendar.id);
        calendar.timezone = object.value(QStringLiteral("timezone")).toString();
        if (!calendar.timezone.isEmpty() && !QTimeZone(calendar.timezone.toUtf8()).isValid()) {
            qCWarning(lcConfig).noquote() << "Invalid timezone for calendar" << calendar.id << ':' << calendar.timezone;
        }
        const QString ics = object.value(QStringLiteral("ics")).toString();
        if (!ics.isEmpty()) {
            calendar.icsPath = QDir::cleanPath(dir.absoluteFilePath(ics));
        }
        config.calendars.push_back(calendar);
    }

    config.defaultTimezone = root.value(QStringLiteral("default_timezone")).toString();

    if (!readHours(root, QStringLiteral("work_hours"), config.engine.workHours, error)
        || !readHours(root, QStringLiteral("personal_hours"), config.engine.personalHours, error)) {
        return std::nullopt;
    }

    if (root.contains(QStringLiteral("minimum_slot_duration"))) {
        const int minutes = root.value(QStringLiteral("minimum_slot_duration")).toInt(-1);
        if (minutes < 0) {
            core::setError(error, core::ErrorCode::ConfigError,
                           QStringLiteral("minimum_slot_duration must be a non-negative number of minutes"));
            return std::nullopt;
        }
        config.engine.minimumSlotMinutes = minutes;
    }

    if (root.contains(QStringLiteral("week_start"))) {
        const QString name = root.value(QStringLiteral("week_start")).toString();
        const auto day = core::parseDayOfWeek(name);
        if (!day) {
            core::setError(error, core::ErrorCode::ConfigError, QStringLiteral("Unknown week_start '%1'").arg(name));
            return std::nullopt;
        }
        config.engine.weekStart = *day;
    }
    return config;
}

std::optional<AppConfig> AppConfig::load(const QString &explicitPath, core::EngineError *error)
{
    QStringList candidates;
    if (!explicitPath.isEmpty()) {
        candidates << explicitPath;
    } else {
        candidates << userConfigPath() << QDir::current().filePath(QLatin1String(CONFIG_FILE_NAME));
    }

    for (const QString &path : candidates) {
        QFile file(path);
        if (!file.exists()) {
            continue;
        }
        if (!file.open(QIODevice::ReadOnly)) {
            core::setError(error, core::ErrorCode::ConfigError,
                           QStringLiteral("Could not read %1: %2").arg(path, file.errorString()));
            return std::nullopt;
        }
        auto config = fromJson(file.readAll(), QFileInfo(path).absolutePath(), error);
        if (config) {
            config->sourcePath = path;
            qCDebug(lcConfig) << "Loaded config from" << path;
        }
        return config;
    }

    if (!explicitPath.isEmpty()) {
        core::setError(error, core::ErrorCode::ConfigError, QStringLiteral("Config file %1 not found").arg(explicitPath));
        return std::nullopt;
    }
    qCInfo(lcConfig) << "No config.json found. Please create one at" << userConfigPath();
    return AppConfig{};
}

QString AppConfig::userConfigPath()
{
    QString base = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
    if (base.isEmpty()) {
        base = QDir::homePath() + QStringLiteral("/.config");
    }
    return QDir(base).filePath(QStringLiteral("whenami/") + QLatin1String(CONFIG_FILE_NAME));
}

QTimeZone resolveDefaultTimezone(const QString &configured)
{
    if (!configured.isEmpty()) {
        const QTimeZone zone(configured.toUtf8());
        if (zone.isValid()) {
            return zone;
        }
        qCWarning(lcConfig) << "Invalid timezone in config:" << configured;
    }

    const QByteArray fromEnv = qgetenv("TZ");
    if (!fromEnv.isEmpty()) {
        const QTimeZone zone(fromEnv.startsWith(':') ? fromEnv.mid(1) : fromEnv);
        if (zone.isValid()) {
            return zone;
        }
    }

    QFile timezoneFile(QStringLiteral("/etc/timezone"));
    if (timezoneFile.open(QIODevice::ReadOnly | QIODevice::Text)) {
        const QTimeZone zone(timezoneFile.readAll().trimmed());
        if (zone.isValid()) {
            return zone;
        }
    }

    const QString target = QFileInfo(QStringLiteral("/etc/localtime")).symLinkTarget();
    const int marker = target.indexOf(QLatin1String("/zoneinfo/"));
    if (marker >= 0) {
        const QTimeZone zone(target.mid(marker + 10).toUtf8());
        if (zone.isValid()) {
            return zone;
        }
    }
    return QTimeZone::utc();
}

} // namespace config
} // namespace whenami
