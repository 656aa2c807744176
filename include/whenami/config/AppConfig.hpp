#pragma once

#include <QByteArray>
#include <QString>
#include <QTimeZone>
#include <QVector>
#include <optional>

#include "whenami/core/EngineError.hpp"
#include "whenami/core/Query.hpp"

namespace whenami {
namespace config {

struct CalendarConfig
{
    QString id;
    QString name;
    QString timezone;
    QString icsPath;
};

struct AppConfig
{
    QString sourcePath;
    QVector<CalendarConfig> calendars;
    QString defaultTimezone;
    core::EngineSettings engine;

    // baseDir resolves relative "ics" paths.
    static std::optional<AppConfig> fromJson(const QByteArray &json, const QString &baseDir,
                                             core::EngineError *error = nullptr);

    // explicitPath first, then the user config dir, then ./config.json.
    // No file at all yields the defaults.
    static std::optional<AppConfig> load(const QString &explicitPath, core::EngineError *error = nullptr);

    static QString userConfigPath();
};

// Config value, then $TZ, /etc/timezone, /etc/localtime, and finally UTC.
QTimeZone resolveDefaultTimezone(const QString &configured);

} // namespace config
} // namespace whenami
