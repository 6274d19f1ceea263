#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QProcessEnvironment>
#include <QStandardPaths>

namespace aq {

std::optional<Settings> SettingsManager::load(const QString& filePath)
{
    const QString path = filePath.isEmpty() ? settingsFilePath() : filePath;
    QFile file(path);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(aqCore, "Failed to open settings file for read: %s", qUtf8Printable(path));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(aqCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(path),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

Settings SettingsManager::loadOrDefault(const QString& filePath)
{
    std::optional<Settings> loaded = load(filePath);
    if (!loaded.has_value()) {
        LOG_INFO(aqCore, "Using default settings");
        return withResolvedPaths(Settings{});
    }
    return withResolvedPaths(*loaded);
}

bool SettingsManager::save(const Settings& settings, const QString& filePath)
{
    const QString path = filePath.isEmpty() ? settingsFilePath() : filePath;
    const QFileInfo fileInfo(path);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(aqCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(aqCore, "Failed to open settings file for write: %s", qUtf8Printable(path));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(aqCore, "Failed to write settings file: %s", qUtf8Printable(path));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
    return basePath + QStringLiteral("/aeroquery/settings.json");
}

QString SettingsManager::resolveDataDir(const Settings& settings)
{
    const QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    const QString envDataDir = env.value(QStringLiteral("AEROQUERY_DATA_DIR")).trimmed();
    if (!envDataDir.isEmpty()) {
        return QDir::cleanPath(envDataDir);
    }
    if (!settings.dataDir.trimmed().isEmpty()) {
        return QDir::cleanPath(settings.dataDir);
    }
    return QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation)
           + QStringLiteral("/aeroquery");
}

Settings SettingsManager::withResolvedPaths(const Settings& settings)
{
    Settings resolved = settings;
    resolved.dataDir = resolveDataDir(settings);

    const auto fill = [&resolved](QString& path, const char* fileName) {
        if (path.trimmed().isEmpty()) {
            path = resolved.dataDir + QLatin1Char('/') + QLatin1String(fileName);
        }
    };
    fill(resolved.airportsDbPath, "airports.db");
    fill(resolved.gazetteerDbPath, "european_cities.db");
    fill(resolved.notificationsDbPath, "ga_notifications.db");
    fill(resolved.rulesJsonPath, "rules.json");
    return resolved;
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("dataDir"), settings.dataDir);
    json.insert(QStringLiteral("airportsDbPath"), settings.airportsDbPath);
    json.insert(QStringLiteral("gazetteerDbPath"), settings.gazetteerDbPath);
    json.insert(QStringLiteral("notificationsDbPath"), settings.notificationsDbPath);
    json.insert(QStringLiteral("rulesJsonPath"), settings.rulesJsonPath);
    json.insert(QStringLiteral("searchLimit"), settings.searchLimit);
    json.insert(QStringLiteral("maxListedAirports"), settings.maxListedAirports);
    json.insert(QStringLiteral("borderCrossingLimit"), settings.borderCrossingLimit);
    json.insert(QStringLiteral("notificationLimit"), settings.notificationLimit);
    json.insert(QStringLiteral("defaultRadiusNm"), settings.defaultRadiusNm);
    json.insert(QStringLiteral("anchorSearchRadiusNm"), settings.anchorSearchRadiusNm);
    json.insert(QStringLiteral("includeAirportsWithoutNotification"),
                settings.includeAirportsWithoutNotification);
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    settings.dataDir = json.value(QStringLiteral("dataDir")).toString(settings.dataDir);
    settings.airportsDbPath = json.value(QStringLiteral("airportsDbPath"))
                                  .toString(settings.airportsDbPath);
    settings.gazetteerDbPath = json.value(QStringLiteral("gazetteerDbPath"))
                                   .toString(settings.gazetteerDbPath);
    settings.notificationsDbPath = json.value(QStringLiteral("notificationsDbPath"))
                                       .toString(settings.notificationsDbPath);
    settings.rulesJsonPath = json.value(QStringLiteral("rulesJsonPath"))
                                 .toString(settings.rulesJsonPath);

    settings.searchLimit = json.value(QStringLiteral("searchLimit")).toInt(settings.searchLimit);
    settings.maxListedAirports = json.value(QStringLiteral("maxListedAirports"))
                                     .toInt(settings.maxListedAirports);
    settings.borderCrossingLimit = json.value(QStringLiteral("borderCrossingLimit"))
                                       .toInt(settings.borderCrossingLimit);
    settings.notificationLimit = json.value(QStringLiteral("notificationLimit"))
                                     .toInt(settings.notificationLimit);

    settings.defaultRadiusNm = json.value(QStringLiteral("defaultRadiusNm"))
                                   .toDouble(settings.defaultRadiusNm);
    settings.anchorSearchRadiusNm = json.value(QStringLiteral("anchorSearchRadiusNm"))
                                        .toDouble(settings.anchorSearchRadiusNm);

    settings.includeAirportsWithoutNotification =
        json.value(QStringLiteral("includeAirportsWithoutNotification"))
            .toBool(settings.includeAirportsWithoutNotification);

    return settings;
}

} // namespace aq
