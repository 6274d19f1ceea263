#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace aq {

// SettingsManager -- JSON save/load for engine settings.
//
// Settings are stored as a JSON file at:
//   <GenericConfigLocation>/aeroquery/settings.json
// The data directory can be overridden with AEROQUERY_DATA_DIR.
class SettingsManager {
public:
    // Load settings from the given file (default location when empty).
    // Returns nullopt if the file doesn't exist or cannot be parsed.
    static std::optional<Settings> load(const QString& filePath = {});

    // Load, falling back to defaults, then resolve every data path.
    static Settings loadOrDefault(const QString& filePath = {});

    // Save settings to disk. Creates the directory if it doesn't exist.
    // Returns true on success.
    static bool save(const Settings& settings, const QString& filePath = {});

    // Returns the default file path for the settings file.
    static QString settingsFilePath();

    // AEROQUERY_DATA_DIR, else the configured dataDir, else
    // <GenericDataLocation>/aeroquery.
    static QString resolveDataDir(const Settings& settings);

    // Fill empty data file paths from the resolved data directory.
    static Settings withResolvedPaths(const Settings& settings);

    // Convert settings to/from JSON.
    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);
};

} // namespace aq
