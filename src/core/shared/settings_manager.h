#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QProcessEnvironment>
#include <QString>

#include <optional>

namespace sift {

// SettingsManager -- JSON save/load for runtime settings.
//
// Settings are stored as a JSON file at:
//   $SIFT_SETTINGS, or <GenericDataLocation>/sift/settings.json
// Environment variables (SIFT_DB_PATH, SIFT_EMBED_URL, ...) override
// whatever the file holds.
class SettingsManager {
public:
    // Load settings from disk. Returns nullopt if file doesn't exist
    // or cannot be parsed.
    static std::optional<Settings> load();
    static std::optional<Settings> loadFromFile(const QString& filePath);

    // File settings (or defaults) with environment overrides applied and
    // dbPath/modelsDir resolved. Never fails.
    static Settings resolve();

    // Save settings to disk. Creates the directory if it doesn't exist.
    // Returns true on success.
    static bool save(const Settings& settings);
    static bool saveToFile(const Settings& settings, const QString& filePath);

    // Returns the default file path for the settings file.
    static QString settingsFilePath();
    static QString defaultDataDir();

    static void applyEnvironment(Settings& settings, const QProcessEnvironment& env);

    // Convert settings to/from JSON.
    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);
};

} // namespace sift
