#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace dr {

// SettingsManager -- JSON save/load for retrieval settings.
//
// Settings are stored as a JSON file at:
//   <GenericDataLocation>/docretriever/settings.json
// The DOCRETRIEVER_SETTINGS environment variable overrides the path.
class SettingsManager {
public:
    // Load settings from the default path. Returns nullopt if the file
    // doesn't exist or cannot be parsed.
    static std::optional<Settings> load();
    static std::optional<Settings> loadFrom(const QString& filePath);

    // Save settings. Creates the directory if it doesn't exist.
    static bool save(const Settings& settings);
    static bool saveTo(const Settings& settings, const QString& filePath);

    static QString settingsFilePath();

    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);
};

} // namespace dr
