#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

namespace dr {

namespace {

QStringList stringListFrom(const QJsonValue& value, const QStringList& fallback)
{
    if (!value.isArray()) {
        return fallback;
    }
    QStringList list;
    const QJsonArray array = value.toArray();
    list.reserve(array.size());
    for (const QJsonValue& entry : array) {
        const QString text = entry.toString().trimmed();
        if (!text.isEmpty()) {
            list.append(text);
        }
    }
    return list;
}

uint32_t uintFrom(const QJsonObject& json, const QString& key, uint32_t fallback)
{
    if (!json.contains(key)) {
        return fallback;
    }
    return json.value(key).toVariant().toUInt();
}

} // namespace

std::optional<Settings> SettingsManager::load()
{
    return loadFrom(settingsFilePath());
}

std::optional<Settings> SettingsManager::loadFrom(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(drCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(drCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const Settings& settings)
{
    return saveTo(settings, settingsFilePath());
}

bool SettingsManager::saveTo(const Settings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(drCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(drCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(drCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString overridePath = qEnvironmentVariable("DOCRETRIEVER_SETTINGS");
    if (!overridePath.isEmpty()) {
        return overridePath;
    }
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/docretriever/settings.json");
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("dbPath"), settings.dbPath);
    json.insert(QStringLiteral("segmenterProgram"), settings.segmenterProgram);
    json.insert(QStringLiteral("segmenterArguments"),
                QJsonArray::fromStringList(settings.segmenterArguments));
    json.insert(QStringLiteral("segmenterTimeoutMs"), static_cast<int>(settings.segmenterTimeoutMs));
    json.insert(QStringLiteral("embeddingProgram"), settings.embeddingProgram);
    json.insert(QStringLiteral("embeddingArguments"),
                QJsonArray::fromStringList(settings.embeddingArguments));
    json.insert(QStringLiteral("embeddingDimensions"), settings.embeddingDimensions);
    json.insert(QStringLiteral("embeddingTimeoutMs"), static_cast<int>(settings.embeddingTimeoutMs));
    json.insert(QStringLiteral("queryTimeoutMs"), static_cast<int>(settings.queryTimeoutMs));

    QJsonObject search;
    search.insert(QStringLiteral("keywordWeight"), settings.keywordWeight);
    search.insert(QStringLiteral("vectorWeight"), settings.vectorWeight);
    search.insert(QStringLiteral("massFraction"), settings.massFraction);
    search.insert(QStringLiteral("minChunks"), settings.minChunks);
    search.insert(QStringLiteral("documentScopedMinChunks"), settings.documentScopedMinChunks);
    search.insert(QStringLiteral("maxChunks"), settings.maxChunks);
    json.insert(QStringLiteral("search"), search);

    QJsonObject boosts;
    boosts.insert(QStringLiteral("primaryTerms"), QJsonArray::fromStringList(settings.primaryBoostTerms));
    boosts.insert(QStringLiteral("secondaryTerms"),
                  QJsonArray::fromStringList(settings.secondaryBoostTerms));
    boosts.insert(QStringLiteral("primaryBoost"), settings.primaryBoost);
    boosts.insert(QStringLiteral("secondaryBoost"), settings.secondaryBoost);
    json.insert(QStringLiteral("literalBoosts"), boosts);
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    settings.dbPath = json.value(QStringLiteral("dbPath")).toString(settings.dbPath);
    settings.segmenterProgram =
        json.value(QStringLiteral("segmenterProgram")).toString(settings.segmenterProgram);
    settings.segmenterArguments = stringListFrom(json.value(QStringLiteral("segmenterArguments")),
                                                 settings.segmenterArguments);
    settings.segmenterTimeoutMs =
        uintFrom(json, QStringLiteral("segmenterTimeoutMs"), settings.segmenterTimeoutMs);

    settings.embeddingProgram =
        json.value(QStringLiteral("embeddingProgram")).toString(settings.embeddingProgram);
    settings.embeddingArguments = stringListFrom(json.value(QStringLiteral("embeddingArguments")),
                                                 settings.embeddingArguments);
    settings.embeddingDimensions =
        json.value(QStringLiteral("embeddingDimensions")).toInt(settings.embeddingDimensions);
    settings.embeddingTimeoutMs =
        uintFrom(json, QStringLiteral("embeddingTimeoutMs"), settings.embeddingTimeoutMs);
    settings.queryTimeoutMs = uintFrom(json, QStringLiteral("queryTimeoutMs"), settings.queryTimeoutMs);

    const QJsonObject search = json.value(QStringLiteral("search")).toObject();
    settings.keywordWeight = search.value(QStringLiteral("keywordWeight")).toDouble(settings.keywordWeight);
    settings.vectorWeight = search.value(QStringLiteral("vectorWeight")).toDouble(settings.vectorWeight);
    settings.massFraction = search.value(QStringLiteral("massFraction")).toDouble(settings.massFraction);
    settings.minChunks = search.value(QStringLiteral("minChunks")).toInt(settings.minChunks);
    settings.documentScopedMinChunks = search.value(QStringLiteral("documentScopedMinChunks"))
                                           .toInt(settings.documentScopedMinChunks);
    settings.maxChunks = search.value(QStringLiteral("maxChunks")).toInt(settings.maxChunks);

    const QJsonObject boosts = json.value(QStringLiteral("literalBoosts")).toObject();
    settings.primaryBoostTerms =
        stringListFrom(boosts.value(QStringLiteral("primaryTerms")), settings.primaryBoostTerms);
    settings.secondaryBoostTerms =
        stringListFrom(boosts.value(QStringLiteral("secondaryTerms")), settings.secondaryBoostTerms);
    settings.primaryBoost = boosts.value(QStringLiteral("primaryBoost")).toDouble(settings.primaryBoost);
    settings.secondaryBoost =
        boosts.value(QStringLiteral("secondaryBoost")).toDouble(settings.secondaryBoost);

    return settings;
}

} // namespace dr
