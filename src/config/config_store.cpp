#include "config_store.h"
#include "core/log_manager.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

namespace {

QJsonValue jsonValueEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey)
{
    const QString snake = QString::fromUtf8(snakeKey);
    if (obj.contains(snake))
        return obj.value(snake);
    return obj.value(QString::fromUtf8(camelKey));
}

QString jsonStringEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey)
{
    return jsonValueEither(obj, snakeKey, camelKey).toString();
}

QString resolvePath(const QString& baseDir, const QString& path)
{
    if (path.isEmpty() || baseDir.isEmpty() || QFileInfo(path).isAbsolute())
        return path;
    return QDir(baseDir).absoluteFilePath(path);
}

}

VoidResult ConfigStore::load(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_ERROR(QStringLiteral("Cannot open config file: %1").arg(path));
        return std::unexpected(ConfigFailure::notFound(path));
    }

    auto loaded = loadFromJson(file.readAll(), QFileInfo(path).absolutePath());
    if (!loaded)
        return loaded;

    m_filePath = path;
    LogManager::instance().log(LogManager::Info, QStringLiteral("config"),
                               QStringLiteral("Loaded config %1 (%2 types, %3 inline rules)")
                                   .arg(path)
                                   .arg(m_config.types.size())
                                   .arg(m_config.rules.size()));
    return {};
}

VoidResult ConfigStore::loadFromJson(const QByteArray& json, const QString& baseDir) {
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return std::unexpected(ConfigFailure::invalidConfig(
            QStringLiteral("invalid JSON at offset %1: %2")
                .arg(parseError.offset)
                .arg(parseError.errorString())));
    }
    if (!doc.isObject())
        return std::unexpected(ConfigFailure::invalidConfig(
            QStringLiteral("config root must be a JSON object")));

    QJsonObject root = doc.object();
    ClassifierConfig config;

    // types
    QJsonValue types = root.value(QStringLiteral("types"));
    if (!types.isUndefined() && !types.isArray())
        return std::unexpected(ConfigFailure::invalidConfig(
            QStringLiteral("\"types\" must be an array")));
    const QJsonArray typeArray = types.toArray();
    for (int i = 0; i < typeArray.size(); ++i) {
        auto decl = jsonToType(typeArray.at(i).toObject(), i);
        if (!decl)
            return std::unexpected(decl.error());
        config.types.append(*decl);
    }

    // rules
    config.rulesFile = resolvePath(baseDir, jsonStringEither(root, "rules_file", "rulesFile"));
    QJsonValue rules = root.value(QStringLiteral("rules"));
    if (!rules.isUndefined() && !rules.isObject())
        return std::unexpected(ConfigFailure::invalidConfig(
            QStringLiteral("\"rules\" must be an object of key/action pairs")));
    const QJsonObject ruleObject = rules.toObject();
    for (auto it = ruleObject.begin(); it != ruleObject.end(); ++it) {
        if (!it.value().isString()) {
            return std::unexpected(ConfigFailure{
                FailureKind::InvalidConfig, it.key(), {},
                QStringLiteral("rule action must be a string")});
        }
        config.rules.insert(it.key(), it.value().toString());
    }

    // logging
    QJsonObject logging = root.value(QStringLiteral("logging")).toObject();
    config.logging.logDir = resolvePath(baseDir, jsonStringEither(logging, "log_dir", "logDir"));
    const QString level = logging.value(QStringLiteral("level")).toString();
    if (!level.isEmpty()) {
        if (!LogManager::parseLevel(level)) {
            return std::unexpected(ConfigFailure{
                FailureKind::InvalidConfig, QStringLiteral("logging.level"), level,
                QStringLiteral("unknown log level")});
        }
        config.logging.level = level;
    }

    m_config = config;
    return {};
}

Result<TypeDeclaration> ConfigStore::jsonToType(const QJsonObject& obj, int index) const {
    TypeDeclaration decl;
    decl.name = obj.value(QStringLiteral("name")).toString().trimmed();
    decl.parent = jsonStringEither(obj, "parent", "extends").trimmed();
    if (decl.name.isEmpty()) {
        return std::unexpected(ConfigFailure::invalidConfig(
            QStringLiteral("types[%1] has no name").arg(index)));
    }
    return decl;
}
