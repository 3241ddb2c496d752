#pragma once
#include "config_types.h"
#include "classify/ports.h"
#include <QByteArray>
#include <QJsonObject>

class ConfigStore {
public:
    ConfigStore() = default;

    VoidResult load(const QString& path);

    // Relative paths in the document are resolved against baseDir.
    VoidResult loadFromJson(const QByteArray& json, const QString& baseDir = {});

    const ClassifierConfig& config() const { return m_config; }
    QString filePath() const { return m_filePath; }

private:
    ClassifierConfig m_config;
    QString m_filePath;

    Result<TypeDeclaration> jsonToType(const QJsonObject& obj, int index) const;
};
