#pragma once
#include "types.h"
#include <QString>

struct ConfigFailure {
    FailureKind kind = FailureKind::InvalidConfig;
    QString     key;
    QString     value;
    QString     message;

    QString kindName() const;
    QString toString() const;

    static ConfigFailure unknownAction(const QString& key, const QString& value);
    static ConfigFailure unknownType(const QString& key, const QString& typeName);
    static ConfigFailure invalidPattern(const QString& key, const QString& pattern,
                                        const QString& reason);
    static ConfigFailure duplicateRule(const QString& key, const QString& otherKey);
    static ConfigFailure duplicateType(const QString& typeName);
    static ConfigFailure unknownParent(const QString& typeName, const QString& parentName);
    static ConfigFailure invalidConfig(const QString& msg);
    static ConfigFailure notFound(const QString& path);
};
