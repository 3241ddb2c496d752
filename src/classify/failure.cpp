#include "failure.h"

QString ConfigFailure::kindName() const {
    switch (kind) {
    case FailureKind::UnknownAction:  return QStringLiteral("unknown_action");
    case FailureKind::UnknownType:    return QStringLiteral("unknown_type");
    case FailureKind::InvalidPattern: return QStringLiteral("invalid_pattern");
    case FailureKind::DuplicateRule:  return QStringLiteral("duplicate_rule");
    case FailureKind::DuplicateType:  return QStringLiteral("duplicate_type");
    case FailureKind::UnknownParent:  return QStringLiteral("unknown_parent");
    case FailureKind::NotFound:       return QStringLiteral("not_found");
    case FailureKind::InvalidConfig:
    default:                          return QStringLiteral("invalid_config");
    }
}

QString ConfigFailure::toString() const {
    QString out = QStringLiteral("%1: %2").arg(kindName(), message);
    if (!key.isEmpty())
        out += QStringLiteral(" [key=%1]").arg(key);
    if (!value.isEmpty())
        out += QStringLiteral(" [value=%1]").arg(value);
    return out;
}

ConfigFailure ConfigFailure::unknownAction(const QString& key, const QString& value) {
    return {FailureKind::UnknownAction, key, value,
            QStringLiteral("action must be RETRY or THROW, got \"%1\"").arg(value)};
}

ConfigFailure ConfigFailure::unknownType(const QString& key, const QString& typeName) {
    return {FailureKind::UnknownType, key, typeName,
            QStringLiteral("unknown error type \"%1\"").arg(typeName)};
}

ConfigFailure ConfigFailure::invalidPattern(const QString& key, const QString& pattern,
                                            const QString& reason) {
    return {FailureKind::InvalidPattern, key, pattern,
            QStringLiteral("malformed pattern \"%1\": %2").arg(pattern, reason)};
}

ConfigFailure ConfigFailure::duplicateRule(const QString& key, const QString& otherKey) {
    return {FailureKind::DuplicateRule, key, otherKey,
            QStringLiteral("rule \"%1\" has the same target as \"%2\"").arg(key, otherKey)};
}

ConfigFailure ConfigFailure::duplicateType(const QString& typeName) {
    return {FailureKind::DuplicateType, typeName, {},
            QStringLiteral("error type \"%1\" is already registered").arg(typeName)};
}

ConfigFailure ConfigFailure::unknownParent(const QString& typeName, const QString& parentName) {
    return {FailureKind::UnknownParent, typeName, parentName,
            QStringLiteral("parent \"%1\" of error type \"%2\" is not registered")
                .arg(parentName, typeName)};
}

ConfigFailure ConfigFailure::invalidConfig(const QString& msg) {
    return {FailureKind::InvalidConfig, {}, {}, msg};
}

ConfigFailure ConfigFailure::notFound(const QString& path) {
    return {FailureKind::NotFound, {}, path,
            QStringLiteral("cannot open \"%1\"").arg(path)};
}
