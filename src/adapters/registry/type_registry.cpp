#include "type_registry.h"
#include "core/log_manager.h"
#include <QReadLocker>
#include <QWriteLocker>
#include <algorithm>

TypeRegistry::TypeRegistry()
{
    m_root = addNode(QLatin1String(ROOT_TYPE), ErrorType());
    m_sqlError = addNode(QLatin1String(SQL_ERROR_TYPE), m_root);
}

ErrorType TypeRegistry::addNode(const QString& name, const ErrorType& parent) {
    auto node = std::make_shared<ErrorType::Node>();
    node->name = name;
    node->parent = parent;
    node->depth = parent.isValid() ? parent.depth() + 1 : 0;
    ErrorType type(std::move(node));
    m_types.insert(name, type);
    return type;
}

Result<ErrorType> TypeRegistry::registerType(const QString& name, const QString& parentName) {
    const QString trimmed = name.trimmed();
    if (trimmed.isEmpty())
        return std::unexpected(ConfigFailure::invalidConfig(
            QStringLiteral("error type name must not be empty")));

    QWriteLocker locker(&m_lock);
    if (m_types.contains(trimmed))
        return std::unexpected(ConfigFailure::duplicateType(trimmed));

    ErrorType parent = m_root;
    if (!parentName.trimmed().isEmpty()) {
        auto it = m_types.constFind(parentName.trimmed());
        if (it == m_types.cend())
            return std::unexpected(ConfigFailure::unknownParent(trimmed, parentName.trimmed()));
        parent = it.value();
    }

    ErrorType type = addNode(trimmed, parent);
    LogManager::instance().log(LogManager::Debug, QStringLiteral("registry"),
                               QStringLiteral("Registered %1 : %2").arg(trimmed, parent.name()));
    return type;
}

Result<ErrorType> TypeRegistry::resolve(const QString& qualifiedName) const {
    QReadLocker locker(&m_lock);
    auto it = m_types.constFind(qualifiedName);
    if (it == m_types.cend())
        return std::unexpected(ConfigFailure::unknownType(qualifiedName, qualifiedName));
    return it.value();
}

bool TypeRegistry::contains(const QString& name) const {
    QReadLocker locker(&m_lock);
    return m_types.contains(name);
}

QStringList TypeRegistry::typeNames() const {
    QReadLocker locker(&m_lock);
    QStringList names = m_types.keys();
    std::sort(names.begin(), names.end());
    return names;
}
