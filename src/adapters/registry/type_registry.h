#pragma once
#include "classify/ports.h"
#include <QHash>
#include <QReadWriteLock>
#include <QStringList>

// Table of error types with declared parent links. Every type descends from
// the root "Error"; "SqlError" is pre-registered as the type of errors that
// carry an error code.
class TypeRegistry : public ITypeResolver {
public:
    static constexpr const char* ROOT_TYPE = "Error";
    static constexpr const char* SQL_ERROR_TYPE = "SqlError";

    TypeRegistry();

    // An empty parent name attaches the type to the root.
    Result<ErrorType> registerType(const QString& name, const QString& parentName = {});

    Result<ErrorType> resolve(const QString& qualifiedName) const override;
    ErrorType errorCodeType() const override { return m_sqlError; }

    ErrorType rootType() const { return m_root; }
    bool contains(const QString& name) const;
    QStringList typeNames() const;

private:
    ErrorType addNode(const QString& name, const ErrorType& parent);

    mutable QReadWriteLock m_lock;
    QHash<QString, ErrorType> m_types;
    ErrorType m_root;
    ErrorType m_sqlError;
};
