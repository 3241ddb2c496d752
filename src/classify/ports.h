#pragma once
#include "error_type.h"
#include "failure.h"
#include <expected>
#include <QString>

template<typename T>
using Result = std::expected<T, ConfigFailure>;

using VoidResult = std::expected<void, ConfigFailure>;

class ITypeResolver {
public:
    virtual ~ITypeResolver() = default;

    // Maps a qualified type name to its hierarchy node.
    virtual Result<ErrorType> resolve(const QString& qualifiedName) const = 0;

    // The generic type of errors that carry an error code; target of
    // "sqlState." rules.
    virtual ErrorType errorCodeType() const = 0;
};
