#pragma once
#include "error_type.h"
#include <QString>
#include <QList>
#include <memory>
#include <optional>

// An error as seen by the classifier: its runtime type, an optional message,
// an optional error code (SQLSTATE) and the error it wraps, if any.
struct RaisedError {
    ErrorType type;
    std::optional<QString> message;
    std::optional<QString> errorCode;
    std::shared_ptr<const RaisedError> cause;

    bool hasErrorCode() const { return errorCode.has_value(); }
    const RaisedError* causeError() const { return cause.get(); }

    // Errors from this one outward to its root cause, outermost first.
    QList<const RaisedError*> chain() const;

    QString toString() const;

    static RaisedError of(const ErrorType& type);
    static RaisedError of(const ErrorType& type, const QString& message);
    static RaisedError withCode(const ErrorType& type, const QString& message,
                                const std::optional<QString>& code);

    RaisedError causedBy(RaisedError inner) const;
};
