#include "raised_error.h"

QList<const RaisedError*> RaisedError::chain() const {
    QList<const RaisedError*> out;
    for (const RaisedError* e = this; e; e = e->causeError())
        out.append(e);
    return out;
}

QString RaisedError::toString() const {
    QString out = type.isValid() ? type.name() : QStringLiteral("<invalid>");
    if (errorCode)
        out += QStringLiteral("[%1]").arg(*errorCode);
    if (message)
        out += QStringLiteral(": %1").arg(*message);
    return out;
}

RaisedError RaisedError::of(const ErrorType& type) {
    RaisedError e;
    e.type = type;
    return e;
}

RaisedError RaisedError::of(const ErrorType& type, const QString& message) {
    RaisedError e;
    e.type = type;
    e.message = message;
    return e;
}

RaisedError RaisedError::withCode(const ErrorType& type, const QString& message,
                                  const std::optional<QString>& code) {
    RaisedError e = of(type, message);
    e.errorCode = code;
    return e;
}

RaisedError RaisedError::causedBy(RaisedError inner) const {
    RaisedError outer = *this;
    outer.cause = std::make_shared<const RaisedError>(std::move(inner));
    return outer;
}
