#include "action.h"

namespace Actions {

QString name(Action action) {
    switch (action) {
    case Action::Retry:  return QStringLiteral("RETRY");
    case Action::Throw:  return QStringLiteral("THROW");
    case Action::Ignore:
    default:             return QStringLiteral("IGNORE");
    }
}

std::optional<Action> parse(const QString& value) {
    const QString token = value.trimmed().toUpper();
    if (token == QLatin1String("RETRY"))
        return Action::Retry;
    if (token == QLatin1String("THROW"))
        return Action::Throw;
    return std::nullopt;
}

}
