#pragma once
#include "types.h"
#include <QString>
#include <optional>

namespace Actions {
    QString name(Action action);

    // Parses a configured action value. Only RETRY and THROW are accepted,
    // case-insensitively and ignoring surrounding whitespace.
    std::optional<Action> parse(const QString& value);
}
