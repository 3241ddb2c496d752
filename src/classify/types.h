#pragma once
#include <QtGlobal>

enum class Action : quint8 {
    Retry,
    Throw,
    Ignore    // rule does not apply; never configurable
};

enum class FailureKind : quint8 {
    UnknownAction,
    UnknownType,
    InvalidPattern,
    DuplicateRule,
    DuplicateType,
    UnknownParent,
    InvalidConfig,
    NotFound
};
