#pragma once
#include "adapters/registry/type_registry.h"

// SuperError
// |-- SibError
// `-- SubError
//     `-- SubSubError
// RuntimeError (unrelated wrapper)
// SerializationError : SqlError
struct TestTypes {
    TypeRegistry registry;
    ErrorType super;
    ErrorType sib;
    ErrorType sub;
    ErrorType subSub;
    ErrorType runtime;
    ErrorType serialization;

    TestTypes()
    {
        super = registry.registerType(QStringLiteral("test.SuperError")).value();
        sib = registry.registerType(QStringLiteral("test.SibError"),
                                    QStringLiteral("test.SuperError")).value();
        sub = registry.registerType(QStringLiteral("test.SubError"),
                                    QStringLiteral("test.SuperError")).value();
        subSub = registry.registerType(QStringLiteral("test.SubSubError"),
                                       QStringLiteral("test.SubError")).value();
        runtime = registry.registerType(QStringLiteral("test.RuntimeError")).value();
        serialization = registry.registerType(QStringLiteral("test.SerializationError"),
                                              QStringLiteral("SqlError")).value();
    }
};
