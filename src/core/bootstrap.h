#pragma once
#include "classify/classifier.h"
#include "config/config_types.h"

class TypeRegistry;

// Turns a loaded ClassifierConfig into a populated type registry and a
// classifier built from the configured rules.
class Bootstrap {
public:
    explicit Bootstrap(TypeRegistry& registry);

    static VoidResult applyLogging(const LoggingOptions& options);

    // Declarations may name parents declared later in the list.
    VoidResult registerTypes(const QList<TypeDeclaration>& types);

    // Rules file entries merged with inline rules; inline entries win.
    Result<QMap<QString, QString>> collectRules(const ClassifierConfig& config) const;

    Result<ErrorClassifier::Ptr> build(const ClassifierConfig& config);

private:
    TypeRegistry& m_registry;
};
