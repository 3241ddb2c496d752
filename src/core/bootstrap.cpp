#include "bootstrap.h"
#include "log_manager.h"
#include "adapters/registry/type_registry.h"
#include "config/rule_source.h"

Bootstrap::Bootstrap(TypeRegistry& registry)
    : m_registry(registry)
{
}

VoidResult Bootstrap::applyLogging(const LoggingOptions& options) {
    const auto level = LogManager::parseLevel(options.level);
    if (!level) {
        return std::unexpected(ConfigFailure{
            FailureKind::InvalidConfig, QStringLiteral("logging.level"), options.level,
            QStringLiteral("unknown log level")});
    }
    LogManager::instance().setMinimumLevel(*level);

    if (!options.logDir.isEmpty() && !LogManager::instance().initialize(options.logDir)) {
        return std::unexpected(ConfigFailure::notFound(options.logDir));
    }
    return {};
}

VoidResult Bootstrap::registerTypes(const QList<TypeDeclaration>& types) {
    QList<TypeDeclaration> pending = types;
    while (!pending.isEmpty()) {
        QList<TypeDeclaration> deferred;
        for (const auto& decl : pending) {
            if (!decl.parent.isEmpty() && !m_registry.contains(decl.parent)) {
                deferred.append(decl);
                continue;
            }
            auto type = m_registry.registerType(decl.name, decl.parent);
            if (!type)
                return std::unexpected(type.error());
        }

        // No progress: the first deferred parent is missing or part of a cycle.
        if (deferred.size() == pending.size()) {
            const auto& decl = deferred.first();
            return std::unexpected(ConfigFailure::unknownParent(decl.name, decl.parent));
        }
        pending = deferred;
    }
    return {};
}

Result<QMap<QString, QString>> Bootstrap::collectRules(const ClassifierConfig& config) const {
    QMap<QString, QString> rules;
    if (!config.rulesFile.isEmpty()) {
        auto fromFile = RuleSource::loadFile(config.rulesFile);
        if (!fromFile)
            return std::unexpected(fromFile.error());
        rules = *fromFile;
    }

    for (auto it = config.rules.cbegin(); it != config.rules.cend(); ++it) {
        if (rules.contains(it.key()) && rules.value(it.key()) != it.value()) {
            LOG_WARNING(QStringLiteral("Inline rule %1=%2 overrides %3 from %4")
                            .arg(it.key(), it.value(), rules.value(it.key()), config.rulesFile));
        }
        rules.insert(it.key(), it.value());
    }
    return rules;
}

Result<ErrorClassifier::Ptr> Bootstrap::build(const ClassifierConfig& config) {
    LOG_INFO(QStringLiteral("[1/3] Registering %1 error types...").arg(config.types.size()));
    auto registered = registerTypes(config.types);
    if (!registered) {
        LOG_ERROR(registered.error().toString());
        return std::unexpected(registered.error());
    }

    LOG_INFO(QStringLiteral("[2/3] Collecting rules..."));
    auto rules = collectRules(config);
    if (!rules) {
        LOG_ERROR(rules.error().toString());
        return std::unexpected(rules.error());
    }

    LOG_INFO(QStringLiteral("[3/3] Building classifier from %1 rules...").arg(rules->size()));
    auto classifier = ErrorClassifier::fromMap(*rules, m_registry);
    if (!classifier) {
        LOG_ERROR(classifier.error().toString());
        return std::unexpected(classifier.error());
    }
    return classifier;
}
