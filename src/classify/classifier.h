#pragma once
#include "ports.h"
#include "rule.h"
#include <QHash>
#include <QList>
#include <QMap>
#include <QReadWriteLock>
#include <memory>
#include <optional>

struct Decision {
    Action action = Action::Ignore;     // Ignore: no rule matched
    std::optional<Rule> rule;
    ErrorType matchedType;

    bool shouldRetry() const { return action == Action::Retry; }
};

// Classifies errors as retryable or not according to a fixed rule set.
//
// Rule keys have the forms
//
//   TypeName = ACTION
//   TypeName;regex = ACTION
//   sqlState.40001 = ACTION
//   sqlState.40001;regex = ACTION
//
// where ACTION is RETRY or THROW. A regex restricts the rule to errors whose
// message contains a match. Root causes are consulted before the errors that
// wrap them; within one error the most specific applicable rule wins.
//
// Instances are immutable apart from an internal per-type cache and may be
// shared between threads.
class ErrorClassifier {
    // Only the factories can name this, so only they can construct.
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    using Ptr = std::shared_ptr<const ErrorClassifier>;

    ErrorClassifier(ConstructionKey, QList<Rule> sortedRules);

    static Result<Ptr> fromMap(const QMap<QString, QString>& rules,
                               const ITypeResolver& resolver);
    static Result<Ptr> fromFile(const QString& path, const ITypeResolver& resolver);
    static Result<Ptr> fromResource(const QString& name, const ITypeResolver& resolver);

    ErrorClassifier(const ErrorClassifier&) = delete;
    ErrorClassifier& operator=(const ErrorClassifier&) = delete;

    bool shouldRetry(const RaisedError& error) const;
    Decision classify(const RaisedError& error) const;

    // Rules applicable to errors of exactly `type`, in evaluation order.
    QList<Rule> findRulesFor(const ErrorType& type) const;

    const QList<Rule>& rules() const { return m_rules; }
    int cachedTypeCount() const;

private:
    static Result<Rule> parseRule(const QString& key, const QString& value,
                                  const ITypeResolver& resolver);

    const QList<Rule> m_rules;

    mutable QReadWriteLock m_cacheLock;
    mutable QHash<ErrorType, QList<Rule>> m_applicableRules;
};
