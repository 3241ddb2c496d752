#include "classifier.h"
#include "action.h"
#include "config/rule_source.h"
#include "core/log_manager.h"
#include <QReadLocker>
#include <QStringList>
#include <QWriteLocker>

namespace {

const QString kCategory = QStringLiteral("classifier");

bool debugEnabled() {
    return LogManager::instance().isEnabled(LogManager::Debug);
}

void logDebug(const QString& message) {
    LogManager::instance().log(LogManager::Debug, kCategory, message);
}

}

ErrorClassifier::ErrorClassifier(ConstructionKey, QList<Rule> sortedRules)
    : m_rules(std::move(sortedRules))
{
}

Result<ErrorClassifier::Ptr> ErrorClassifier::fromMap(const QMap<QString, QString>& rules,
                                                      const ITypeResolver& resolver) {
    QList<Rule> parsed;
    QList<QString> keys;
    parsed.reserve(rules.size());
    keys.reserve(rules.size());

    for (auto it = rules.cbegin(); it != rules.cend(); ++it) {
        if (debugEnabled())
            logDebug(QStringLiteral("Raw key/value: %1 = %2").arg(it.key(), it.value()));

        auto rule = parseRule(it.key(), it.value(), resolver);
        if (!rule)
            return std::unexpected(rule.error());

        for (int i = 0; i < parsed.size(); ++i) {
            if (parsed[i].sameTarget(*rule))
                return std::unexpected(ConfigFailure::duplicateRule(it.key(), keys[i]));
        }
        parsed.append(*rule);
        keys.append(it.key());
    }

    Ptr classifier = std::make_shared<const ErrorClassifier>(ConstructionKey{},
                                                             Rule::sortByPrecedence(parsed));

    if (debugEnabled()) {
        logDebug(QStringLiteral("Sorted rule set follows"));
        for (const auto& r : classifier->rules())
            logDebug(r.toString());
    }
    return classifier;
}

Result<ErrorClassifier::Ptr> ErrorClassifier::fromFile(const QString& path,
                                                       const ITypeResolver& resolver) {
    auto rules = RuleSource::loadFile(path);
    if (!rules)
        return std::unexpected(rules.error());
    return fromMap(*rules, resolver);
}

Result<ErrorClassifier::Ptr> ErrorClassifier::fromResource(const QString& name,
                                                           const ITypeResolver& resolver) {
    auto rules = RuleSource::loadResource(name);
    if (!rules)
        return std::unexpected(rules.error());
    return fromMap(*rules, resolver);
}

Result<Rule> ErrorClassifier::parseRule(const QString& key, const QString& value,
                                        const ITypeResolver& resolver) {
    const auto action = Actions::parse(value);
    if (!action)
        return std::unexpected(ConfigFailure::unknownAction(key, value));

    const int idx = key.indexOf(QLatin1Char(';'));
    const QString target = idx == -1 ? key : key.left(idx);
    const QString patternText = idx == -1 ? QString() : key.mid(idx + 1);

    std::optional<QRegularExpression> pattern;
    if (!patternText.isEmpty()) {
        QRegularExpression re(patternText);
        if (!re.isValid()) {
            return std::unexpected(ConfigFailure::invalidPattern(
                key, patternText,
                QStringLiteral("%1 at offset %2")
                    .arg(re.errorString())
                    .arg(re.patternErrorOffset())));
        }
        re.optimize();
        pattern = re;
    }

    const QLatin1String prefix(Rule::SQL_STATE_PREFIX);
    if (target.startsWith(prefix)) {
        return Rule(*action, resolver.errorCodeType(), target.mid(prefix.size()), pattern);
    }

    auto type = resolver.resolve(target);
    if (!type)
        return std::unexpected(ConfigFailure::unknownType(key, target));
    return Rule(*action, *type, std::nullopt, pattern);
}

bool ErrorClassifier::shouldRetry(const RaisedError& error) const {
    return classify(error).shouldRetry();
}

Decision ErrorClassifier::classify(const RaisedError& error) const {
    // Innermost cause first.
    const QList<const RaisedError*> chain = error.chain();
    for (auto it = chain.crbegin(); it != chain.crend(); ++it) {
        const RaisedError& ex = **it;
        const std::optional<QString>& message = ex.message;
        for (const Rule& r : findRulesFor(ex.type)) {
            const Action action = r.decide(ex, message);
            if (action == Action::Ignore)
                continue;

            if (debugEnabled()) {
                logDebug(QStringLiteral("%1 -> %2 (rule %3)")
                             .arg(error.toString(), Actions::name(action), r.toString()));
            }
            return {action, r, ex.type};
        }
    }

    if (debugEnabled())
        logDebug(QStringLiteral("No match for error %1").arg(error.toString()));
    return {};
}

QList<Rule> ErrorClassifier::findRulesFor(const ErrorType& type) const {
    {
        QReadLocker locker(&m_cacheLock);
        auto it = m_applicableRules.constFind(type);
        if (it != m_applicableRules.cend())
            return it.value();
    }

    QList<Rule> applicable;
    for (const Rule& r : m_rules) {
        if (r.appliesTo(type))
            applicable.append(r);
    }

    {
        QWriteLocker locker(&m_cacheLock);
        auto it = m_applicableRules.constFind(type);
        if (it != m_applicableRules.cend())
            return it.value();
        m_applicableRules.insert(type, applicable);
    }

    if (debugEnabled()) {
        QStringList names;
        for (const Rule& r : applicable)
            names.append(r.toString());
        logDebug(QStringLiteral("Found rules %1 -> [%2]")
                     .arg(type.name(), names.join(QStringLiteral(", "))));
    }
    return applicable;
}

int ErrorClassifier::cachedTypeCount() const {
    QReadLocker locker(&m_cacheLock);
    return m_applicableRules.size();
}
