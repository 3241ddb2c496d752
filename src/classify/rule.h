#pragma once
#include "types.h"
#include "raised_error.h"
#include <QList>
#include <QRegularExpression>
#include <QString>
#include <optional>

class Rule {
public:
    static constexpr const char* SQL_STATE_PREFIX = "sqlState.";

    Rule(Action action,
         ErrorType target,
         std::optional<QString> errorCode = std::nullopt,
         std::optional<QRegularExpression> pattern = std::nullopt);

    Action action() const { return m_action; }
    const ErrorType& target() const { return m_target; }
    const std::optional<QString>& errorCode() const { return m_errorCode; }
    const std::optional<QRegularExpression>& pattern() const { return m_pattern; }
    QString patternText() const;

    bool appliesTo(const ErrorType& type) const;

    // Returns the configured action if this rule matches the error, or
    // Action::Ignore. `message` is passed separately so the caller fetches
    // it once per error rather than once per rule.
    Action decide(const RaisedError& error, const std::optional<QString>& message) const;

    // True when both rules select exactly the same errors.
    bool sameTarget(const Rule& other) const;

    // <0 if a takes precedence over b, >0 if b over a, 0 if tied.
    static int compare(const Rule& a, const Rule& b);
    static bool precedes(const Rule& a, const Rule& b) { return compare(a, b) < 0; }

    // Puts rules into evaluation order: a rule for a more specific type always
    // comes before rules for its ancestors, remaining ties follow compare().
    static QList<Rule> sortByPrecedence(const QList<Rule>& rules);

    // Renders the rule in configuration form, e.g. "sqlState.40001;throw=THROW".
    QString toString() const;

private:
    Action m_action;
    ErrorType m_target;
    std::optional<QString> m_errorCode;
    std::optional<QRegularExpression> m_pattern;
};
