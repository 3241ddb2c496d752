#include "rule.h"
#include "action.h"
#include <set>
#include <vector>

namespace {

int sign(int value) {
    return (value > 0) - (value < 0);
}

// Present values sort before absent ones.
int compareOptional(const std::optional<QString>& a, const std::optional<QString>& b) {
    if (a && b)
        return sign(QString::compare(*a, *b));
    if (a)
        return -1;
    if (b)
        return 1;
    return 0;
}

std::optional<QString> patternSource(const std::optional<QRegularExpression>& pattern) {
    if (!pattern)
        return std::nullopt;
    return pattern->pattern();
}

}

Rule::Rule(Action action,
           ErrorType target,
           std::optional<QString> errorCode,
           std::optional<QRegularExpression> pattern)
    : m_action(action)
    , m_target(std::move(target))
    , m_errorCode(std::move(errorCode))
    , m_pattern(std::move(pattern))
{
}

QString Rule::patternText() const {
    return m_pattern ? m_pattern->pattern() : QString();
}

bool Rule::appliesTo(const ErrorType& type) const {
    return type.isSameOrDescendantOf(m_target);
}

Action Rule::decide(const RaisedError& error, const std::optional<QString>& message) const {
    if (!appliesTo(error.type))
        return Action::Ignore;

    if (m_errorCode) {
        if (!error.errorCode
            || QString::compare(*m_errorCode, *error.errorCode, Qt::CaseInsensitive) != 0)
            return Action::Ignore;
    }

    if (m_pattern) {
        if (!message || !m_pattern->match(*message).hasMatch())
            return Action::Ignore;
    }

    return m_action;
}

bool Rule::sameTarget(const Rule& other) const {
    if (m_errorCode.has_value() != other.m_errorCode.has_value())
        return false;
    if (m_errorCode
        && QString::compare(*m_errorCode, *other.m_errorCode, Qt::CaseInsensitive) != 0)
        return false;
    return m_target == other.m_target
        && patternSource(m_pattern) == patternSource(other.m_pattern);
}

int Rule::compare(const Rule& a, const Rule& b) {
    // More specific targets first; unrelated types give no signal here.
    if (a.m_target != b.m_target) {
        if (b.m_target.isStrictDescendantOf(a.m_target))
            return 1;
        if (a.m_target.isStrictDescendantOf(b.m_target))
            return -1;
    }

    if (int c = sign(QString::compare(a.m_target.name(), b.m_target.name())))
        return c;
    if (int c = compareOptional(a.m_errorCode, b.m_errorCode))
        return c;
    if (int c = compareOptional(patternSource(a.m_pattern), patternSource(b.m_pattern)))
        return c;
    return sign(QString::compare(Actions::name(a.m_action), Actions::name(b.m_action)));
}

QList<Rule> Rule::sortByPrecedence(const QList<Rule>& rules) {
    // compare() only orders related types by specificity, so it is not
    // transitive across unrelated ones. Emit rules in topological order of the
    // "descendant before ancestor" constraints and let compare() pick among
    // the rules that are free to go next; no two of those are related.
    const int n = rules.size();
    std::vector<int> pending(n, 0);
    std::vector<std::vector<int>> successors(n);
    for (int i = 0; i < n; ++i) {
        for (int j = i + 1; j < n; ++j) {
            const ErrorType& ti = rules[i].target();
            const ErrorType& tj = rules[j].target();
            if (ti.isStrictDescendantOf(tj)) {
                successors[i].push_back(j);
                ++pending[j];
            } else if (tj.isStrictDescendantOf(ti)) {
                successors[j].push_back(i);
                ++pending[i];
            }
        }
    }

    auto before = [&rules](int x, int y) {
        const int c = compare(rules[x], rules[y]);
        return c != 0 ? c < 0 : x < y;
    };
    std::set<int, decltype(before)> ready(before);
    for (int i = 0; i < n; ++i) {
        if (pending[i] == 0)
            ready.insert(i);
    }

    QList<Rule> sorted;
    sorted.reserve(n);
    while (!ready.empty()) {
        const int next = *ready.begin();
        ready.erase(ready.begin());
        sorted.append(rules[next]);
        for (int succ : successors[next]) {
            if (--pending[succ] == 0)
                ready.insert(succ);
        }
    }
    return sorted;
}

QString Rule::toString() const {
    QString out = m_errorCode
        ? QString::fromLatin1(SQL_STATE_PREFIX) + *m_errorCode
        : m_target.name();
    if (m_pattern) {
        out += QLatin1Char(';');
        out += m_pattern->pattern();
    }
    out += QLatin1Char('=');
    out += Actions::name(m_action);
    return out;
}
