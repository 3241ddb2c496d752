#pragma once
#include <QString>
#include <QHashFunctions>
#include <memory>
#include <utility>

// Handle to a node of the error-type hierarchy. Handles are issued by
// TypeRegistry and compare by identity; a default-constructed handle is
// invalid and matches nothing.
class ErrorType {
public:
    ErrorType() = default;

    bool isValid() const { return m_node != nullptr; }
    QString name() const;
    ErrorType parent() const;
    int depth() const;

    // True if this type is `ancestor` or inherits from it.
    bool isSameOrDescendantOf(const ErrorType& ancestor) const;
    bool isStrictDescendantOf(const ErrorType& ancestor) const;

    bool operator==(const ErrorType& other) const { return m_node == other.m_node; }
    bool operator!=(const ErrorType& other) const { return m_node != other.m_node; }

    friend size_t qHash(const ErrorType& type, size_t seed = 0) noexcept {
        return qHash(static_cast<const void*>(type.m_node.get()), seed);
    }

private:
    friend class TypeRegistry;

    struct Node;
    explicit ErrorType(std::shared_ptr<const Node> node) : m_node(std::move(node)) {}

    std::shared_ptr<const Node> m_node;
};

struct ErrorType::Node {
    QString   name;
    ErrorType parent;
    int       depth = 0;
};
