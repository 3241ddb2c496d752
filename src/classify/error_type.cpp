#include "error_type.h"

QString ErrorType::name() const {
    return m_node ? m_node->name : QString();
}

ErrorType ErrorType::parent() const {
    return m_node ? m_node->parent : ErrorType();
}

int ErrorType::depth() const {
    return m_node ? m_node->depth : -1;
}

bool ErrorType::isSameOrDescendantOf(const ErrorType& ancestor) const {
    if (!m_node || !ancestor.m_node)
        return false;
    for (const Node* n = m_node.get(); n; n = n->parent.m_node.get()) {
        if (n == ancestor.m_node.get())
            return true;
    }
    return false;
}

bool ErrorType::isStrictDescendantOf(const ErrorType& ancestor) const {
    return *this != ancestor && isSameOrDescendantOf(ancestor);
}
