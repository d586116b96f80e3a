#include "core/cancellation.hpp"

#include "core/errors.hpp"

#include <utility>
#include <vector>

namespace resumedl {

context_ptr cancellation_context::create() {
    return context_ptr(new cancellation_context());
}

context_ptr cancellation_context::with_parent(const context_ptr& parent) {
    context_ptr child = create();
    if (!parent) {
        return child;
    }

    child->m_parent = parent;
    // The parent must not keep the child alive.
    std::weak_ptr<cancellation_context> weak_child = child;
    std::weak_ptr<cancellation_context> weak_parent = parent;
    child->m_parent_registration = parent->on_cancel([weak_child, weak_parent]() {
        auto c = weak_child.lock();
        auto p = weak_parent.lock();
        if (c && p) {
            c->cancel(p->cause());
        }
    });
    return child;
}

cancellation_context::~cancellation_context() {
    if (m_parent && m_parent_registration != 0) {
        m_parent->remove_on_cancel(m_parent_registration);
    }
}

void cancellation_context::cancel(cancel_cause cause) {
    std::map<callback_id, std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_cancelled) {
            return;
        }
        m_cancelled = true;
        m_cause = cause;
        callbacks.swap(m_callbacks);
    }

    for (auto& entry : callbacks) {
        entry.second();
    }
}

bool cancellation_context::is_cancelled() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cancelled;
}

cancel_cause cancellation_context::cause() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cause;
}

cancellation_context::callback_id cancellation_context::on_cancel(std::function<void()> fn) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_cancelled) {
            callback_id id = m_next_id++;
            m_callbacks.emplace(id, std::move(fn));
            return id;
        }
    }
    fn();
    return 0;
}

void cancellation_context::remove_on_cancel(callback_id id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_callbacks.erase(id);
}

void cancellation_context::throw_cancelled() const {
    if (cause() == cancel_cause::deadline_exceeded) {
        throw timeout_error();
    }
    throw cancelled_error();
}

} // namespace resumedl
