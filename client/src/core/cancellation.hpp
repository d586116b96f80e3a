#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace resumedl {

enum class cancel_cause {
    none,
    deadline_exceeded,
};

class cancellation_context;
using context_ptr = std::shared_ptr<cancellation_context>;

// A node in a tree of cancellable contexts. Cancelling a node cancels all of its
// descendants with the same cause. The first cancellation to arrive decides the cause;
// later ones are no-ops.
class cancellation_context {
public:
    using callback_id = std::size_t;

    // Root context that can be cancelled explicitly.
    static context_ptr create();
    // Context cancelled when `parent` is, or when cancelled itself.
    static context_ptr with_parent(const context_ptr& parent);

    ~cancellation_context();

    cancellation_context(const cancellation_context&) = delete;
    cancellation_context& operator=(const cancellation_context&) = delete;

    void cancel(cancel_cause cause = cancel_cause::none);

    bool is_cancelled() const;
    cancel_cause cause() const;

    // Registers `fn` to run once on cancellation. Runs it immediately (on the calling
    // thread) when the context is already cancelled.
    callback_id on_cancel(std::function<void()> fn);
    void remove_on_cancel(callback_id id);

    // Throws timeout_error or cancelled_error according to cause(). Only valid once cancelled.
    [[noreturn]] void throw_cancelled() const;

private:
    cancellation_context() = default;

    mutable std::mutex m_mutex;
    bool m_cancelled = false;
    cancel_cause m_cause = cancel_cause::none;
    callback_id m_next_id = 1;
    std::map<callback_id, std::function<void()>> m_callbacks;

    context_ptr m_parent;
    callback_id m_parent_registration = 0;
};

} // namespace resumedl
