#pragma once

#include <utility>

namespace resumedl {

// Runs a callable when the enclosing scope exits, on every path.
template <typename FunctionT>
class deferred {
public:
    explicit deferred(FunctionT&& function) : m_function(std::forward<FunctionT>(function)) {}

    deferred(const deferred&) = delete;
    deferred& operator=(const deferred&) = delete;

    deferred(deferred&& other) : m_function(std::move(other.m_function)), m_armed(other.m_armed) {
        other.m_armed = false;
    }
    deferred& operator=(deferred&&) = delete;

    ~deferred() {
        if (m_armed) {
            m_function();
        }
    }

private:
    FunctionT m_function;
    bool m_armed = true;
};

template <typename FunctionT>
auto make_deferred(FunctionT&& function) {
    return deferred<FunctionT>(std::forward<FunctionT>(function));
}

} // namespace resumedl

#define RESUMEDL_CONCAT_IMPL(a, b) a##b
#define RESUMEDL_CONCAT(a, b) RESUMEDL_CONCAT_IMPL(a, b)
#define RESUMEDL_UNIQUE_VAR_NAME(prefix) RESUMEDL_CONCAT(prefix, __COUNTER__)

#define RESUMEDL_DEFER_IMPL(varname, content)                                                      \
    auto varname = ::resumedl::make_deferred([&]() { content })
#define DEFER(content) RESUMEDL_DEFER_IMPL(RESUMEDL_UNIQUE_VAR_NAME(deferred_holder_), content)
