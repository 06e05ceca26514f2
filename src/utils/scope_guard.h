#ifndef MORK_UTILS_SCOPE_GUARD_H
#define MORK_UTILS_SCOPE_GUARD_H

#include <new>
#include <utility>
#include "expect.h"

namespace Mork {

// Runs a callback when the enclosing scope is left, unless cancelled first.
template<class Callback>
class ScopeGuard final {
public:
    ScopeGuard(Callback cb)
    {
        new (m_callback) Callback(std::move(cb));
        m_constructed = true;
    }

    ~ScopeGuard()
    {
        if (m_constructed) {
            callback()();
            destroy_callback();
        }
    }

    ScopeGuard(ScopeGuard &) = delete;
    void operator=(ScopeGuard &) = delete;

    auto cancel() && -> void
    {
        MORK_EXPECT_TRUE(m_constructed);
        destroy_callback();
    }

    auto invoke() && -> void
    {
        MORK_EXPECT_TRUE(m_constructed);
        callback()();
        destroy_callback();
    }

private:
    auto destroy_callback() -> void
    {
        callback().~Callback();
        m_constructed = false;
    }

    [[nodiscard]] auto callback() -> Callback &
    {
        return *std::launder(reinterpret_cast<Callback *>(m_callback));
    }

    alignas(Callback) char m_callback[sizeof(Callback)];
    bool m_constructed {};
};

} // namespace Mork

#endif // MORK_UTILS_SCOPE_GUARD_H
