#pragma once

#include <functional>

namespace strata::core {

// RAII handle for a subscription; disconnects on destruction
class ScopedConnection {
public:
    ScopedConnection() = default;

    explicit ScopedConnection(std::function<void()> disconnect_fn)
        : m_disconnect(std::move(disconnect_fn)) {}

    ~ScopedConnection() {
        disconnect();
    }

    // Non-copyable
    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    // Movable
    ScopedConnection(ScopedConnection&& other) noexcept
        : m_disconnect(std::move(other.m_disconnect)) {
        other.m_disconnect = nullptr;
    }

    ScopedConnection& operator=(ScopedConnection&& other) noexcept {
        if (this != &other) {
            disconnect();
            m_disconnect = std::move(other.m_disconnect);
            other.m_disconnect = nullptr;
        }
        return *this;
    }

    void disconnect() {
        if (m_disconnect) {
            auto fn = std::move(m_disconnect);
            m_disconnect = nullptr;
            fn();
        }
    }

    bool connected() const {
        return m_disconnect != nullptr;
    }

    // Release ownership without disconnecting
    void release() {
        m_disconnect = nullptr;
    }

private:
    std::function<void()> m_disconnect;
};

} // namespace strata::core
