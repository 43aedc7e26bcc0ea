#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace triage {

// Shared cancellation flag. Copies observe the same state.
// Callbacks run once on the cancelling thread, or immediately when registered
// on a token that is already cancelled.
class CancellationToken {
public:
    CancellationToken()
        : m_state(std::make_shared<State>())
    {
    }

    void cancel() const
    {
        std::lock_guard<std::mutex> running(m_state->runMutex);
        std::map<std::uint64_t, std::function<void()>> callbacks;
        {
            std::lock_guard<std::mutex> lock(m_state->mutex);
            if (m_state->cancelled.exchange(true)) {
                return;
            }
            callbacks.swap(m_state->callbacks);
        }
        for (const auto &entry : callbacks) {
            entry.second();
        }
    }

    bool isCancelled() const
    {
        return m_state->cancelled.load();
    }

    // Returns 0 when the callback already ran because the token was cancelled.
    std::uint64_t onCancel(std::function<void()> callback) const
    {
        {
            std::lock_guard<std::mutex> lock(m_state->mutex);
            if (!m_state->cancelled.load()) {
                const std::uint64_t id = ++m_state->nextId;
                m_state->callbacks.emplace(id, std::move(callback));
                return id;
            }
        }
        callback();
        return 0;
    }

    // Blocks while callbacks are running so the caller may release what they capture.
    void removeCallback(std::uint64_t id) const
    {
        std::lock_guard<std::mutex> running(m_state->runMutex);
        std::lock_guard<std::mutex> lock(m_state->mutex);
        m_state->callbacks.erase(id);
    }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::mutex mutex;
        std::mutex runMutex;
        std::uint64_t nextId = 0;
        std::map<std::uint64_t, std::function<void()>> callbacks;
    };

    std::shared_ptr<State> m_state;
};

// Keeps a cancel callback registered for the lifetime of the scope.
class CancelRegistration {
public:
    CancelRegistration(const CancellationToken &token, std::function<void()> callback)
        : m_token(token)
        , m_id(token.onCancel(std::move(callback)))
    {
    }

    ~CancelRegistration()
    {
        if (m_id != 0) {
            m_token.removeCallback(m_id);
        }
    }

    CancelRegistration(const CancelRegistration &) = delete;
    CancelRegistration &operator=(const CancelRegistration &) = delete;

private:
    CancellationToken m_token;
    std::uint64_t m_id;
};

} // namespace triage
