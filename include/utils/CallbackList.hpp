/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CALLBACK_LIST_HPP
#define CALLBACK_LIST_HPP

#include <algorithm>
#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

namespace CloudDefenders {

/**
 * @brief Ordered list of listeners for one notification kind.
 *
 * Listeners are called in registration order. The id returned by add() is
 * the only handle needed to remove a listener again; ids start at 1 so 0 can
 * mean "not registered" at the call site.
 */
template <typename... Args>
class CallbackList {
public:
    using Callback = std::function<void(Args...)>;

    size_t add(Callback callback) {
        if (!callback) return 0;
        const size_t id = ++m_nextId;
        m_listeners.push_back({id, std::move(callback)});
        return id;
    }

    bool remove(size_t id) {
        auto it = std::find_if(m_listeners.begin(), m_listeners.end(),
                               [id](const ListenerInfo& info) { return info.id == id; });
        if (it == m_listeners.end()) return false;
        m_listeners.erase(it);
        return true;
    }

    // Iterates a snapshot, so a listener may add or remove listeners
    void notify(Args... args) const {
        const auto snapshot = m_listeners;
        for (const auto& listener : snapshot) {
            listener.callback(args...);
        }
    }

    void clear() { m_listeners.clear(); }
    size_t size() const { return m_listeners.size(); }
    bool empty() const { return m_listeners.empty(); }

private:
    struct ListenerInfo {
        size_t id;
        Callback callback;
    };

    std::vector<ListenerInfo> m_listeners;
    size_t m_nextId{0};
};

} // namespace CloudDefenders

#endif // CALLBACK_LIST_HPP
