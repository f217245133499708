/**
 * @file signals.hpp
 * @brief Thread-safe observer lists for model and engine state
 *
 * State owners (offset table, timeline, clock, exporter) publish
 * changes through Signal<>; the presentation layer subscribes.
 * Slots run on the thread that fires: the caller's for edits and
 * seeks, the tick thread during playback, the worker during export.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>
#include <atomic>
#include <utility>

namespace reelsync {

namespace detail {

/// Slot list shared between a Signal and the Connections it hands out
struct SlotListBase {
    virtual ~SlotListBase() = default;
    virtual void remove(uint64_t id) = 0;
};

} // namespace detail

/**
 * @brief Handle to one connected slot
 *
 * Copyable; disconnect() is safe after the signal has been destroyed.
 */
class Connection {
public:
    Connection() = default;

    [[nodiscard]] bool connected() const {
        return m_id != 0 && !m_list.expired();
    }

    void disconnect() {
        if (auto list = m_list.lock()) {
            list->remove(m_id);
        }
        m_list.reset();
        m_id = 0;
    }

private:
    template<typename... Args>
    friend class Signal;

    Connection(uint64_t id, std::weak_ptr<detail::SlotListBase> list)
        : m_id(id), m_list(std::move(list)) {}

    uint64_t m_id = 0;
    std::weak_ptr<detail::SlotListBase> m_list;
};

/// Connection that disconnects when destroyed or reassigned
class ScopedConnection {
public:
    ScopedConnection() = default;
    explicit ScopedConnection(Connection conn) : m_connection(std::move(conn)) {}
    ~ScopedConnection() { disconnect(); }

    ScopedConnection(ScopedConnection&& other) noexcept
        : m_connection(std::exchange(other.m_connection, Connection())) {}

    ScopedConnection& operator=(ScopedConnection&& other) noexcept {
        if (this != &other) {
            disconnect();
            m_connection = std::exchange(other.m_connection, Connection());
        }
        return *this;
    }

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    void disconnect() { m_connection.disconnect(); }
    [[nodiscard]] bool connected() const { return m_connection.connected(); }

private:
    Connection m_connection;
};

/**
 * @brief Typed signal
 *
 * @code
 *   Signal<int, int> offsetChanged;
 *   auto conn = offsetChanged.connectScoped([](int index, int value) { ... });
 *   offsetChanged.fire(1, 5);
 * @endcode
 *
 * fire() snapshots the slot list and calls it without holding the lock,
 * so slots may connect or disconnect freely. A slot disconnected while
 * a fire() is in progress is skipped if it has not been reached yet.
 */
template<typename... Args>
class Signal {
public:
    using SlotType = std::function<void(Args...)>;

    Signal() : m_list(std::make_shared<SlotList>()) {}

    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    [[nodiscard]] Connection connect(SlotType slot) {
        auto entry = std::make_shared<Entry>();
        entry->func = std::move(slot);

        std::lock_guard lock(m_list->mutex);
        entry->id = m_list->nextId++;
        m_list->entries.push_back(entry);
        return Connection(entry->id, m_list);
    }

    [[nodiscard]] ScopedConnection connectScoped(SlotType slot) {
        return ScopedConnection(connect(std::move(slot)));
    }

    void fire(Args... args) {
        std::vector<std::shared_ptr<Entry>> snapshot;
        {
            std::lock_guard lock(m_list->mutex);
            snapshot = m_list->entries;
        }
        for (const auto& entry : snapshot) {
            if (entry->live.load()) {
                entry->func(args...);
            }
        }
    }

    void disconnectAll() {
        std::lock_guard lock(m_list->mutex);
        for (auto& entry : m_list->entries) {
            entry->live = false;
        }
        m_list->entries.clear();
    }

    [[nodiscard]] size_t slotCount() const {
        std::lock_guard lock(m_list->mutex);
        return m_list->entries.size();
    }

private:
    struct Entry {
        uint64_t id = 0;
        SlotType func;
        std::atomic<bool> live{true};
    };

    struct SlotList : detail::SlotListBase {
        std::mutex mutex;
        std::vector<std::shared_ptr<Entry>> entries;
        uint64_t nextId = 1;

        void remove(uint64_t id) override {
            std::lock_guard lock(mutex);
            for (auto it = entries.begin(); it != entries.end(); ++it) {
                if ((*it)->id == id) {
                    (*it)->live = false;
                    entries.erase(it);
                    return;
                }
            }
        }
    };

    std::shared_ptr<SlotList> m_list;
};

using VoidSignal = Signal<>;

} // namespace reelsync
