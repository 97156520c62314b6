#pragma once

// =============================================================================
// Signal - owner-scoped, reentrancy-safe observer list
// =============================================================================
//
// A signal belongs to exactly one entity. Only that entity may connect or
// disconnect observers (Entity::connect / Entity::disconnect pass it for you).
//
// Usage:
//   Signal<NodeId> hit{registry, owner, "hit"};
//   hit.connect(owner, observer, [](int damage, NodeId other) { ... }, 10);
//   hit.emit(other);   // -> callback(10, other)
//
// Disconnects requested while the signal is emitting are queued and applied
// once the outermost emission returns. Observers connected during an emission
// are first invoked by the next one.
//

#include "nodeflow/core/errors.hpp"
#include "nodeflow/scene/types.hpp"

#include <entt/entt.hpp>

#include <algorithm>
#include <cstddef>
#include <deque>
#include <functional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace nodeflow::scene {

template <typename... Args>
class Signal {
public:
    using Callback = std::function<void(Args...)>;

    Signal(entt::registry& registry, NodeId owner, std::string name)
        : registry_(&registry), owner_(owner), name_(std::move(name)) {}

    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;
    Signal(Signal&&) = default;
    Signal& operator=(Signal&&) = default;

    NodeId owner() const { return owner_; }
    const std::string& name() const { return name_; }

    bool is_emitting() const { return depth_ > 0; }
    std::size_t observer_count() const { return connections_.size(); }

    bool is_connected(NodeId observer) const {
        return find_(observer) != connections_.end() && !is_pending_(observer);
    }

    /// Registers `fn` for `observer`. `bound` arguments are passed before the emitted ones.
    template <typename Fn, typename... Bound>
    void connect(NodeId owner, NodeId observer, Fn&& fn, Bound&&... bound) {
        check_owner_(owner, "connect");

        if (find_(observer) != connections_.end()) {
            throw AlreadyConnected("Observer is already connected to signal '" + name_ + "'");
        }

        connections_.push_back(Connection{
            observer, make_callback_(std::forward<Fn>(fn), std::forward<Bound>(bound)...)});
    }

    void disconnect(NodeId owner, NodeId observer) {
        check_owner_(owner, "disconnect");

        auto it = find_(observer);
        if (it == connections_.end() || is_pending_(observer)) {
            throw NotConnected("Observer is not connected to signal '" + name_ + "'");
        }

        if (depth_ > 0) {
            pending_.push_back(observer);
            return;
        }

        connections_.erase(it);
    }

    void disconnect_all(NodeId owner) {
        check_owner_(owner, "disconnect_all");

        if (depth_ > 0) {
            for (const auto& connection : connections_) {
                if (!is_pending_(connection.observer)) {
                    pending_.push_back(connection.observer);
                }
            }
            return;
        }

        connections_.clear();
    }

    void emit(Args... args) {
        EmitGuard guard(*this);

        // Only observers present when the emission started are visited.
        const std::size_t count = connections_.size();
        for (std::size_t i = 0; i < count; ++i) {
            Connection& connection = connections_[i];

            if (!is_alive(*registry_, connection.observer)) {
                if (!is_pending_(connection.observer)) {
                    pending_.push_back(connection.observer);
                }
                continue;
            }

            connection.callback(args...);
        }
    }

private:
    struct Connection {
        NodeId observer{kNullNode};
        Callback callback;
    };

    // Restores the emission depth even when a callback throws.
    class EmitGuard {
    public:
        explicit EmitGuard(Signal& signal) : signal_(signal) {
            ++signal_.depth_;
            state_ = signal_.registry_->ctx().find<ArenaState>();
            if (state_) {
                ++state_->emission_depth;
            }
        }

        ~EmitGuard() {
            if (--signal_.depth_ == 0) {
                signal_.apply_pending_();
            }

            // The signal may be destroyed by the release below; do not touch it afterwards.
            entt::registry* registry = signal_.registry_;
            if (state_ && --state_->emission_depth == 0) {
                release_pending(*registry);
            }
        }

        EmitGuard(const EmitGuard&) = delete;
        EmitGuard& operator=(const EmitGuard&) = delete;

    private:
        Signal& signal_;
        ArenaState* state_{nullptr};
    };

    template <typename Fn, typename... Bound>
    static Callback make_callback_(Fn&& fn, Bound&&... bound) {
        if constexpr (sizeof...(Bound) == 0) {
            return Callback(std::forward<Fn>(fn));
        } else {
            return [fn = std::forward<Fn>(fn),
                    bound = std::make_tuple(std::forward<Bound>(bound)...)](Args... args) mutable {
                std::apply([&](auto&... b) { std::invoke(fn, b..., args...); }, bound);
            };
        }
    }

    void check_owner_(NodeId owner, const char* op) const {
        if (owner != owner_) {
            throw SignalNotOwner(std::string(op) + ": caller does not own signal '" + name_ + "'");
        }
    }

    typename std::deque<Connection>::const_iterator find_(NodeId observer) const {
        return std::find_if(connections_.begin(), connections_.end(),
                            [observer](const Connection& c) { return c.observer == observer; });
    }

    typename std::deque<Connection>::iterator find_(NodeId observer) {
        return std::find_if(connections_.begin(), connections_.end(),
                            [observer](const Connection& c) { return c.observer == observer; });
    }

    bool is_pending_(NodeId observer) const {
        return std::find(pending_.begin(), pending_.end(), observer) != pending_.end();
    }

    void apply_pending_() {
        if (pending_.empty()) {
            return;
        }

        connections_.erase(
            std::remove_if(connections_.begin(), connections_.end(),
                           [this](const Connection& c) { return is_pending_(c.observer); }),
            connections_.end());
        pending_.clear();
    }

    entt::registry* registry_{nullptr};
    NodeId owner_{kNullNode};
    std::string name_;

    // deque: appends during an emission keep references to running callbacks valid.
    std::deque<Connection> connections_;
    std::vector<NodeId> pending_;
    int depth_{0};
};

} // namespace nodeflow::scene
