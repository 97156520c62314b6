/**
 * @file test_signal.cpp
 * @brief Unit tests for owner-scoped signals and reentrant emission.
 */

#include <catch2/catch_test_macros.hpp>

#include "nodeflow/core/errors.hpp"
#include "nodeflow/scene/scene_tree.hpp"
#include "nodeflow/scene/signal.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace nodeflow;
using namespace nodeflow::scene;

// =============================================================================
// Connection bookkeeping
// =============================================================================

TEST_CASE("Signal: bound arguments come before emitted ones", "[scene][signal]") {
    SceneTree tree;
    Node owner = tree.create_node("Owner");
    Node observer = tree.create_node("Observer");
    Signal<int> hit(tree.registry(), owner.id(), "hit");

    std::vector<int> seen;
    hit.connect(owner.id(), observer.id(), [&](int bound, const std::string& tag, int damage) {
        seen.push_back(bound);
        seen.push_back(static_cast<int>(tag.size()));
        seen.push_back(damage);
    }, 10, std::string("abc"));

    hit.emit(3);

    REQUIRE(seen == std::vector<int>{10, 3, 3});
}

TEST_CASE("Signal: only the owner may connect or disconnect", "[scene][signal]") {
    SceneTree tree;
    Node owner = tree.create_node("Owner");
    Node stranger = tree.create_node("Stranger");
    Signal<> ping(tree.registry(), owner.id(), "ping");

    REQUIRE_THROWS_AS(ping.connect(stranger.id(), stranger.id(), [] {}), SignalNotOwner);

    ping.connect(owner.id(), stranger.id(), [] {});
    REQUIRE_THROWS_AS(ping.disconnect(stranger.id(), stranger.id()), SignalNotOwner);
    REQUIRE_THROWS_AS(ping.disconnect_all(stranger.id()), SignalNotOwner);
    REQUIRE(ping.is_connected(stranger.id()));
}

TEST_CASE("Signal: one connection per observer", "[scene][signal]") {
    SceneTree tree;
    Node owner = tree.create_node("Owner");
    Node observer = tree.create_node("Observer");
    Signal<> ping(tree.registry(), owner.id(), "ping");

    ping.connect(owner.id(), observer.id(), [] {});
    REQUIRE_THROWS_AS(ping.connect(owner.id(), observer.id(), [] {}), AlreadyConnected);
    REQUIRE(ping.observer_count() == 1);
}

TEST_CASE("Signal: connect, disconnect, emit does not call the observer", "[scene][signal]") {
    SceneTree tree;
    Node owner = tree.create_node("Owner");
    Node observer = tree.create_node("Observer");
    Signal<> ping(tree.registry(), owner.id(), "ping");

    int calls = 0;
    ping.connect(owner.id(), observer.id(), [&] { ++calls; });
    ping.disconnect(owner.id(), observer.id());
    ping.emit();

    REQUIRE(calls == 0);
    REQUIRE_FALSE(ping.is_connected(observer.id()));
    REQUIRE_THROWS_AS(ping.disconnect(owner.id(), observer.id()), NotConnected);

    // The observer may come back.
    ping.connect(owner.id(), observer.id(), [&] { ++calls; });
    ping.emit();
    REQUIRE(calls == 1);
}

TEST_CASE("Signal: observers fire in insertion order", "[scene][signal]") {
    SceneTree tree;
    Node owner = tree.create_node("Owner");
    Signal<> ping(tree.registry(), owner.id(), "ping");

    std::vector<std::string> order;
    for (const char* name : {"C", "A", "B"}) {
        Node n = tree.create_node(name);
        ping.connect(owner.id(), n.id(), [&order, name] { order.emplace_back(name); });
    }

    ping.emit();
    ping.emit();

    REQUIRE(order == std::vector<std::string>{"C", "A", "B", "C", "A", "B"});
}

// =============================================================================
// Reentrancy
// =============================================================================

TEST_CASE("Signal: disconnect during emission is deferred", "[scene][signal][reentrancy]") {
    SceneTree tree;
    Node owner = tree.create_node("Owner");
    Node first = tree.create_node("First");
    Node second = tree.create_node("Second");
    Signal<> ping(tree.registry(), owner.id(), "ping");

    int first_calls = 0;
    int second_calls = 0;

    ping.connect(owner.id(), first.id(), [&] {
        ++first_calls;
        ping.disconnect(owner.id(), first.id());
        ping.disconnect(owner.id(), second.id());
        REQUIRE(ping.is_emitting());
    });
    ping.connect(owner.id(), second.id(), [&] { ++second_calls; });

    ping.emit();

    // Both were present when the emission started.
    REQUIRE(first_calls == 1);
    REQUIRE(second_calls == 1);
    REQUIRE_FALSE(ping.is_emitting());
    REQUIRE(ping.observer_count() == 0);

    ping.emit();
    REQUIRE(first_calls == 1);
    REQUIRE(second_calls == 1);
}

TEST_CASE("Signal: queued disconnect rejects a second request", "[scene][signal][reentrancy]") {
    SceneTree tree;
    Node owner = tree.create_node("Owner");
    Node observer = tree.create_node("Observer");
    Signal<> ping(tree.registry(), owner.id(), "ping");

    bool rejected = false;
    ping.connect(owner.id(), observer.id(), [&] {
        ping.disconnect(owner.id(), observer.id());
        try {
            ping.disconnect(owner.id(), observer.id());
        } catch (const NotConnected&) {
            rejected = true;
        }
    });

    ping.emit();
    REQUIRE(rejected);
}

TEST_CASE("Signal: observers connected during emission wait for the next one", "[scene][signal][reentrancy]") {
    SceneTree tree;
    Node owner = tree.create_node("Owner");
    Node early = tree.create_node("Early");
    Node late = tree.create_node("Late");
    Signal<> ping(tree.registry(), owner.id(), "ping");

    int late_calls = 0;
    ping.connect(owner.id(), early.id(), [&] {
        if (!ping.is_connected(late.id())) {
            ping.connect(owner.id(), late.id(), [&] { ++late_calls; });
        }
    });

    ping.emit();
    REQUIRE(late_calls == 0);

    ping.emit();
    REQUIRE(late_calls == 1);
}

TEST_CASE("Signal: nested emission applies disconnects at the outermost level", "[scene][signal][reentrancy]") {
    SceneTree tree;
    Node owner = tree.create_node("Owner");
    Node observer = tree.create_node("Observer");
    Signal<int> count(tree.registry(), owner.id(), "count");

    std::vector<int> seen;
    count.connect(owner.id(), observer.id(), [&](int depth) {
        seen.push_back(depth);
        if (depth == 0) {
            count.disconnect(owner.id(), observer.id());
            count.emit(1);   // still connected until the outer emission returns
        }
    });

    count.emit(0);

    REQUIRE(seen == std::vector<int>{0, 1});
    REQUIRE(count.observer_count() == 0);
}

TEST_CASE("Signal: exceptions propagate and the emission depth is restored", "[scene][signal]") {
    SceneTree tree;
    Node owner = tree.create_node("Owner");
    Node observer = tree.create_node("Observer");
    Signal<> ping(tree.registry(), owner.id(), "ping");

    ping.connect(owner.id(), observer.id(), [&] {
        ping.disconnect(owner.id(), observer.id());
        throw std::runtime_error("boom");
    });

    REQUIRE_THROWS_AS(ping.emit(), std::runtime_error);
    REQUIRE_FALSE(ping.is_emitting());
    REQUIRE(ping.observer_count() == 0);
}

TEST_CASE("Signal: disconnect_all during emission", "[scene][signal][reentrancy]") {
    SceneTree tree;
    Node owner = tree.create_node("Owner");
    Node a = tree.create_node("A");
    Node b = tree.create_node("B");
    Signal<> ping(tree.registry(), owner.id(), "ping");

    int calls = 0;
    ping.connect(owner.id(), a.id(), [&] {
        ++calls;
        ping.disconnect_all(owner.id());
    });
    ping.connect(owner.id(), b.id(), [&] { ++calls; });

    ping.emit();
    REQUIRE(calls == 2);
    REQUIRE(ping.observer_count() == 0);
}

// =============================================================================
// Lifetime
// =============================================================================

TEST_CASE("Signal: freed observers are skipped and dropped", "[scene][signal][lifetime]") {
    SceneTree tree;
    Node owner = tree.create_node("Owner");
    Node observer = tree.create_node("Observer");
    Signal<> ping(tree.registry(), owner.id(), "ping");

    int calls = 0;
    ping.connect(owner.id(), observer.id(), [&] { ++calls; });
    observer.free();

    ping.emit();

    REQUIRE(calls == 0);
    REQUIRE(ping.observer_count() == 0);
}

TEST_CASE("Signal: Entity helpers pass the entity as owner", "[scene][signal]") {
    SceneTree tree;
    Node owner = tree.create_node("Owner");
    Node observer = tree.create_node("Observer");

    int calls = 0;
    owner.connect(owner.freed(), observer.id(), [&](NodeId) { ++calls; });
    REQUIRE_THROWS_AS(observer.connect(owner.freed(), observer.id(), [](NodeId) {}), SignalNotOwner);

    owner.disconnect(owner.freed(), observer.id());
    owner.free();
    REQUIRE(calls == 0);
}
