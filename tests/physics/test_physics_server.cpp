/**
 * @file test_physics_server.cpp
 * @brief Unit tests for collision spaces, detection direction and contact edges.
 */

#include <catch2/catch_test_macros.hpp>

#include "nodeflow/core/errors.hpp"
#include "nodeflow/core/world.hpp"
#include "nodeflow/physics/physics_server.hpp"
#include "test_utils.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

using namespace nodeflow;
using namespace nodeflow::physics;
using namespace test_helpers;

namespace {

bool holds(const std::vector<scene::NodeId>& ids, scene::NodeId id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

/** @brief Counts body_entered / body_exited emissions of one body. */
struct ContactLog {
    std::vector<scene::NodeId> entered;
    std::vector<scene::NodeId> exited;

    void watch(Body& body, scene::NodeId observer) {
        body.connect(body.body_entered(), observer, [this](scene::NodeId id) { entered.push_back(id); });
        body.connect(body.body_exited(), observer, [this](scene::NodeId id) { exited.push_back(id); });
    }
};

} // namespace

// =============================================================================
// Registration & spaces
// =============================================================================

TEST_CASE("PhysicsServer: bodies register when they enter the tree", "[physics][server]") {
    core::World world;
    Body body = make_box_body(world, BodyKind::Area, "Body", {0.0f, 0.0f});
    REQUIRE_FALSE(body.is_registered());
    REQUIRE(world.physics().body_count() == 0);

    world.tree().root().add_child(body);
    REQUIRE(body.is_registered());
    REQUIRE(world.physics().body_count() == 1);

    world.tree().root().remove_child(body);
    REQUIRE_FALSE(body.is_registered());
    REQUIRE(world.physics().body_count() == 0);
    REQUIRE(world.physics().space(BodyKind::Area, 0)->layers.empty());
}

TEST_CASE("PhysicsServer: layers and masks are split into bit buckets", "[physics][server]") {
    core::World world;
    Body body = make_box_body(world, BodyKind::Area, "Body", {0.0f, 0.0f});
    body.set_collision_layer(0b101);
    body.set_collision_mask(0b010);
    world.tree().root().add_child(body);

    const Space* bit0 = world.physics().space(BodyKind::Area, 0);
    const Space* bit1 = world.physics().space(BodyKind::Area, 1);
    const Space* bit2 = world.physics().space(BodyKind::Area, 2);

    REQUIRE(bit0 != nullptr);
    REQUIRE(holds(bit0->layers, body.id()));
    REQUIRE_FALSE(holds(bit0->masks, body.id()));
    REQUIRE(holds(bit1->masks, body.id()));
    REQUIRE(holds(bit2->layers, body.id()));
    REQUIRE(world.physics().space(BodyKind::Area, 3) == nullptr);
    REQUIRE(world.physics().space(BodyKind::Kinematic, 0) == nullptr);

    // Re-indexed on change.
    body.set_collision_layer(0b1000);
    REQUIRE_FALSE(holds(bit0->layers, body.id()));
    REQUIRE(holds(world.physics().space(BodyKind::Area, 3)->layers, body.id()));
}

TEST_CASE("PhysicsServer: a body without shapes registers but never collides", "[physics][server]") {
    core::World world;
    world.physics().set_warn_missing_shape(false);

    Body empty = Body::create(world.physics(), BodyKind::Area, "Empty");
    Body other = make_box_body(world, BodyKind::Area, "Other", {0.0f, 0.0f});
    world.tree().root().add_child(empty);
    world.tree().root().add_child(other);

    REQUIRE(world.physics().body_count() == 2);
    step_physics(world);
    REQUIRE(empty.colliding_bodies().empty());
    REQUIRE(other.last_colliding_bodies().empty());
}

TEST_CASE("PhysicsServer: only live bodies can be inserted", "[physics][server]") {
    core::World world;
    Body body = Body::create(world.physics(), BodyKind::Area, "Body");
    body.free();
    REQUIRE_THROWS_AS(world.physics().insert_body(body), InvalidChild);
}

// =============================================================================
// Detection
// =============================================================================

TEST_CASE("PhysicsServer: the mask side detects the layer side once", "[physics][server][detect]") {
    core::World world;
    scene::Node watcher = world.tree().create_node("Watcher");

    Body seeker = make_box_body(world, BodyKind::Kinematic, "Seeker", {0.0f, 0.0f});
    seeker.set_collision_layer(0);
    seeker.set_collision_mask(1);
    Body target = make_box_body(world, BodyKind::Area, "Target", {8.0f, 0.0f});
    target.set_collision_layer(1);
    target.set_collision_mask(0);
    world.tree().root().add_child(seeker);
    world.tree().root().add_child(target);

    ContactLog seeker_log;
    ContactLog target_log;
    seeker_log.watch(seeker, watcher.id());
    target_log.watch(target, watcher.id());

    step_physics(world);
    step_physics(world);

    REQUIRE(seeker_log.entered == std::vector<scene::NodeId>{target.id()});
    REQUIRE(target_log.entered.empty());
    REQUIRE(holds(seeker.last_colliding_bodies(), target.id()));
    REQUIRE(seeker.colliding_bodies().empty());
}

TEST_CASE("PhysicsServer: symmetric layers detect both ways", "[physics][server][detect]") {
    core::World world;
    scene::Node watcher = world.tree().create_node("Watcher");

    Body a = make_box_body(world, BodyKind::Area, "A", {0.0f, 0.0f});
    Body b = make_ball_body(world, BodyKind::Area, "B", {12.0f, 0.0f}, 8.0f);
    world.tree().root().add_child(a);
    world.tree().root().add_child(b);

    ContactLog a_log;
    ContactLog b_log;
    a_log.watch(a, watcher.id());
    b_log.watch(b, watcher.id());

    step_physics(world);

    REQUIRE(a_log.entered == std::vector<scene::NodeId>{b.id()});
    REQUIRE(b_log.entered == std::vector<scene::NodeId>{a.id()});
}

TEST_CASE("PhysicsServer: a layer value matches masks sharing any bit", "[physics][server][detect]") {
    core::World world;
    scene::Node watcher = world.tree().create_node("Watcher");

    Body target = make_box_body(world, BodyKind::Area, "Target", {0.0f, 0.0f});
    target.set_collision_layer(5);
    target.set_collision_mask(0);
    world.tree().root().add_child(target);

    std::vector<Body> seekers;
    std::vector<ContactLog> logs(3);
    const std::uint32_t masks[] = {1, 4, 2};
    for (int i = 0; i < 3; ++i) {
        Body seeker = make_box_body(world, BodyKind::Kinematic, "Seeker" + std::to_string(i), {2.0f, 0.0f});
        seeker.set_collision_layer(0);
        seeker.set_collision_mask(masks[i]);
        world.tree().root().add_child(seeker);
        logs[static_cast<std::size_t>(i)].watch(seeker, watcher.id());
        seekers.push_back(seeker);
    }

    step_physics(world);

    REQUIRE(logs[0].entered == std::vector<scene::NodeId>{target.id()});
    REQUIRE(logs[1].entered == std::vector<scene::NodeId>{target.id()});
    REQUIRE(logs[2].entered.empty());
}

TEST_CASE("PhysicsServer: bodies never detect themselves", "[physics][server][detect]") {
    core::World world;
    scene::Node watcher = world.tree().create_node("Watcher");
    Body solo = make_box_body(world, BodyKind::Kinematic, "Solo", {0.0f, 0.0f});
    world.tree().root().add_child(solo);

    ContactLog log;
    log.watch(solo, watcher.id());
    step_physics(world);

    REQUIRE(log.entered.empty());
}

TEST_CASE("PhysicsServer: static bodies ignore each other", "[physics][server][detect]") {
    core::World world;
    scene::Node watcher = world.tree().create_node("Watcher");

    Body wall = make_box_body(world, BodyKind::Static, "Wall", {0.0f, 0.0f});
    Body floor = make_box_body(world, BodyKind::Static, "Floor", {5.0f, 0.0f});
    Body mover = make_box_body(world, BodyKind::Kinematic, "Mover", {-5.0f, 0.0f});
    wall.set_collision_layer(1);
    floor.set_collision_layer(1);
    for (Body b : {wall, floor, mover}) {
        world.tree().root().add_child(b);
    }

    ContactLog wall_log;
    ContactLog mover_log;
    wall_log.watch(wall, watcher.id());
    mover_log.watch(mover, watcher.id());

    step_physics(world);

    REQUIRE(mover_log.entered == std::vector<scene::NodeId>{wall.id()});
    // The wall sees the mover but not the floor.
    REQUIRE(wall_log.entered == std::vector<scene::NodeId>{mover.id()});
}

TEST_CASE("PhysicsServer: broad phase overlap alone is not a contact", "[physics][server][detect]") {
    core::World world;
    scene::Node watcher = world.tree().create_node("Watcher");

    Body ball = make_ball_body(world, BodyKind::Kinematic, "Ball", {14.0f, 14.0f}, 5.0f);
    ball.set_collision_layer(0);
    Body box = make_box_body(world, BodyKind::Area, "Box", {5.0f, 5.0f});
    box.set_collision_mask(0);
    world.tree().root().add_child(ball);
    world.tree().root().add_child(box);

    ContactLog log;
    log.watch(ball, watcher.id());
    step_physics(world);

    REQUIRE(world.physics().last_narrow_tests() == 1);
    REQUIRE(log.entered.empty());
}

// =============================================================================
// Contact edges
// =============================================================================

TEST_CASE("PhysicsServer: enter and exit fire once per contact", "[physics][server][edges]") {
    core::World world;
    scene::Node watcher = world.tree().create_node("Watcher");

    Body seeker = make_box_body(world, BodyKind::Kinematic, "Seeker", {0.0f, 0.0f});
    Body target = make_box_body(world, BodyKind::Area, "Target", {8.0f, 0.0f});
    target.set_collision_mask(0);
    world.tree().root().add_child(seeker);
    world.tree().root().add_child(target);

    ContactLog log;
    log.watch(seeker, watcher.id());

    step_physics(world);
    step_physics(world);
    REQUIRE(log.entered.size() == 1);
    REQUIRE(log.exited.empty());

    target.set_position({100.0f, 0.0f});
    step_physics(world);
    step_physics(world);
    REQUIRE(log.entered.size() == 1);
    REQUIRE(log.exited == std::vector<scene::NodeId>{target.id()});

    target.set_position({8.0f, 0.0f});
    step_physics(world);
    REQUIRE(log.entered.size() == 2);
}

TEST_CASE("PhysicsServer: removing a partner ends the contact immediately", "[physics][server][edges]") {
    core::World world;
    scene::Node watcher = world.tree().create_node("Watcher");

    Body seeker = make_box_body(world, BodyKind::Kinematic, "Seeker", {0.0f, 0.0f});
    Body target = make_box_body(world, BodyKind::Area, "Target", {8.0f, 0.0f});
    target.set_collision_mask(0);
    world.tree().root().add_child(seeker);
    world.tree().root().add_child(target);

    ContactLog log;
    log.watch(seeker, watcher.id());
    step_physics(world);

    SECTION("freed") {
        target.free();
        REQUIRE(log.exited == std::vector<scene::NodeId>{target.id()});
        REQUIRE(world.physics().body_count() == 1);
    }

    SECTION("detached") {
        world.tree().root().remove_child(target);
        REQUIRE(log.exited == std::vector<scene::NodeId>{target.id()});
        REQUIRE_FALSE(target.is_registered());
    }

    REQUIRE_FALSE(holds(seeker.last_colliding_bodies(), target.id()));
    step_physics(world);
    REQUIRE(log.exited.size() == 1);
}

TEST_CASE("PhysicsServer: freeing a partner from body_entered is safe", "[physics][server][edges]") {
    core::World world;

    Body seeker = make_box_body(world, BodyKind::Kinematic, "Seeker", {0.0f, 0.0f});
    Body target = make_box_body(world, BodyKind::Area, "Target", {8.0f, 0.0f});
    target.set_collision_mask(0);
    world.tree().root().add_child(seeker);
    world.tree().root().add_child(target);

    int entered = 0;
    seeker.connect(seeker.body_entered(), seeker.id(), [&](scene::NodeId id) {
        ++entered;
        world.tree().node(id).free();
    });

    step_physics(world);
    step_physics(world);

    REQUIRE(entered == 1);
    REQUIRE_FALSE(target.valid());
    REQUIRE(world.physics().body_count() == 1);
    REQUIRE(seeker.last_colliding_bodies().empty());
}

TEST_CASE("PhysicsServer: freeing a partner from body_exited ends the contact once", "[physics][server][edges]") {
    core::World world;
    scene::Node watcher = world.tree().create_node("Watcher");

    Body seeker = make_box_body(world, BodyKind::Kinematic, "Seeker", {0.0f, 0.0f});
    Body target = make_box_body(world, BodyKind::Area, "Target", {8.0f, 0.0f});
    target.set_collision_mask(0);
    world.tree().root().add_child(seeker);
    world.tree().root().add_child(target);

    ContactLog log;
    log.watch(seeker, watcher.id());
    step_physics(world);
    REQUIRE(log.entered.size() == 1);

    std::vector<scene::NodeId> freed_on_exit;
    seeker.connect(seeker.body_exited(), seeker.id(), [&](scene::NodeId id) {
        freed_on_exit.push_back(id);
        world.tree().node(id).free();
    });

    target.set_position({100.0f, 0.0f});
    step_physics(world);

    REQUIRE(log.exited == std::vector<scene::NodeId>{target.id()});
    REQUIRE(freed_on_exit.size() == 1);
    REQUIRE_FALSE(target.valid());
    REQUIRE(seeker.last_colliding_bodies().empty());

    step_physics(world);
    REQUIRE(log.exited.size() == 1);
}

TEST_CASE("PhysicsServer: detaching a partner from body_exited keeps other contacts", "[physics][server][edges]") {
    core::World world;
    scene::Node watcher = world.tree().create_node("Watcher");

    Body seeker = make_box_body(world, BodyKind::Kinematic, "Seeker", {0.0f, 0.0f});
    Body leaving = make_box_body(world, BodyKind::Area, "Leaving", {8.0f, 0.0f});
    Body staying = make_box_body(world, BodyKind::Area, "Staying", {-8.0f, 0.0f});
    leaving.set_collision_mask(0);
    staying.set_collision_mask(0);
    for (Body b : {seeker, leaving, staying}) {
        world.tree().root().add_child(b);
    }

    ContactLog log;
    log.watch(seeker, watcher.id());
    step_physics(world);
    REQUIRE(log.entered.size() == 2);

    seeker.connect(seeker.body_exited(), seeker.id(), [&](scene::NodeId id) {
        world.tree().root().remove_child(world.tree().node(id));
    });

    leaving.set_position({100.0f, 0.0f});
    step_physics(world);

    REQUIRE(log.exited == std::vector<scene::NodeId>{leaving.id()});
    REQUIRE(seeker.last_colliding_bodies() == std::vector<scene::NodeId>{staying.id()});
}

TEST_CASE("PhysicsServer: bodies added to the tree register their child shapes first", "[physics][server]") {
    core::World world;
    scene::Node level = world.tree().create_node("Level");
    Body seeker = make_box_body(world, BodyKind::Kinematic, "Seeker", {0.0f, 0.0f});
    Body target = make_box_body(world, BodyKind::Area, "Target", {3.0f, 0.0f});
    level.add_child(seeker);
    level.add_child(target);

    world.tree().set_current_scene(level);
    step_physics(world);

    REQUIRE(holds(seeker.last_colliding_bodies(), target.id()));
}
