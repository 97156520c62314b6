#include "nodeflow/core/world.hpp"

namespace nodeflow::core {

void World::apply(const Config& config) {
    tree_.set_debug_draw(config.debug().draw_shapes);
    tree_.set_screen_size({static_cast<float>(config.window().width),
                           static_cast<float>(config.window().height)});
    physics_.set_collision_debug(config.logging().collision_debug);
    physics_.set_warn_missing_shape(config.physics().warn_missing_shape);
}

void World::tick(float dt, scene::ICanvas& canvas) {
    input_.dispatch();
    tree_.propagate(dt);
    tree_.draw(canvas);
    physics_.process_collisions();
    ++tick_;
}

} // namespace nodeflow::core
