#include "Component.hpp"

namespace ember {

Component::Component() : children_(this) {}

Component::~Component() = default;

void Component::remove_from_parent() {
    if (owner_ != nullptr) owner_->remove(this);
}

void Component::notify_removed() {
    on_remove();
    children_.for_each([](Component& child) { child.notify_removed(); });
}

void Component::set_priority(const int priority) {
    if (priority_ == priority) return;
    priority_ = priority;
    if (owner_ != nullptr) owner_->mark_rebalance();
}

bool Component::contains_point(const raylib::Vector2& /*world_position*/) const { return false; }

void Component::update_tree(const float dt) {
    update(dt);
    children_.for_each([dt](Component& child) { child.update_tree(dt); });
}

void Component::render_tree(const bool debug) const {
    render();
    if (debug) render_debug();
    render_children(debug);
}

void Component::render_children(const bool debug) const {
    children_.for_each([debug](const Component& child) { child.render_tree(debug); });
}

}  // namespace ember
