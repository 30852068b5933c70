#pragma once

#include <memory>
#include <raylib-cpp.hpp>
#include <string_view>
#include <type_traits>
#include <utility>

#include "ComponentSet.hpp"

namespace ember {

// A node of the scene tree. Owns its children; they are destroyed with it.
//
// Capabilities (Draggable, Tappable, ...) are mixins deriving virtually from Component, so a
// concrete component is queried for them at traversal time instead of being registered anywhere.
class Component {
public:
    Component();
    virtual ~Component();
    Component(const Component&) = delete;
    Component& operator=(const Component&) = delete;

    // Queues a child; it becomes visible to update, render and dispatch on the next flush.
    template <typename T>
    T* add(std::unique_ptr<T> child) {
        static_assert(std::is_base_of_v<Component, T>, "children must be components");
        T* raw = child.get();
        children_.add(std::move(child));
        return raw;
    }
    void remove(const Component* child) { children_.remove(child); }
    // Queues removal of this component from whichever set owns it.
    void remove_from_parent();

    [[nodiscard]] ComponentSet& children() { return children_; }
    [[nodiscard]] const ComponentSet& children() const { return children_; }
    [[nodiscard]] Component* parent() const { return parent_; }
    [[nodiscard]] bool is_mounted() const { return owner_ != nullptr; }

    [[nodiscard]] int priority() const { return priority_; }
    void set_priority(int priority);

    // Hit test in game (world) coordinates. Plain components occupy no space.
    [[nodiscard]] virtual bool contains_point(const raylib::Vector2& world_position) const;

    template <typename Capability>
    [[nodiscard]] Capability* query() {
        return dynamic_cast<Capability*>(this);
    }

    // Visits children back to front. Each child's own subtree is visited before the child itself;
    // `handler` runs only on nodes implementing `Capability`. Returns false as soon as any handler
    // does, leaving the rest of the tree untouched.
    template <typename Capability, typename Handler>
    bool propagate_to_children(Handler&& handler) {
        return propagate<Capability>(children_, handler);
    }

    // Same walk over an arbitrary set; the dispatcher uses it for the root set.
    template <typename Capability, typename Handler>
    static bool propagate(const ComponentSet& set, Handler& handler) {
        const auto nodes = set.snapshot();
        for (auto it = nodes.rbegin(); it != nodes.rend(); ++it) {
            Component* child = *it;
            bool should_continue = child->propagate_to_children<Capability>(handler);
            if (should_continue) {
                if (auto* capable = child->query<Capability>()) should_continue = handler(*capable);
            }
            if (!should_continue) return false;
        }
        return true;
    }

    virtual void update(float /*dt*/) {}
    void update_tree(float dt);

    virtual void render() const {}
    virtual void render_tree(bool debug) const;
    virtual void render_debug() const {}

    [[nodiscard]] virtual std::string_view debug_label() const { return "Component"; }

protected:
    virtual void on_mount() {}
    // Also runs on descendants when an ancestor is removed.
    virtual void on_remove() {}

    void render_children(bool debug) const;

private:
    friend class ComponentSet;

    // Runs on_remove() on this component, then on every descendant.
    void notify_removed();

    ComponentSet children_;
    ComponentSet* owner_ = nullptr;
    Component* parent_ = nullptr;
    int priority_ = 0;
};

}  // namespace ember
