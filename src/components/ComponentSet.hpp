#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace ember {

class Component;

// Ordered, owning collection of components. Structural changes are queued and only applied by
// apply_pending(), so a traversal always walks a consistent tree.
//
// Order is ascending priority; equal priorities keep insertion order. Rendering walks the set
// front to back, input dispatch walks it back to front.
class ComponentSet {
public:
    // Marks a traversal cycle as open. apply_pending() is a no-op while any cycle is open.
    class Cycle {
    public:
        explicit Cycle(ComponentSet& set) : set_(set) { ++set_.open_cycles_; }
        ~Cycle() { --set_.open_cycles_; }
        Cycle(const Cycle&) = delete;
        Cycle& operator=(const Cycle&) = delete;

    private:
        ComponentSet& set_;
    };

    // Called for every component leaving the tree below a root set, descendants included, while
    // the component is still alive.
    using RemovalListener = std::function<void(const Component&)>;

    explicit ComponentSet(Component* owner = nullptr);
    ~ComponentSet();
    ComponentSet(const ComponentSet&) = delete;
    ComponentSet& operator=(const ComponentSet&) = delete;

    // Queues `component` for insertion and returns it. Throws std::invalid_argument on null.
    Component* add(std::unique_ptr<Component> component);
    // Queues removal. Unknown or already queued components are ignored.
    void remove(const Component* component);
    void mark_rebalance() { needs_rebalance_ = true; }
    // Only meaningful on a root set; nested sets report to the root they are mounted under.
    void set_removal_listener(RemovalListener listener) { removal_listener_ = std::move(listener); }

    // Applies queued removals, additions and re-sorting, then recurses into every child set.
    void apply_pending();
    [[nodiscard]] bool has_pending() const;
    [[nodiscard]] bool in_cycle() const { return open_cycles_ > 0; }

    [[nodiscard]] std::vector<Component*> snapshot() const;
    [[nodiscard]] bool contains(const Component* component) const;
    [[nodiscard]] bool empty() const { return items_.empty(); }
    [[nodiscard]] size_t size() const { return items_.size(); }
    [[nodiscard]] Component* owner() const { return owner_; }

    template <typename Fn>
    void for_each(Fn&& fn) const {
        for (const auto& entry : items_) fn(*entry.component);
    }

    template <typename Fn>
    void for_each_reversed(Fn&& fn) const {
        for (auto it = items_.rbegin(); it != items_.rend(); ++it) fn(*it->component);
    }

private:
    struct Entry {
        std::unique_ptr<Component> component;
        std::uint64_t sequence = 0;  // insertion stamp, breaks priority ties
    };

    void apply_removals();
    void apply_additions();
    void rebalance();
    void insert_sorted(Entry entry);
    [[nodiscard]] const RemovalListener& root_removal_listener() const;

    Component* owner_ = nullptr;
    std::vector<Entry> items_;
    std::vector<Entry> pending_adds_;
    std::vector<const Component*> pending_removals_;
    RemovalListener removal_listener_;
    std::uint64_t next_sequence_ = 0;
    int open_cycles_ = 0;
    bool needs_rebalance_ = false;
};

}  // namespace ember
