#include "ComponentSet.hpp"

#include <algorithm>
#include <stdexcept>

#include "Component.hpp"

namespace ember {

namespace {
void notify_subtree(const Component& root, const ComponentSet::RemovalListener& listener) {
    listener(root);
    root.children().for_each([&listener](const Component& child) { notify_subtree(child, listener); });
}

bool ordered_before(const int lhs_priority, const std::uint64_t lhs_sequence, const int rhs_priority,
                    const std::uint64_t rhs_sequence) {
    if (lhs_priority != rhs_priority) return lhs_priority < rhs_priority;
    return lhs_sequence < rhs_sequence;
}
}  // namespace

ComponentSet::ComponentSet(Component* owner) : owner_(owner) {}

ComponentSet::~ComponentSet() = default;

Component* ComponentSet::add(std::unique_ptr<Component> component) {
    if (!component) throw std::invalid_argument("ComponentSet::add: null component");
    Component* raw = component.get();
    pending_adds_.push_back(Entry{std::move(component), next_sequence_++});
    return raw;
}

void ComponentSet::remove(const Component* component) {
    if (component == nullptr) return;
    if (std::find(pending_removals_.begin(), pending_removals_.end(), component) != pending_removals_.end()) return;
    pending_removals_.push_back(component);
}

bool ComponentSet::has_pending() const {
    return !pending_adds_.empty() || !pending_removals_.empty() || needs_rebalance_;
}

void ComponentSet::apply_pending() {
    if (in_cycle()) return;
    // Lifecycle hooks may queue more work on this set; keep going until it settles.
    while (has_pending()) {
        apply_removals();
        apply_additions();
        if (needs_rebalance_) rebalance();
    }
    for (auto& entry : items_) entry.component->children_.apply_pending();
}

void ComponentSet::apply_removals() {
    while (!pending_removals_.empty()) {
        std::vector<const Component*> removals;
        removals.swap(pending_removals_);
        for (const Component* target : removals) {
            auto mounted = std::find_if(items_.begin(), items_.end(),
                                        [target](const Entry& e) { return e.component.get() == target; });
            const RemovalListener& listener = root_removal_listener();
            if (mounted != items_.end()) {
                // Detach before the hook runs so a re-entrant remove_from_parent() is a no-op.
                std::unique_ptr<Component> doomed = std::move(mounted->component);
                items_.erase(mounted);
                doomed->notify_removed();
                if (listener) notify_subtree(*doomed, listener);
                doomed->owner_ = nullptr;
                doomed->parent_ = nullptr;
                continue;
            }
            auto queued = std::find_if(pending_adds_.begin(), pending_adds_.end(),
                                       [target](const Entry& e) { return e.component.get() == target; });
            if (queued == pending_adds_.end()) continue;
            std::unique_ptr<Component> never_mounted = std::move(queued->component);
            pending_adds_.erase(queued);
            if (listener) notify_subtree(*never_mounted, listener);
        }
    }
}

void ComponentSet::apply_additions() {
    while (!pending_adds_.empty()) {
        std::vector<Entry> additions;
        additions.swap(pending_adds_);
        for (auto& entry : additions) {
            Component* raw = entry.component.get();
            raw->owner_ = this;
            raw->parent_ = owner_;
            insert_sorted(std::move(entry));
            raw->on_mount();
        }
    }
}

void ComponentSet::insert_sorted(Entry entry) {
    const int priority = entry.component->priority();
    const std::uint64_t sequence = entry.sequence;
    auto pos = std::find_if(items_.begin(), items_.end(), [&](const Entry& e) {
        return ordered_before(priority, sequence, e.component->priority(), e.sequence);
    });
    items_.insert(pos, std::move(entry));
}

void ComponentSet::rebalance() {
    needs_rebalance_ = false;
    std::stable_sort(items_.begin(), items_.end(), [](const Entry& a, const Entry& b) {
        return ordered_before(a.component->priority(), a.sequence, b.component->priority(), b.sequence);
    });
}

const ComponentSet::RemovalListener& ComponentSet::root_removal_listener() const {
    const ComponentSet* set = this;
    while (set->owner_ != nullptr && set->owner_->owner_ != nullptr) set = set->owner_->owner_;
    return set->removal_listener_;
}

std::vector<Component*> ComponentSet::snapshot() const {
    std::vector<Component*> nodes;
    nodes.reserve(items_.size());
    for (const auto& entry : items_) nodes.push_back(entry.component.get());
    return nodes;
}

bool ComponentSet::contains(const Component* component) const {
    return std::any_of(items_.begin(), items_.end(),
                       [component](const Entry& e) { return e.component.get() == component; });
}

}  // namespace ember
