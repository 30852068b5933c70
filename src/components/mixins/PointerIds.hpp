#pragma once

#include <algorithm>
#include <vector>

namespace ember {

// Pointer ids currently owned by one gesture capability of one component. A handful of
// concurrent pointers at most, so a flat vector beats a hash set.
class PointerIds {
public:
    void add(const int pointer_id) {
        if (!contains(pointer_id)) ids_.push_back(pointer_id);
    }

    // Returns whether the id was active.
    bool remove(const int pointer_id) {
        const auto it = std::find(ids_.begin(), ids_.end(), pointer_id);
        if (it == ids_.end()) return false;
        ids_.erase(it);
        return true;
    }

    [[nodiscard]] bool contains(const int pointer_id) const {
        return std::find(ids_.begin(), ids_.end(), pointer_id) != ids_.end();
    }
    [[nodiscard]] bool empty() const { return ids_.empty(); }
    [[nodiscard]] size_t size() const { return ids_.size(); }
    [[nodiscard]] const std::vector<int>& ids() const { return ids_; }

private:
    std::vector<int> ids_;
};

}  // namespace ember
