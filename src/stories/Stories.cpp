#include "Stories.hpp"

#include <cmath>
#include <stdexcept>

#include "../systems/Camera.hpp"
#include "Squares.hpp"

namespace ember::stories {

namespace {

// Moves along a circle around `center`.
class OrbitingCircle : public CircleComponent {
public:
    OrbitingCircle(const raylib::Vector2& center, float orbit, float radius)
        : CircleComponent(center, radius, RED), center_(center), orbit_(orbit) {}

    void update(const float dt) override {
        phase_ += dt * 0.5F;
        position = center_ + raylib::Vector2{std::cos(phase_) * orbit_, std::sin(phase_) * orbit_};
    }

    [[nodiscard]] std::string_view debug_label() const override { return "OrbitingCircle"; }

private:
    raylib::Vector2 center_;
    float orbit_;
    float phase_ = 0.0F;
};

raylib::Vector2 middle(const raylib::Vector2& viewport) {
    return raylib::Vector2{viewport.x * 0.5F, viewport.y * 0.5F};
}

}  // namespace

DragStory::DragStory(const raylib::Vector2& viewport) : Game(viewport) {
    const raylib::Vector2 c = middle(viewport);
    add(std::make_unique<DraggableSquare>(c + raylib::Vector2{-300.0F, -100.0F}, square_extent(), BLUE));
    add(std::make_unique<DraggableSquare>(c + raylib::Vector2{-250.0F, -50.0F}, square_extent(), GREEN));

    auto* parent =
        add(std::make_unique<DraggableSquare>(c + raylib::Vector2{50.0F, -120.0F}, raylib::Vector2{240.0F, 240.0F},
                                              DARKPURPLE));
    parent->add(std::make_unique<DraggableSquare>(raylib::Vector2{20.0F, 20.0F}, raylib::Vector2{80.0F, 80.0F}, PINK));
    parent->add(
        std::make_unique<DraggableSquare>(raylib::Vector2{130.0F, 130.0F}, raylib::Vector2{80.0F, 80.0F}, LIME));

    add(std::make_unique<SpinningSquare>(c + raylib::Vector2{0.0F, 220.0F}, 0.8F));
}

TapStory::TapStory(const raylib::Vector2& viewport) : Game(viewport) {
    const raylib::Vector2 c = middle(viewport);
    add(std::make_unique<TappableSquare>(c + raylib::Vector2{-150.0F, 0.0F}, BLUE, GREEN));
    add(std::make_unique<TappableSquare>(c + raylib::Vector2{150.0F, 0.0F}, MAROON, GOLD));
}

bool TapStory::on_tap_up(const int pointer_id, const TapUpInfo& info) {
    const bool unclaimed = Game::on_tap_up(pointer_id, info);
    if (unclaimed) {
        auto square = std::make_unique<TappableSquare>(info.event_position.game, VIOLET, BEIGE);
        square->set_priority(++spawned_);
        add(std::move(square));
    }
    return unclaimed;
}

HoverStory::HoverStory(const raylib::Vector2& viewport) : Game(viewport) {
    const raylib::Vector2 c = middle(viewport);
    constexpr int kSide = 3;
    constexpr float kPitch = 140.0F;
    for (int row = 0; row < kSide; ++row) {
        for (int col = 0; col < kSide; ++col) {
            const raylib::Vector2 offset{static_cast<float>(col - 1) * kPitch, static_cast<float>(row - 1) * kPitch};
            add(std::make_unique<HoverableSquare>(c + offset, DARKGRAY));
        }
    }
}

ZoomStory::ZoomStory(const raylib::Vector2& viewport) : Game(viewport) {
    const raylib::Vector2 c = middle(viewport);
    auto* orbiter = add(std::make_unique<OrbitingCircle>(c, 150.0F, 40.0F));
    add(std::make_unique<SpinningSquare>(c, 1.2F));
    Camera::follow(world(), orbiter);
}

bool ZoomStory::on_scroll(const PointerScrollInfo& info) {
    const bool unclaimed = Game::on_scroll(info);
    if (unclaimed) {
        Camera::zoom_at(camera(), info.event_position.global, info.scroll_delta.global.y,
                        config().zoom_per_scroll_unit);
    }
    return unclaimed;
}

const std::vector<std::string>& story_names() {
    static const std::vector<std::string> names{"drag", "tap", "hover", "zoom"};
    return names;
}

std::unique_ptr<Game> make_story(const std::string_view name, const raylib::Vector2& viewport) {
    if (name == "drag") return std::make_unique<DragStory>(viewport);
    if (name == "tap") return std::make_unique<TapStory>(viewport);
    if (name == "hover") return std::make_unique<HoverStory>(viewport);
    if (name == "zoom") return std::make_unique<ZoomStory>(viewport);
    throw std::invalid_argument("unknown story '" + std::string(name) + "'");
}

}  // namespace ember::stories
