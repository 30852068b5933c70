#include <cstdlib>
#include <memory>
#include <raylib-cpp.hpp>
#include <raylib.h>
#include <stdexcept>
#include <string>
#include <string_view>

#include "core/Config.hpp"
#include "core/Constants.hpp"
#include "game/Game.hpp"
#include "stories/Stories.hpp"
#include "systems/Input.hpp"
#include "systems/UI.hpp"

namespace {

struct Options {
    std::string story = "drag";
    bool debug = false;
    float fixed_dt = 0.0F;  // 0 = variable
};

Options parse_options(const int argc, char** argv) {
    Options opts{};
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg{argv[i]};
        if (arg == "--debug") {
            opts.debug = true;
        } else if (arg == "--story" && i + 1 < argc) {
            opts.story = argv[++i];
        } else if (arg == "--fixed-dt" && i + 1 < argc) {
            opts.fixed_dt = std::stof(argv[++i]);
            if (opts.fixed_dt <= 0.0F) throw std::invalid_argument("--fixed-dt must be positive");
        } else {
            throw std::invalid_argument("unrecognized argument '" + std::string(arg) + "'");
        }
    }
    return opts;
}

}  // namespace

class Application {
public:
    explicit Application(const Options& opts) {
        SetConfigFlags(FLAG_WINDOW_HIGHDPI | FLAG_MSAA_4X_HINT | FLAG_WINDOW_RESIZABLE);
        InitWindow(ember::constants::window_width, ember::constants::window_height, "ember stories");
        SetTargetFPS(ember::constants::target_fps);
        ember::UI::setup();

        try {
            initialize_game(opts);
        } catch (...) {
            ember::UI::shutdown();
            CloseWindow();
            throw;
        }
    }

    ~Application() {
        ember::UI::shutdown();
        CloseWindow();
    }

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    void run() {
        while (!WindowShouldClose()) {
            update();
            render();
        }
    }

private:
    std::unique_ptr<ember::Game> game_;
    std::unique_ptr<ember::GestureRecognizer> gestures_;
    std::unique_ptr<ember::RaylibInput> input_;

    void initialize_game(const Options& opts) {
        const raylib::Vector2 viewport{static_cast<float>(GetScreenWidth()), static_cast<float>(GetScreenHeight())};
        game_ = ember::stories::make_story(opts.story, viewport);
        ember::Config& cfg = game_->config();
        cfg.debug_mode = opts.debug;
        if (opts.fixed_dt > 0.0F) {
            cfg.use_fixed_dt = true;
            cfg.fixed_dt = opts.fixed_dt;
        }
        gestures_ = std::make_unique<ember::GestureRecognizer>(*game_);
        input_ = std::make_unique<ember::RaylibInput>(*gestures_);
        TraceLog(LOG_INFO, "EMBER: running story '%s'", opts.story.c_str());
    }

    void update() {
        if (IsWindowResized()) {
            game_->resize(raylib::Vector2{static_cast<float>(GetScreenWidth()), static_cast<float>(GetScreenHeight())});
        }
        if (IsKeyPressed(KEY_F1)) game_->config().show_inspector = !game_->config().show_inspector;
        if (IsKeyPressed(KEY_F2)) game_->config().debug_mode = !game_->config().debug_mode;

        // UI first (this sets up ImGui state)
        ember::UI::begin();
        ember::UI::draw(*game_, *gestures_);

        const float deltaTime = GetFrameTime();
        input_->poll(deltaTime, ember::UI::wants_mouse());
        game_->step(deltaTime);
    }

    void render() const {
        BeginDrawing();
        game_->render();
        DrawFPS(GetScreenWidth() - 90, 10);
        ember::UI::end();
        EndDrawing();
    }
};

auto main(int argc, char** argv) -> int {
    try {
        const Options opts = parse_options(argc, argv);
        Application app(opts);
        app.run();
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        TraceLog(LOG_ERROR, "Exception: %s", e.what());
        return EXIT_FAILURE;
    }
}
