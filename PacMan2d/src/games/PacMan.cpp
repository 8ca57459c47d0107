#include "games/PacMan.h"
#include "services/configuration/ConfigurationManager.h"
#include "services/logger/LogManager.h"
#include "stage/StageLoader.h"
#include <algorithm>
#include <array>
#include <cmath>
#include <string>

namespace pm2d::games {

namespace {

using logging::LogManager;

struct KeyBinding { int key; Direction dir; };

constexpr std::array<KeyBinding, 8> kKeyBindings = {{
    {KEY_LEFT, Direction::Left}, {KEY_A, Direction::Left},
    {KEY_RIGHT, Direction::Right}, {KEY_D, Direction::Right},
    {KEY_UP, Direction::Up}, {KEY_W, Direction::Up},
    {KEY_DOWN, Direction::Down}, {KEY_S, Direction::Down},
}};

constexpr Color kBackground{0, 0, 0, 255};
constexpr Color kPacmanColor{255, 252, 0, 255};
constexpr Color kDotColor{255, 184, 151, 255};
constexpr Color kFrightenedColor{33, 33, 255, 255};
constexpr Color kBlinkColor{240, 240, 255, 255};
constexpr float kStroke = 3.0f;

float headingDegrees(Direction d) {
    switch (d) {
        case Direction::Left: return 180.0f;
        case Direction::Up: return 270.0f;
        case Direction::Down: return 90.0f;
        case Direction::Right: case Direction::None: default: return 0.0f;
    }
}

// Straight segments draw the edge that faces the corridor; arcs and connectors
// draw an outline.
void drawBarrier(const BarrierCell& b, Rectangle r) {
    switch (b.tag) {
        case TextureTag::StraightHorizontalDown:
        case TextureTag::StraightHorizontalUp:
            DrawRectangleRec(Rectangle{r.x, r.y + r.height * 0.5f - kStroke * 0.5f, r.width, kStroke}, b.color);
            break;
        case TextureTag::StraightVerticalLeft:
        case TextureTag::StraightVerticalRight:
            DrawRectangleRec(Rectangle{r.x + r.width * 0.5f - kStroke * 0.5f, r.y, kStroke, r.height}, b.color);
            break;
        default:
            DrawRectangleLinesEx(Rectangle{r.x + 4.0f, r.y + 4.0f, r.width - 8.0f, r.height - 8.0f}, kStroke, b.color);
            break;
    }
}

} // namespace

void PacMan::init(int width, int height) {
    width_ = width;
    height_ = height;
    controller_.reset();
    loadError_.clear();

    settings_ = GameSettings::fromConfiguration();
    auto load = loadSymbolGrid(settings_.stagePath);
    if (!load.ok()) {
        loadError_ = std::string(to_string(load.status)) + ": " + load.message;
        return;
    }
    StageCompiler compiler(StageOptions::fromSettings(settings_));
    auto compiled = compiler.compile(load.symbols);
    if (!compiled.ok()) {
        loadError_ = std::string(to_string(compiled.status)) + ": " + compiled.message;
        return;
    }
    controller_ = std::make_unique<GameController>(std::move(*compiled.stage), settings_, session_, rng_);
    LogManager::info("Pac-Man ready, high score {}", session_.highScore);
}

void PacMan::onResize(int width, int height) {
    width_ = width;
    height_ = height;
}

void PacMan::unload() {
    controller_.reset();
}

Direction PacMan::pollDirection() const {
    Direction latest = Direction::None;
    for (const auto& binding : kKeyBindings) {
        if (IsKeyPressed(binding.key)) latest = binding.dir;
    }
    return latest;
}

void PacMan::update(float dt, int width, int height, bool acceptInput) {
    width_ = width;
    height_ = height;
    if (!controller_) return;

    if (acceptInput) {
        if (controller_->gameOver() && IsKeyPressed(KEY_ENTER)) {
            controller_->restart();
        }
        controller_->handleInput(pollDirection());
    }
    controller_->update(dt);
}

Rectangle PacMan::toScreen(Vector2 boardPos, float size) const {
    return Rectangle{boardPos.x, static_cast<float>(height_) - boardPos.y - size, size, size};
}

void PacMan::drawBoard() const {
    const Grid& grid = controller_->grid();
    const float cell = grid.cellSize();
    grid.forEachCell([&](Tile t, const CellContent& content) {
        Rectangle r = toScreen(grid.cellPixelPosition(t), cell);
        std::visit(overloaded{
            [&](const BarrierCell& b) { drawBarrier(b, r); },
            [&](const DotCell& d) {
                float radius = d.kind == DotKind::PowerUp ? cell * 0.35f : std::max(2.0f, cell * 0.1f);
                DrawCircleV(Vector2{r.x + r.width * 0.5f, r.y + r.height * 0.5f}, radius, kDotColor);
            },
            [](const auto&) {}
        }, content);
    });
}

void PacMan::drawPlayer() const {
    const Player& p = controller_->player();
    Rectangle r = toScreen(p.position, p.size);
    Vector2 center{r.x + r.width * 0.5f, r.y + r.height * 0.5f};
    float radius = p.size * 0.5f;
    if (p.dying) {
        // Mouth opens a little wider on each death frame until the body is gone.
        float open = 180.0f * static_cast<float>(p.frame + 1) / static_cast<float>(kDeathFrameCount);
        DrawCircleSector(center, radius, 270.0f + open, 270.0f + 360.0f - open, 32, kPacmanColor);
        return;
    }
    float heading = headingDegrees(p.facing);
    float mouth = 8.0f + 12.0f * static_cast<float>(p.frame % kPlayerWalkFrames);
    DrawCircleSector(center, radius, heading + mouth, heading + 360.0f - mouth, 32, kPacmanColor);
}

void PacMan::drawGhosts() const {
    for (const auto& g : controller_->ghosts()) {
        if (g.tile.col < 0) continue;
        Rectangle r = toScreen(g.position, g.size);
        Color body = g.traits().color;
        if (g.frightened) {
            body = (g.blinking && g.blinkFrame == 2) ? kBlinkColor : kFrightenedColor;
        }
        float radius = g.size * 0.5f;
        DrawCircleV(Vector2{r.x + radius, r.y + radius}, radius, body);
        float skirt = g.frame == 0 ? 0.0f : 2.0f;
        DrawRectangleRec(Rectangle{r.x, r.y + radius, r.width, radius - skirt}, body);

        Vector2 look{0.0f, 0.0f};
        switch (g.facing) {
            case Direction::Left: look.x = -2.0f; break;
            case Direction::Right: look.x = 2.0f; break;
            case Direction::Up: look.y = -2.0f; break;
            case Direction::Down: look.y = 2.0f; break;
            default: break;
        }
        for (float side : {-1.0f, 1.0f}) {
            Vector2 eye{r.x + radius + side * radius * 0.4f, r.y + radius * 0.8f};
            DrawCircleV(eye, radius * 0.28f, RAYWHITE);
            DrawCircleV(Vector2{eye.x + look.x, eye.y + look.y}, radius * 0.12f, DARKBLUE);
        }
    }
}

void PacMan::drawHud() const {
    std::string scoreText = "SCORE " + std::to_string(controller_->score());
    DrawText(scoreText.c_str(), 16, 16, 22, RAYWHITE);
    std::string highText = "HIGH " + std::to_string(session_.highScore);
    int w = MeasureText(highText.c_str(), 22);
    DrawText(highText.c_str(), width_ - w - 16, 16, 22, RAYWHITE);

    const float cell = controller_->grid().cellSize();
    for (int i = 0; i < controller_->lives(); ++i) {
        Vector2 c{16.0f + cell * 0.5f + i * (cell + 6.0f), static_cast<float>(height_) - 24.0f};
        DrawCircleSector(c, cell * 0.45f, 30.0f, 330.0f, 24, kPacmanColor);
    }

    if (controller_->gameOver()) {
        const char* msg = "GAME OVER - Press Enter";
        int mw = MeasureText(msg, 26);
        DrawText(msg, width_ / 2 - mw / 2, height_ / 2 - 13, 26, RED);
    } else if (!controller_->player().hasMoved && controller_->mode() == GameMode::Normal) {
        const char* msg = "READY!";
        int mw = MeasureText(msg, 26);
        DrawText(msg, width_ / 2 - mw / 2, height_ / 2 + 20, 26, YELLOW);
    }
}

void PacMan::render(int width, int height) {
    width_ = width;
    height_ = height;
    ClearBackground(kBackground);
    if (!controller_) {
        const char* title = "Stage failed to load";
        DrawText(title, 16, height_ / 2 - 30, 24, RED);
        DrawText(loadError_.c_str(), 16, height_ / 2, 18, RAYWHITE);
        return;
    }
    drawBoard();
    drawGhosts();
    drawPlayer();
    drawHud();
}

} // namespace pm2d::games
