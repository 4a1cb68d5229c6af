#pragma once
#include "config.h"
#include "food.h"
#include "snake.h"
#include <deque>

enum class GameState
{
    PreGame,
    Game
};

// Game state and per-frame rules: input filtering, movement, growth,
// collisions and resets. Knows nothing about the terminal.
class GameData
{
public:
    GameData(const Config &settings, unsigned seed);
    // Resume from a given snake and food, e.g. a saved or scripted position.
    // The food is kept where it is even if it overlaps the snake.
    GameData(const Config &settings, const Snake &snake, const Food &food);

    // Queue a direction from the player. The first one ends the pre-game.
    void pushInput(Direction d);

    // One frame: input tick, then snake update. Idle before the game starts.
    void update(float dt);

    // Applies at most one queued turn per cfg.inputInterval seconds. Scans
    // from the newest input to the oldest for the first real turn; newer
    // same-axis inputs are dropped and older ones stay queued.
    void updateInput(float dt);

    // Eat, die or move.
    void updateSnake(float dt);

    void reset();

    const Snake &snake() const { return body; }
    const Food &food() const { return meal; }
    const std::deque<Direction> &inputs() const { return pending; }
    unsigned score() const { return points; }
    unsigned highScore() const { return best; }
    GameState state() const { return mode; }
    const Rect &field() const { return bounds; }
    const Config &config() const { return cfg; }
    float inputTimer() const { return timer; }

private:
    Snake spawnSnake() const;
    void relocateFood();

    Config cfg;
    Rect bounds;
    Snake body;
    Food meal;
    std::deque<Direction> pending;
    float timer{0.0f};
    unsigned points{0};
    unsigned best{0};
    GameState mode{GameState::PreGame};
};
