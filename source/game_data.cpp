#include "game_data.h"
#include "log.h"
#include <algorithm>
#include <iterator>

GameData::GameData(const Config &settings, unsigned seed)
    : cfg(settings),
      bounds{0.0f, 0.0f, settings.fieldWidth, settings.fieldHeight},
      body(spawnSnake()),
      meal(settings.fieldWidth, settings.fieldHeight, settings.foodSize, seed)
{
    relocateFood();
}

GameData::GameData(const Config &settings, const Snake &snake, const Food &food)
    : cfg(settings),
      bounds{0.0f, 0.0f, settings.fieldWidth, settings.fieldHeight},
      body(snake),
      meal(food)
{
}

Snake GameData::spawnSnake() const
{
    return Snake({bounds.w / 2.0f, bounds.h / 2.0f}, cfg.startDirection, cfg.snakeWidth, cfg.initialLength);
}

void GameData::relocateFood()
{
    int tries = meal.respawn([&](const Rect &box)
                             { return body.collides(box); });
    LOG_DEBUG("food at " << meal.position().x << "," << meal.position().y << " after " << tries << " draws");
}

void GameData::pushInput(Direction d)
{
    pending.push_back(d);
    if (mode == GameState::PreGame)
    {
        mode = GameState::Game;
        LOG_INFO("game started");
    }
}

void GameData::update(float dt)
{
    if (mode != GameState::Game)
        return;
    updateInput(dt);
    updateSnake(dt);
}

void GameData::updateInput(float dt)
{
    timer += dt;
    if (timer < cfg.inputInterval)
        return;

    const Direction current = body.direction();
    auto found = std::find_if(pending.rbegin(), pending.rend(), [&](Direction d)
                              { return !isColinear(d, current); });
    if (found == pending.rend())
    {
        pending.clear();
        return;
    }

    const Direction next = *found;
    // found.base() points one past the chosen entry; keep what is older.
    pending.erase(std::prev(found.base()), pending.end());
    body.turn(next);
    timer = 0.0f;
    LOG_DEBUG("turn " << toString(current) << " -> " << toString(next) << ", " << pending.size() << " queued");
}

void GameData::updateSnake(float dt)
{
    if (body.collides(meal.bbox()))
    {
        body.grow(cfg.foodGrowth);
        ++points;
        best = std::max(best, points);
        LOG_INFO("food eaten, score " << points << ", length " << body.length());
        relocateFood();
    }
    else if (body.selfCollides())
    {
        LOG_INFO("snake bit itself at score " << points);
        reset();
    }
    else if (body.wallCollides(bounds))
    {
        LOG_INFO("snake hit the wall at score " << points);
        reset();
    }
    else
    {
        body.move(dt * cfg.speed);
    }
}

void GameData::reset()
{
    body = spawnSnake();
    relocateFood();
    pending.clear();
    timer = 0.0f;
    points = 0;
    mode = GameState::PreGame;
}
