#define BOOST_TEST_MAIN
#include <boost/test/unit_test.hpp>

#include "game_data.h"

#include <initializer_list>
#include <vector>

namespace
{
    constexpr float kTol = 1e-4f;

    // The snake a default config spawns: centre of the field, heading right.
    Snake spawned()
    {
        const Config cfg;
        return Snake({cfg.fieldWidth / 2.0f, cfg.fieldHeight / 2.0f}, cfg.startDirection, cfg.snakeWidth, cfg.initialLength);
    }

    Food foodAt(const Point &p)
    {
        const Config cfg;
        Food food(cfg.fieldWidth, cfg.fieldHeight, cfg.foodSize, 2024u);
        food.placeAt(p);
        return food;
    }

    // Default config, food parked in the top-left corner away from the snake.
    struct Fixture
    {
        Fixture() : data(Config{}, spawned(), foodAt({1.0f, 1.0f}))
        {
        }

        void start(const Snake &snake, const Point &food)
        {
            data = GameData(Config{}, snake, foodAt(food));
        }

        void queue(std::initializer_list<Direction> dirs)
        {
            for (Direction d : dirs)
                data.pushInput(d);
        }

        std::vector<Direction> pending() const
        {
            return {data.inputs().begin(), data.inputs().end()};
        }

        GameData data;
    };

    bool sameDirs(const std::vector<Direction> &a, const std::vector<Direction> &b)
    {
        return a == b;
    }
}

BOOST_AUTO_TEST_SUITE(GameDataTest)

BOOST_AUTO_TEST_CASE(starts_in_pregame)
{
    GameData data(Config{}, 5u);
    BOOST_CHECK(data.state() == GameState::PreGame);
    BOOST_CHECK_EQUAL(data.score(), 0u);
    BOOST_CHECK(data.inputs().empty());
    BOOST_CHECK_EQUAL(data.snake().segments().size(), 1u);
    BOOST_CHECK(data.snake().segments().front().begin() == (Point{30.0f, 12.0f}));
    BOOST_CHECK(!data.snake().collides(data.food().bbox()));
    BOOST_CHECK(data.field().contains(data.food().bbox()));
}

BOOST_FIXTURE_TEST_CASE(pregame_is_idle, Fixture)
{
    const Point head = data.snake().head();
    data.update(1.0f);
    BOOST_CHECK(data.snake().head() == head);
    BOOST_CHECK(data.state() == GameState::PreGame);
}

BOOST_FIXTURE_TEST_CASE(first_input_starts_game, Fixture)
{
    data.pushInput(Direction::Up);
    BOOST_CHECK(data.state() == GameState::Game);
    BOOST_CHECK_EQUAL(data.inputs().size(), 1u);
}

BOOST_FIXTURE_TEST_CASE(newest_turn_wins_older_stay_queued, Fixture)
{
    queue({Direction::Right, Direction::Up, Direction::Left, Direction::Down});
    data.updateInput(0.2f);
    BOOST_CHECK(data.snake().direction() == Direction::Down);
    BOOST_CHECK(sameDirs(pending(), {Direction::Right, Direction::Up, Direction::Left}));
    BOOST_CHECK_EQUAL(data.inputTimer(), 0.0f);

    data.updateInput(0.2f);
    BOOST_CHECK(data.snake().direction() == Direction::Left);
    BOOST_CHECK(sameDirs(pending(), {Direction::Right, Direction::Up}));

    data.updateInput(0.2f);
    BOOST_CHECK(data.snake().direction() == Direction::Up);
    BOOST_CHECK(sameDirs(pending(), {Direction::Right}));

    data.updateInput(0.2f);
    BOOST_CHECK(data.snake().direction() == Direction::Right);
    BOOST_CHECK(data.inputs().empty());
    BOOST_CHECK_EQUAL(data.snake().segments().size(), 5u);
}

BOOST_FIXTURE_TEST_CASE(newer_colinear_inputs_are_dropped, Fixture)
{
    queue({Direction::Down, Direction::Left, Direction::Up, Direction::Right});
    data.updateInput(0.2f);
    BOOST_CHECK(data.snake().direction() == Direction::Up);
    BOOST_CHECK(sameDirs(pending(), {Direction::Down, Direction::Left}));
}

BOOST_FIXTURE_TEST_CASE(all_colinear_clears_queue, Fixture)
{
    queue({Direction::Right, Direction::Left, Direction::Right});
    data.updateInput(0.2f);
    BOOST_CHECK(data.snake().direction() == Direction::Right);
    BOOST_CHECK(data.inputs().empty());
    BOOST_CHECK_EQUAL(data.snake().segments().size(), 1u);
    // no turn was made, so the timer keeps running
    BOOST_CHECK_GT(data.inputTimer(), 0.0f);
}

BOOST_FIXTURE_TEST_CASE(input_is_rate_limited, Fixture)
{
    queue({Direction::Up});
    data.updateInput(0.05f);
    data.updateInput(0.05f);
    BOOST_CHECK(data.snake().direction() == Direction::Right);
    BOOST_CHECK_EQUAL(data.inputs().size(), 1u);
    data.updateInput(0.05f);
    BOOST_CHECK(data.snake().direction() == Direction::Up);
    BOOST_CHECK(data.inputs().empty());
}

BOOST_FIXTURE_TEST_CASE(moves_by_elapsed_distance, Fixture)
{
    queue({Direction::Right});
    const float length = data.snake().length();
    const float x = data.snake().head().x;
    data.update(0.016f);
    BOOST_CHECK_SMALL(data.snake().head().x - (x + 0.016f * data.config().speed), kTol);
    BOOST_CHECK_SMALL(data.snake().length() - length, kTol);
    BOOST_CHECK(data.state() == GameState::Game);
}

BOOST_FIXTURE_TEST_CASE(eating_grows_and_scores, Fixture)
{
    start(spawned(), spawned().head());
    queue({Direction::Right});
    const float length = data.snake().length();
    data.updateSnake(0.016f);
    BOOST_CHECK_EQUAL(data.score(), 1u);
    BOOST_CHECK_EQUAL(data.highScore(), 1u);
    BOOST_CHECK_SMALL(data.snake().length() - (length + data.config().foodGrowth), kTol);
    BOOST_CHECK(!data.snake().collides(data.food().bbox()));
    BOOST_CHECK(data.state() == GameState::Game);
}

BOOST_FIXTURE_TEST_CASE(wall_hit_resets, Fixture)
{
    Snake atWall = spawned();
    atWall.move(26.5f);
    start(atWall, {1.0f, 1.0f});
    queue({Direction::Right, Direction::Up});
    data.updateSnake(0.016f);
    BOOST_CHECK(data.state() == GameState::PreGame);
    BOOST_CHECK_EQUAL(data.score(), 0u);
    BOOST_CHECK(data.inputs().empty());
    BOOST_CHECK_EQUAL(data.snake().segments().size(), 1u);
    BOOST_CHECK(data.snake().segments().front().begin() == (Point{30.0f, 12.0f}));
    BOOST_CHECK(!data.snake().collides(data.food().bbox()));
}

BOOST_FIXTURE_TEST_CASE(self_hit_resets, Fixture)
{
    Snake s = spawned();
    s.turn(Direction::Down);
    s.grow(3.0f);
    s.turn(Direction::Left);
    s.grow(3.0f);
    s.turn(Direction::Up);
    s.grow(3.0f);
    BOOST_REQUIRE(s.selfCollides());
    start(s, {1.0f, 1.0f});
    queue({Direction::Right});
    data.updateSnake(0.016f);
    BOOST_CHECK(data.state() == GameState::PreGame);
    BOOST_CHECK_EQUAL(data.snake().segments().size(), 1u);
}

BOOST_FIXTURE_TEST_CASE(high_score_survives_reset, Fixture)
{
    start(spawned(), spawned().head());
    queue({Direction::Right});
    data.updateSnake(0.016f);
    BOOST_CHECK_EQUAL(data.score(), 1u);
    data.reset();
    BOOST_CHECK_EQUAL(data.score(), 0u);
    BOOST_CHECK_EQUAL(data.highScore(), 1u);
    BOOST_CHECK_EQUAL(data.inputTimer(), 0.0f);
}

BOOST_AUTO_TEST_CASE(resumed_state_is_kept)
{
    Snake s = spawned();
    s.turn(Direction::Up);
    s.grow(2.0f);
    GameData data(Config{}, s, foodAt({5.0f, 5.0f}));
    BOOST_CHECK(data.state() == GameState::PreGame);
    BOOST_CHECK_EQUAL(data.snake().segments().size(), 2u);
    BOOST_CHECK(data.snake().direction() == Direction::Up);
    BOOST_CHECK(data.food().position() == (Point{5.0f, 5.0f}));
}

BOOST_AUTO_TEST_SUITE_END()
