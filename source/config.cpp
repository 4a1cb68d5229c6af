#include "config.h"
#include "line.h"
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace pt = boost::property_tree;

namespace
{
    std::string lowered(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    void requirePositive(float value, const char *key)
    {
        if (!(value > 0.0f))
        {
            throw std::runtime_error(std::string("config: ") + key + " must be positive");
        }
    }

    // Overwrite value only when key is present; a value that does not convert
    // throws ptree_bad_data instead of falling back to the default.
    template <typename T>
    void readKey(const pt::ptree &tree, const char *key, T &value)
    {
        if (auto child = tree.get_child_optional(key))
        {
            value = child->get_value<T>();
        }
    }
}

Direction parseDirection(const std::string &name)
{
    const std::string n = lowered(name);
    if (n == "up")
        return Direction::Up;
    if (n == "down")
        return Direction::Down;
    if (n == "left")
        return Direction::Left;
    if (n == "right")
        return Direction::Right;
    throw std::runtime_error("config: unknown direction '" + name + "'");
}

void Config::validate() const
{
    requirePositive(fieldWidth, "field.width");
    requirePositive(fieldHeight, "field.height");
    requirePositive(snakeWidth, "snake.width");
    requirePositive(speed, "snake.speed");
    requirePositive(foodSize, "food.size");
    requirePositive(foodGrowth, "food.growth");
    requirePositive(inputInterval, "input.interval");
    if (initialLength < 0.0f)
    {
        throw std::runtime_error("config: snake.initial_length must not be negative");
    }
    if (frameMs <= 0)
    {
        throw std::runtime_error("config: game.frame_ms must be positive");
    }
    if (speed * inputInterval <= snakeWidth)
    {
        throw std::runtime_error("config: snake.speed * input.interval must exceed snake.width");
    }
    // The spawned snake runs from the centre along the start direction.
    const float room = (startDirection == Direction::Up || startDirection == Direction::Down)
                           ? fieldHeight / 2.0f
                           : fieldWidth / 2.0f;
    if (initialLength + kLineEpsilon >= room || snakeWidth >= fieldWidth || snakeWidth >= fieldHeight)
    {
        throw std::runtime_error("config: field too small for the initial snake");
    }
    if (foodSize >= fieldWidth || foodSize >= fieldHeight)
    {
        throw std::runtime_error("config: field too small for food");
    }
}

Config loadConfig(const std::string &path)
{
    Config cfg;
    std::ifstream in(path);
    if (!in.good())
    {
        return cfg;
    }

    pt::ptree tree;
    try
    {
        pt::ini_parser::read_ini(in, tree);
        readKey(tree, "field.width", cfg.fieldWidth);
        readKey(tree, "field.height", cfg.fieldHeight);
        readKey(tree, "snake.width", cfg.snakeWidth);
        readKey(tree, "snake.speed", cfg.speed);
        readKey(tree, "snake.initial_length", cfg.initialLength);
        readKey(tree, "food.size", cfg.foodSize);
        readKey(tree, "food.growth", cfg.foodGrowth);
        readKey(tree, "input.interval", cfg.inputInterval);
        readKey(tree, "game.frame_ms", cfg.frameMs);
        readKey(tree, "log.file", cfg.logFile);
        if (auto dir = tree.get_optional<std::string>("snake.start_direction"))
        {
            cfg.startDirection = parseDirection(*dir);
        }
        if (auto level = tree.get_optional<std::string>("log.level"))
        {
            cfg.logLevel = parseLogLevel(*level);
        }
    }
    catch (const pt::ptree_error &e)
    {
        throw std::runtime_error(path + ": " + e.what());
    }

    cfg.validate();
    return cfg;
}
