#include "direction.h"

Point asVector(Direction d)
{
    switch (d)
    {
    case Direction::Up:
        return {0.0f, -1.0f};
    case Direction::Down:
        return {0.0f, 1.0f};
    case Direction::Left:
        return {-1.0f, 0.0f};
    case Direction::Right:
        return {1.0f, 0.0f};
    }
    return {0.0f, 0.0f};
}

namespace
{
    bool isVertical(Direction d)
    {
        return d == Direction::Up || d == Direction::Down;
    }
}

bool isColinear(Direction a, Direction b)
{
    return isVertical(a) == isVertical(b);
}

const char *toString(Direction d)
{
    switch (d)
    {
    case Direction::Up:
        return "up";
    case Direction::Down:
        return "down";
    case Direction::Left:
        return "left";
    case Direction::Right:
        return "right";
    }
    return "?";
}
