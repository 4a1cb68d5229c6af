// Snake implementation
#include "snake.h"
#include <algorithm>
#include <numeric>

Snake::Snake(const Point &start, Direction dir, float width, float initialLength)
    : thickness(width)
{
    body.emplace_back(start, dir);
    if (initialLength > 0.0f)
    {
        grow(initialLength);
    }
}

void Snake::turn(Direction d)
{
    if (isColinear(d, direction()))
    {
        return;
    }
    body.emplace_back(head(), d);
}

void Snake::move(float dist)
{
    if (dist <= 0.0f)
        return;
    body.back().grow(dist);
    retract(dist);
}

void Snake::grow(float dist)
{
    if (dist <= 0.0f)
        return;
    body.back().grow(dist);
}

void Snake::retract(float dist)
{
    float left = dist;
    while (left > 0.0f)
    {
        left = body.front().shrink(left);
        if (body.size() == 1)
        {
            break;
        }
        if (left > 0.0f || body.front().size() <= 0.0f)
        {
            // Consumed past its end: the next line takes the rest.
            body.pop_front();
        }
    }
}

float Snake::length() const
{
    return std::accumulate(body.begin(), body.end(), 0.0f, [](float acc, const Line &l)
                           { return acc + l.size(); });
}

bool Snake::collides(const Rect &box) const
{
    return std::any_of(body.begin(), body.end(), [&](const Line &l)
                       { return l.bbox(thickness).intersects(box); });
}

bool Snake::selfCollides() const
{
    if (body.size() < 3)
        return false;
    const Rect headBox = body.back().bbox(thickness);
    // The head always overlaps its neighbour at the joint, so skip both.
    return std::any_of(body.begin(), body.end() - 2, [&](const Line &l)
                       { return l.bbox(thickness).intersects(headBox); });
}

bool Snake::wallCollides(const Rect &field) const
{
    return !field.contains(body.back().bbox(thickness));
}
