#include "line.h"
#include "maths.h"
#include <cmath>

Line::Line(const Point &pos, Direction dir)
    : beg(pos), fin(pos + asVector(dir) * kLineEpsilon), dir(dir)
{
}

float Line::size() const
{
    switch (dir)
    {
    case Direction::Up:
    case Direction::Down:
        return std::fabs(fin.y - beg.y);
    case Direction::Left:
    case Direction::Right:
        return std::fabs(fin.x - beg.x);
    }
    return 0.0f;
}

float Line::grow(float dist)
{
    fin = fin + asVector(dir) * dist;
    return 0.0f;
}

float Line::shrink(float dist)
{
    float current = size();
    float left = clampf(dist - current, 0.0f, dist);
    if (dist >= current)
    {
        // Fully consumed; collapse onto the end point exactly.
        beg = fin;
        return left;
    }
    beg = beg + asVector(dir) * dist;
    return 0.0f;
}

Rect Line::bbox(float width) const
{
    const float half = width / 2.0f;
    switch (dir)
    {
    case Direction::Up:
        return {fin.x - half, fin.y, width, beg.y - fin.y};
    case Direction::Down:
        return {beg.x - half, beg.y, width, fin.y - beg.y};
    case Direction::Left:
        return {fin.x, fin.y - half, beg.x - fin.x, width};
    case Direction::Right:
        return {beg.x, beg.y - half, fin.x - beg.x, width};
    }
    return {beg.x, beg.y, 0.0f, 0.0f};
}
