#pragma once

// 2D coordinate in field units. y grows downwards, like the terminal.
struct Point
{
    float x;
    float y;

    Point operator+(const Point &o) const { return {x + o.x, y + o.y}; }
    Point operator*(float k) const { return {x * k, y * k}; }
    bool operator==(const Point &o) const { return x == o.x && y == o.y; }
    bool operator!=(const Point &o) const { return !(*this == o); }
};
