#pragma once
#include <deque>
#include "direction.h"
#include "line.h"
#include "rect.h"

// The snake body: a chain of lines ordered tail (front) to head (back).
// Consecutive lines touch end-to-begin and are never colinear.
class Snake
{
public:
    Snake(const Point &start, Direction dir, float width, float initialLength = 0.0f);

    // Start a new head line if d is a real turn; same-axis input is ignored.
    void turn(Direction d);
    // Advance by dist keeping the total length unchanged.
    void move(float dist);
    // Advance the head by dist without retracting the tail.
    void grow(float dist);

    bool collides(const Rect &box) const;
    bool selfCollides() const;
    bool wallCollides(const Rect &field) const;

    Direction direction() const { return body.back().direction(); }
    const Point &head() const { return body.back().end(); }
    const std::deque<Line> &segments() const { return body; }
    float width() const { return thickness; }
    float length() const;

private:
    void retract(float dist);

    std::deque<Line> body;
    float thickness;
};
