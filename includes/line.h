#pragma once
#include "direction.h"
#include "point.h"
#include "rect.h"

// Length a fresh line starts with, so its direction is never ambiguous.
constexpr float kLineEpsilon = 0.01f;

// One straight, axis-aligned run of the snake. `end` is the head-ward point,
// `begin` the tail-ward one; they only ever differ along the line's axis.
class Line
{
public:
    Line(const Point &pos, Direction dir);

    const Point &begin() const { return beg; }
    const Point &end() const { return fin; }
    Direction direction() const { return dir; }

    float size() const;

    // Push `end` forward by dist. Growth at the head is unconstrained, so the
    // leftover is always 0.
    float grow(float dist);

    // Pull `begin` towards `end` by dist, stopping at `end`. Returns the part
    // of dist this line could not absorb.
    float shrink(float dist);

    // Rectangle of the given thickness around the line, used both for drawing
    // and for collisions.
    Rect bbox(float width) const;

private:
    Point beg;
    Point fin;
    Direction dir;
};
