#pragma once
#include "point.h"

enum class Direction
{
    Up,
    Down,
    Left,
    Right
};

// Unit vector in field coordinates (Up is negative y).
Point asVector(Direction d);

// Up/Down share the vertical axis, Left/Right the horizontal one.
bool isColinear(Direction a, Direction b);

const char *toString(Direction d);
