#pragma once

// Scalar helpers used by the distance bookkeeping of lines and the snake.

inline float maxf(float x, float y)
{
    return x > y ? x : y;
}

inline float minf(float x, float y)
{
    return x > y ? y : x;
}

inline float clampf(float x, float lo, float hi)
{
    if (x > hi)
        return hi;
    if (x < lo)
        return lo;
    return x;
}
