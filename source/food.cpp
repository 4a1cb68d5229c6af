#include "food.h"

Food::Food(float fieldWidth, float fieldHeight, float size, unsigned seed)
    : width(fieldWidth), height(fieldHeight), size(size), rng(seed)
{
    pos = randomPoint();
}

Rect Food::bbox() const
{
    const float half = size / 2.0f;
    return {pos.x - half, pos.y - half, size, size};
}

Point Food::randomPoint()
{
    // Keep the whole box inside the field.
    const float half = size / 2.0f;
    std::uniform_real_distribution<float> dx(half, width - half);
    std::uniform_real_distribution<float> dy(half, height - half);
    return {dx(rng), dy(rng)};
}
