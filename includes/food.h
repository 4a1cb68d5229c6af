#pragma once
#include "point.h"
#include "rect.h"
#include <random>

class Food
{
public:
    Food(float fieldWidth, float fieldHeight, float size, unsigned seed);

    const Point &position() const { return pos; }
    // Square of side `size` centred on the position.
    Rect bbox() const;

    // Move to a random spot inside the field, retrying until `isOccupied`
    // rejects no more. Returns the number of draws it took.
    template <typename OccupiedFn>
    int respawn(OccupiedFn &&isOccupied);

    void placeAt(const Point &p) { pos = p; }

private:
    Point randomPoint();

    float width;
    float height;
    float size;
    Point pos{0.0f, 0.0f};
    std::mt19937 rng;
};

template <typename OccupiedFn>
int Food::respawn(OccupiedFn &&isOccupied)
{
    int tries = 0;
    do
    {
        pos = randomPoint();
        ++tries;
    } while (isOccupied(bbox()));
    return tries;
}
