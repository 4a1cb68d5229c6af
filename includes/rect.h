#pragma once

// Axis-aligned rectangle; (x, y) is the top-left corner.
struct Rect
{
    float x;
    float y;
    float w;
    float h;

    float left() const { return x; }
    float right() const { return x + w; }
    float top() const { return y; }
    float bottom() const { return y + h; }

    // Positive-area overlap only: rectangles sharing an edge do not intersect.
    bool intersects(const Rect &o) const
    {
        return left() < o.right() && o.left() < right() &&
               top() < o.bottom() && o.top() < bottom();
    }

    // True when o lies completely inside this rectangle (edges included).
    bool contains(const Rect &o) const
    {
        return o.left() >= left() && o.right() <= right() &&
               o.top() >= top() && o.bottom() <= bottom();
    }
};
