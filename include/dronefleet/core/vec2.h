#pragma once
#include <cmath>

namespace dronefleet {

// 2D point/vector in world units (the simulated map is nominally metres).
struct Vec2 {
  double x{0.0};
  double y{0.0};

  Vec2() = default;
  Vec2(double x_, double y_) : x(x_), y(y_) {}

  Vec2 operator+(const Vec2& rhs) const { return {x + rhs.x, y + rhs.y}; }
  Vec2 operator-(const Vec2& rhs) const { return {x - rhs.x, y - rhs.y}; }
  Vec2 operator*(double s) const { return {x * s, y * s}; }

  // Exact equality; intended for stored coordinates, not computed ones.
  bool operator==(const Vec2& rhs) const { return x == rhs.x && y == rhs.y; }
  bool operator!=(const Vec2& rhs) const { return !(*this == rhs); }

  double length() const { return std::sqrt(x * x + y * y); }
  Vec2 normalized() const {
    const double len = length();
    if (len <= 1e-12) return {0.0, 0.0};
    return {x / len, y / len};
  }

  bool is_finite() const { return std::isfinite(x) && std::isfinite(y); }
};

inline double distance(const Vec2& a, const Vec2& b) { return (b - a).length(); }

// Step from `pos` toward `target` by at most `max_step`. Lands exactly on the
// target when it is within reach.
inline Vec2 move_towards(const Vec2& pos, const Vec2& target, double max_step) {
  const Vec2 delta = target - pos;
  const double dist = delta.length();
  if (dist <= max_step || dist <= 1e-9) return target;
  return pos + delta.normalized() * max_step;
}

} // namespace dronefleet
