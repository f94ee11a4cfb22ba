#pragma once

#include <cmath>

namespace pontoon::core {

// World space: metres, Y up, X/Z horizontal.
struct Vec3d {
  double x = 0.0;
  double y = 0.0;
  double z = 0.0;

  bool operator==(const Vec3d& other) const = default;
};

inline Vec3d operator+(const Vec3d& a, const Vec3d& b) {
  return {a.x + b.x, a.y + b.y, a.z + b.z};
}

inline Vec3d operator-(const Vec3d& a, const Vec3d& b) {
  return {a.x - b.x, a.y - b.y, a.z - b.z};
}

inline Vec3d operator*(const Vec3d& v, double s) {
  return {v.x * s, v.y * s, v.z * s};
}

inline double dot(const Vec3d& a, const Vec3d& b) {
  return a.x * b.x + a.y * b.y + a.z * b.z;
}

inline Vec3d cross(const Vec3d& a, const Vec3d& b) {
  return {a.y * b.z - a.z * b.y, a.z * b.x - a.x * b.z, a.x * b.y - a.y * b.x};
}

inline double length(const Vec3d& v) {
  return std::sqrt(dot(v, v));
}

inline Vec3d normalized(const Vec3d& v) {
  const double len = length(v);
  if (len <= 1e-12) {
    return {};
  }
  return v * (1.0 / len);
}

struct Ray3d {
  Vec3d origin{};
  Vec3d direction{0.0, 0.0, -1.0};
};

// Pointer position in viewport pixels, origin top-left.
struct ScreenPoint {
  double x = 0.0;
  double y = 0.0;

  bool operator==(const ScreenPoint& other) const = default;
};

struct AABBd {
  Vec3d min{};
  Vec3d max{};
};

}  // namespace pontoon::core
