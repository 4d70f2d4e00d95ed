// Mathematical constants and geometric tolerances (millimetre model units)
#pragma once

namespace lamp::units {

inline constexpr double pi = 3.141592653589793238462643383279502884;

inline constexpr double deg2rad(double deg) { return deg * pi / 180.0; }

// Two radii closer than this (relative to max(1, r)) describe a zero-width annulus
inline constexpr double radius_eps = 1e-9;

// Faces with area below this [mm^2] count as degenerate
inline constexpr double area_eps = 1e-12;

// Ray/triangle: |det| below this is a parallel (grazing) ray
inline constexpr double det_eps = 1e-12;

// Ray/triangle: hits closer than this [mm] to the origin are ignored
inline constexpr double hit_eps = 1e-6;

// Hits whose distances differ by less than this [mm] are ties
inline constexpr double tie_eps = 1e-9;

} // namespace lamp::units
