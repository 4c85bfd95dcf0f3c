/* @file CalibrationMap.cpp
 * @brief corner identification, convexity check and inverse bilinear solve
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

// 3rd-party headers
#include <nlohmann/json.hpp>

// PFD headers
#include "hardware/CalibrationMap.hpp"

using namespace pfd::hardware;
using pfd::core::ActuatorAngles;
using pfd::core::Point2D;

namespace {

  struct Vec {
    double x;
    double y;
  };

  Vec sub(const Point2D& a, const Point2D& b) { return { a.u - b.u, a.v - b.v }; }
  double cross(const Vec& a, const Vec& b) { return a.x * b.y - a.y * b.x; }

  /// How far (s,t) lies outside the unit square; 0 inside.
  double outside(double s, double t) {
    auto d = [](double x) { return std::max(0.0, -x) + std::max(0.0, x - 1.0); };
    return d(s) + d(t);
  }

} // namespace

const char* pfd::hardware::toString(Corner c) {
  switch (c) {
  case Corner::TopLeft:
    return "top_left";
  case Corner::TopRight:
    return "top_right";
  case Corner::BottomLeft:
    return "bottom_left";
  case Corner::BottomRight:
    return "bottom_right";
  default:
    return "unknown";
  }
}

std::optional<Corner> pfd::hardware::cornerFromString(std::string_view name) {
  for (auto c : { Corner::TopLeft, Corner::TopRight, Corner::BottomLeft, Corner::BottomRight }) {
    if (name == toString(c))
      return c;
  }
  return std::nullopt;
}

CalibrationMap::CalibrationMap(const Corners& anyOrder) { identify(anyOrder); }

void CalibrationMap::setCorner(Corner c, const CalibrationCorner& value) {
  Corners next = corners_;
  next[static_cast<std::size_t>(c)] = value;
  identify(next);
}

void CalibrationMap::identify(Corners pts) {
  std::sort(pts.begin(), pts.end(), [](const CalibrationCorner& a, const CalibrationCorner& b) {
    return a.camera.v != b.camera.v ? a.camera.v < b.camera.v : a.camera.u < b.camera.u;
  });
  auto byU = [](const CalibrationCorner& a, const CalibrationCorner& b) {
    return a.camera.u < b.camera.u;
  };
  std::sort(pts.begin(), pts.begin() + 2, byU);
  std::sort(pts.begin() + 2, pts.end(), byU);

  corners_[static_cast<std::size_t>(Corner::TopLeft)] = pts[0];
  corners_[static_cast<std::size_t>(Corner::TopRight)] = pts[1];
  corners_[static_cast<std::size_t>(Corner::BottomLeft)] = pts[2];
  corners_[static_cast<std::size_t>(Corner::BottomRight)] = pts[3];

  // walk the outline TL -> TR -> BR -> BL; every turn must go the same way
  const std::array<Point2D, 4> ring{ corner(Corner::TopLeft).camera, corner(Corner::TopRight).camera,
                                     corner(Corner::BottomRight).camera,
                                     corner(Corner::BottomLeft).camera };
  int sign = 0;
  valid_ = true;
  for (std::size_t i = 0; i < ring.size(); ++i) {
    const Vec e0 = sub(ring[(i + 1) % 4], ring[i]);
    const Vec e1 = sub(ring[(i + 2) % 4], ring[(i + 1) % 4]);
    const double z = cross(e0, e1);
    if (!std::isfinite(z) || std::abs(z) < kDegenerateEpsilon) {
      valid_ = false;
      break;
    }
    const int s = z > 0 ? 1 : -1;
    if (sign != 0 && s != sign) {
      valid_ = false;
      break;
    }
    sign = s;
  }
}

Point2D CalibrationMap::centroid() const {
  Point2D c{};
  for (const auto& k : corners_) {
    c.u += k.camera.u * 0.25;
    c.v += k.camera.v * 0.25;
  }
  return c;
}

ActuatorAngles CalibrationMap::blend(double s, double t) const {
  const auto& tl = corner(Corner::TopLeft).angles;
  const auto& tr = corner(Corner::TopRight).angles;
  const auto& bl = corner(Corner::BottomLeft).angles;
  const auto& br = corner(Corner::BottomRight).angles;

  const double wTl = (1.0 - s) * (1.0 - t);
  const double wTr = s * (1.0 - t);
  const double wBl = (1.0 - s) * t;
  const double wBr = s * t;
  return { wTl * tl.a1 + wTr * tr.a1 + wBl * bl.a1 + wBr * br.a1,
           wTl * tl.a2 + wTr * tr.a2 + wBl * bl.a2 + wBr * br.a2 };
}

// -------------------------------------------------------------------
// CalibrationMap::fractional
// Patch: P(s,t) = A + s*E + t*F + s*t*G with A=TL, E=TR-A, F=BL-A,
// G=A-TR+BR-BL. Eliminating s leaves k2*t^2 + k1*t + k0 = 0.
// -------------------------------------------------------------------
std::optional<Point2D> CalibrationMap::fractional(const Point2D& target) const {
  if (!valid_)
    return std::nullopt;

  const Point2D& a = corner(Corner::TopLeft).camera;
  const Point2D& b = corner(Corner::TopRight).camera;
  const Point2D& c = corner(Corner::BottomRight).camera;
  const Point2D& d = corner(Corner::BottomLeft).camera;

  const Vec e = sub(b, a);
  const Vec f = sub(d, a);
  const Vec g{ a.u - b.u + c.u - d.u, a.v - b.v + c.v - d.v };
  const Vec h = sub(target, a);

  const double k2 = cross(g, f);
  const double k1 = cross(e, f) + cross(h, g);
  const double k0 = cross(h, e);

  auto sFor = [&](double t) -> std::optional<double> {
    const double dx = e.x + g.x * t;
    const double dy = e.y + g.y * t;
    if (std::abs(dx) >= std::abs(dy)) {
      if (std::abs(dx) < std::numeric_limits<double>::epsilon())
        return std::nullopt;
      return (h.x - f.x * t) / dx;
    }
    return (h.y - f.y * t) / dy;
  };

  std::array<double, 2> roots{};
  std::size_t nRoots = 0;
  if (std::abs(k2) < kDegenerateEpsilon) {
    if (std::abs(k1) < kDegenerateEpsilon)
      return std::nullopt;
    roots[nRoots++] = -k0 / k1;
  } else {
    // outside the hull the discriminant may go negative: take the vertex
    const double w = std::sqrt(std::max(0.0, k1 * k1 - 4.0 * k0 * k2));
    roots[nRoots++] = (-k1 - w) / (2.0 * k2);
    roots[nRoots++] = (-k1 + w) / (2.0 * k2);
  }

  std::optional<Point2D> bestFit;
  double bestScore = std::numeric_limits<double>::infinity();
  for (std::size_t i = 0; i < nRoots; ++i) {
    const double t = roots[i];
    const auto s = sFor(t);
    if (!s || !std::isfinite(*s) || !std::isfinite(t))
      continue;
    const double score = outside(*s, t);
    if (score < bestScore) {
      bestScore = score;
      bestFit = Point2D{ *s, t };
    }
  }
  return bestFit;
}

nlohmann::json CalibrationMap::toJson() const {
  nlohmann::json out = nlohmann::json::object();
  for (auto c : { Corner::TopLeft, Corner::TopRight, Corner::BottomLeft, Corner::BottomRight }) {
    const auto& k = corner(c);
    out[toString(c)] = { { "cam_x", k.camera.u },
                         { "cam_y", k.camera.v },
                         { "servo1", k.angles.a1 },
                         { "servo2", k.angles.a2 } };
  }
  return out;
}

CalibrationMap CalibrationMap::fromJson(const nlohmann::json& corners) {
  if (!corners.is_object())
    throw std::runtime_error("[CalibrationMap] corners must be an object");

  Corners pts{};
  std::size_t i = 0;
  for (auto c : { Corner::TopLeft, Corner::TopRight, Corner::BottomLeft, Corner::BottomRight }) {
    const std::string key = toString(c);
    auto it = corners.find(key);
    if (it == corners.end() || !it->is_object())
      throw std::runtime_error("[CalibrationMap] missing corner '" + key + "'");

    for (const char* field : { "cam_x", "cam_y", "servo1", "servo2" }) {
      if (!it->contains(field) || !(*it)[field].is_number())
        throw std::runtime_error("[CalibrationMap] corner '" + key + "' needs numeric '" + field +
                                 "'");
    }
    pts[i++] = CalibrationCorner{ { (*it)["cam_x"].get<double>(), (*it)["cam_y"].get<double>() },
                                  { (*it)["servo1"].get<double>(), (*it)["servo2"].get<double>() } };
  }
  return CalibrationMap(pts);
}
