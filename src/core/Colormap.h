#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

struct Rgba {
  std::uint8_t r = 0;
  std::uint8_t g = 0;
  std::uint8_t b = 0;
  std::uint8_t a = 255;
};

// 256-entry lookup table built from a handful of control points.
class Colormap {
public:
  // "gray", "Greys", "jet", "viridis", "inferno", "seismic". Names are
  // matched case-sensitively, as in the radargram viewer's menu, since
  // "gray" and "Greys" are different maps. Throws std::invalid_argument for
  // anything else.
  static const Colormap &byName(const std::string &name);

  static bool isKnown(const std::string &name);
  static std::vector<std::string> names();

  const std::string &name() const { return name_; }

  // Colour for `v` scaled into [lo, hi]. Values outside are clamped;
  // NaN maps to transparent black.
  Rgba map(float v, float lo, float hi) const;

  const Rgba &at(std::uint8_t index) const { return lut_[index]; }

private:
  struct Stop {
    float pos;
    float r, g, b;
  };

  Colormap(std::string name, const std::vector<Stop> &stops);

  std::string name_;
  std::array<Rgba, 256> lut_;
};
