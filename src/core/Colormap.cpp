#include "Colormap.h"

#include <cmath>
#include <map>
#include <mutex>
#include <stdexcept>

namespace {

// Control points sampled from the matplotlib maps of the same name.
const std::map<std::string, std::vector<std::array<float, 4>>> &stopTable() {
  static const std::map<std::string, std::vector<std::array<float, 4>>> table =
      {
          {"gray", {{0.0f, 0.0f, 0.0f, 0.0f}, {1.0f, 1.0f, 1.0f, 1.0f}}},
          {"Greys", {{0.0f, 1.0f, 1.0f, 1.0f}, {1.0f, 0.0f, 0.0f, 0.0f}}},
          {"jet",
           {{0.0f, 0.0f, 0.0f, 0.5f},
            {0.11f, 0.0f, 0.0f, 1.0f},
            {0.125f, 0.0f, 0.0f, 1.0f},
            {0.34f, 0.0f, 0.86f, 1.0f},
            {0.35f, 0.0f, 0.9f, 0.97f},
            {0.64f, 1.0f, 1.0f, 0.0f},
            {0.65f, 1.0f, 0.96f, 0.0f},
            {0.89f, 1.0f, 0.0f, 0.0f},
            {1.0f, 0.5f, 0.0f, 0.0f}}},
          {"viridis",
           {{0.0f, 0.267f, 0.005f, 0.329f},
            {0.125f, 0.283f, 0.141f, 0.458f},
            {0.25f, 0.254f, 0.265f, 0.530f},
            {0.375f, 0.207f, 0.372f, 0.553f},
            {0.5f, 0.164f, 0.471f, 0.558f},
            {0.625f, 0.128f, 0.567f, 0.551f},
            {0.75f, 0.135f, 0.659f, 0.518f},
            {0.875f, 0.478f, 0.821f, 0.318f},
            {1.0f, 0.993f, 0.906f, 0.144f}}},
          {"inferno",
           {{0.0f, 0.001f, 0.000f, 0.014f},
            {0.125f, 0.088f, 0.044f, 0.224f},
            {0.25f, 0.258f, 0.039f, 0.406f},
            {0.375f, 0.416f, 0.090f, 0.433f},
            {0.5f, 0.578f, 0.148f, 0.404f},
            {0.625f, 0.736f, 0.216f, 0.330f},
            {0.75f, 0.865f, 0.317f, 0.226f},
            {0.875f, 0.964f, 0.516f, 0.084f},
            {1.0f, 0.988f, 0.998f, 0.645f}}},
          {"seismic",
           {{0.0f, 0.0f, 0.0f, 0.3f},
            {0.25f, 0.0f, 0.0f, 1.0f},
            {0.5f, 1.0f, 1.0f, 1.0f},
            {0.75f, 1.0f, 0.0f, 0.0f},
            {1.0f, 0.5f, 0.0f, 0.0f}}},
      };
  return table;
}

std::uint8_t toByte(float c) {
  if (c <= 0.0f)
    return 0;
  if (c >= 1.0f)
    return 255;
  return static_cast<std::uint8_t>(std::lround(c * 255.0f));
}

} // namespace

Colormap::Colormap(std::string name, const std::vector<Stop> &stops)
    : name_(std::move(name)) {
  for (int i = 0; i < 256; ++i) {
    const float x = i / 255.0f;
    std::size_t k = 1;
    while (k + 1 < stops.size() && stops[k].pos < x)
      ++k;
    const Stop &a = stops[k - 1];
    const Stop &b = stops[k];
    const float span = b.pos - a.pos;
    const float t = span > 0.0f ? (x - a.pos) / span : 0.0f;
    lut_[i].r = toByte(a.r + t * (b.r - a.r));
    lut_[i].g = toByte(a.g + t * (b.g - a.g));
    lut_[i].b = toByte(a.b + t * (b.b - a.b));
    lut_[i].a = 255;
  }
}

const Colormap &Colormap::byName(const std::string &name) {
  static std::map<std::string, Colormap> built;
  static std::once_flag once;
  std::call_once(once, [] {
    for (const auto &kv : stopTable()) {
      std::vector<Stop> stops;
      for (const auto &s : kv.second)
        stops.push_back({s[0], s[1], s[2], s[3]});
      built.emplace(kv.first, Colormap(kv.first, stops));
    }
  });
  auto it = built.find(name);
  if (it == built.end())
    throw std::invalid_argument("unknown colormap '" + name + "'");
  return it->second;
}

bool Colormap::isKnown(const std::string &name) {
  return stopTable().count(name) > 0;
}

std::vector<std::string> Colormap::names() {
  return {"gray", "Greys", "jet", "viridis", "inferno", "seismic"};
}

Rgba Colormap::map(float v, float lo, float hi) const {
  if (std::isnan(v))
    return {0, 0, 0, 0};
  float t = hi > lo ? (v - lo) / (hi - lo) : 0.0f;
  if (t < 0.0f)
    t = 0.0f;
  else if (t > 1.0f)
    t = 1.0f;
  return lut_[static_cast<std::size_t>(t * 255.0f + 0.5f)];
}
