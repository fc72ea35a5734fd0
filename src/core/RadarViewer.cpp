#include "RadarViewer.h"
#include "Logger.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace {

// Range of `width` items starting at `start`, shifted to lie inside [0, n).
IndexRange placeRange(long long start, std::size_t width, std::size_t n) {
  width = std::max<std::size_t>(1, std::min(width, n));
  const long long maxStart = static_cast<long long>(n - width);
  start = std::max(0LL, std::min(start, maxStart));
  return {static_cast<std::size_t>(start),
          static_cast<std::size_t>(start) + width};
}

// Intersection of [a, b) with [0, n), never empty.
IndexRange intersectRange(long long a, long long b, std::size_t n) {
  if (b < a)
    std::swap(a, b);
  const long long last = static_cast<long long>(n) - 1;
  long long s = std::max(0LL, std::min(a, last));
  long long e = std::min(static_cast<long long>(n), b);
  if (e <= s)
    e = s + 1;
  return {static_cast<std::size_t>(s), static_cast<std::size_t>(e)};
}

std::size_t mapPixel(int p, int extent, const IndexRange &r) {
  p = std::max(0, std::min(p, extent - 1));
  const std::size_t off = static_cast<std::size_t>(
      static_cast<std::uint64_t>(p) * r.size() / static_cast<std::uint64_t>(extent));
  return std::min(r.start + off, r.end - 1);
}

std::size_t ceilDiv(std::size_t a, std::size_t b) { return (a + b - 1) / b; }

} // namespace

RadarViewer::RadarViewer(std::shared_ptr<const RadargramStore> store,
                         int displayWidth, int displayHeight,
                         double overlapFraction)
    : store_(std::move(store)), displayWidth_(displayWidth),
      displayHeight_(displayHeight), overlap_(overlapFraction) {
  if (!store_)
    throw std::invalid_argument("RadarViewer: no store");
  if (displayWidth_ <= 0 || displayHeight_ <= 0)
    throw std::invalid_argument("RadarViewer: display size must be positive");
  if (overlap_ < QIceRadar::MIN_STEP_OVERLAP ||
      overlap_ > QIceRadar::MAX_STEP_OVERLAP)
    throw std::invalid_argument("RadarViewer: overlap fraction out of range");

  viewport_.traces = {0, store_->traceCount()};
  viewport_.samples = {0, store_->sampleCount()};

  IntensityStats stats = store_->intensityStats();
  if (stats.valid) {
    appearance_.min = stats.min;
    appearance_.max = stats.max;
  }
}

void RadarViewer::setDisplaySize(int width, int height) {
  if (width <= 0 || height <= 0)
    throw std::invalid_argument("RadarViewer: display size must be positive");
  displayWidth_ = width;
  displayHeight_ = height;
}

void RadarViewer::apply(const Viewport &vp) {
  if (vp == viewport_)
    return;
  viewport_ = vp;
  LOG_D("RadarViewer", "viewport traces [{}, {}) samples [{}, {})",
        viewport_.traces.start, viewport_.traces.end, viewport_.samples.start,
        viewport_.samples.end);
  if (viewportListener_)
    viewportListener_(viewport_);
}

void RadarViewer::setViewport(const Viewport &vp) { zoomIn(vp); }

void RadarViewer::zoomIn(const Viewport &target) {
  Viewport vp;
  vp.traces = intersectRange(static_cast<long long>(target.traces.start),
                             static_cast<long long>(target.traces.end),
                             store_->traceCount());
  vp.samples = intersectRange(static_cast<long long>(target.samples.start),
                              static_cast<long long>(target.samples.end),
                              store_->sampleCount());
  apply(vp);
}

void RadarViewer::zoomInPixels(const PixelRect &rect) {
  const int xa = std::min(rect.x0, rect.x1);
  const int xb = std::max(rect.x0, rect.x1);
  const int ya = std::min(rect.y0, rect.y1);
  const int yb = std::max(rect.y0, rect.y1);

  Viewport target;
  target.traces = {pixelToTrace(xa), pixelToTrace(xb) + 1};
  target.samples = {pixelToSample(ya), pixelToSample(yb) + 1};
  zoomIn(target);
}

void RadarViewer::zoomOut(double factor) {
  if (!(factor >= 1.0))
    throw std::invalid_argument("zoomOut: factor must be >= 1");

  auto grow = [factor](const IndexRange &r, std::size_t n) {
    // Clamp before converting; factor may be huge or infinite
    const double grown = std::min(static_cast<double>(r.size()) * factor,
                                  static_cast<double>(n));
    const std::size_t width = static_cast<std::size_t>(std::ceil(grown));
    const double centre = r.start + r.size() / 2.0;
    const long long start = std::llround(centre - width / 2.0);
    return placeRange(start, width, n);
  };

  Viewport vp;
  vp.traces = grow(viewport_.traces, store_->traceCount());
  vp.samples = grow(viewport_.samples, store_->sampleCount());
  apply(vp);
}

void RadarViewer::zoomOutToRect(const PixelRect &rect) {
  const int xa = std::max(0, std::min(rect.x0, rect.x1));
  const int xb = std::min(displayWidth_, std::max(rect.x0, rect.x1));
  const int ya = std::max(0, std::min(rect.y0, rect.y1));
  const int yb = std::min(displayHeight_, std::max(rect.y0, rect.y1));

  // The current view ends up drawn inside the rectangle.
  auto shrinkInto = [](const IndexRange &r, int a, int b, int extent,
                       std::size_t n) {
    const double rectPx = std::max(1, b - a);
    const double perPx = r.size() / rectPx;
    const std::size_t width =
        static_cast<std::size_t>(std::ceil(perPx * extent));
    const long long start = std::llround(r.start - a * perPx);
    return placeRange(start, width, n);
  };

  Viewport vp;
  vp.traces = shrinkInto(viewport_.traces, xa, xb, displayWidth_,
                         store_->traceCount());
  vp.samples = shrinkInto(viewport_.samples, ya, yb, displayHeight_,
                          store_->sampleCount());
  apply(vp);
}

void RadarViewer::fullExtent() {
  Viewport vp;
  vp.traces = {0, store_->traceCount()};
  vp.samples = {0, store_->sampleCount()};
  apply(vp);
}

void RadarViewer::step(StepDirection dir) {
  const std::size_t width = viewport_.traces.size();
  const long long shift = std::max<long long>(
      1, static_cast<long long>(
             std::floor(width * (1.0 - overlap_) + 1e-9)));
  const long long start =
      static_cast<long long>(viewport_.traces.start) +
      (dir == StepDirection::Next ? shift : -shift);

  Viewport vp = viewport_;
  vp.traces = placeRange(start, width, store_->traceCount());
  apply(vp);
}

void RadarViewer::pan(long long traceDelta, long long sampleDelta) {
  Viewport vp;
  vp.traces = placeRange(
      static_cast<long long>(viewport_.traces.start) + traceDelta,
      viewport_.traces.size(), store_->traceCount());
  vp.samples = placeRange(
      static_cast<long long>(viewport_.samples.start) + sampleDelta,
      viewport_.samples.size(), store_->sampleCount());
  apply(vp);
}

void RadarViewer::panPixels(int dx, int dy) {
  const double tracesPerPx =
      static_cast<double>(viewport_.traces.size()) / displayWidth_;
  const double samplesPerPx =
      static_cast<double>(viewport_.samples.size()) / displayHeight_;
  pan(-std::llround(dx * tracesPerPx), -std::llround(dy * samplesPerPx));
}

std::size_t RadarViewer::pixelToTrace(int px) const {
  return mapPixel(px, displayWidth_, viewport_.traces);
}

std::size_t RadarViewer::pixelToSample(int py) const {
  return mapPixel(py, displayHeight_, viewport_.samples);
}

int RadarViewer::traceToPixel(std::size_t trace) const {
  const IndexRange &r = viewport_.traces;
  if (!r.contains(trace))
    throw std::out_of_range("traceToPixel: trace not in viewport");
  const std::uint64_t k = trace - r.start;
  const std::uint64_t px =
      (k * static_cast<std::uint64_t>(displayWidth_) + r.size() - 1) /
      r.size();
  return static_cast<int>(
      std::min<std::uint64_t>(px, static_cast<std::uint64_t>(displayWidth_ - 1)));
}

TraceGeolocation RadarViewer::cursorToGeolocation(int px) const {
  return store_->traceGeolocation(pixelToTrace(px));
}

CursorInfo RadarViewer::cursorInfo(int px, int py) const {
  CursorInfo info;
  info.trace = pixelToTrace(px);
  info.sample = pixelToSample(py);
  info.value = store_->value(info.trace, info.sample);
  info.twttUs = store_->twttMicros(info.sample);
  info.geo = store_->traceGeolocation(info.trace);
  return info;
}

CursorInfo RadarViewer::hover(int px, int py) {
  CursorInfo info = cursorInfo(px, py);
  if (cursorListener_)
    cursorListener_(info.geo);
  return info;
}

void RadarViewer::setAppearance(const std::string &colormap, float min,
                                float max) {
  if (!Colormap::isKnown(colormap))
    throw std::invalid_argument("unknown colormap '" + colormap + "'");
  if (!(min < max))
    throw std::invalid_argument("setAppearance: min must be below max");
  appearance_.colormap = colormap;
  appearance_.min = min;
  appearance_.max = max;
}

std::size_t RadarViewer::traceStride() const {
  return std::max<std::size_t>(
      1, ceilDiv(viewport_.traces.size(),
                 static_cast<std::size_t>(displayWidth_)));
}

std::size_t RadarViewer::sampleStride() const {
  return std::max<std::size_t>(
      1, ceilDiv(viewport_.samples.size(),
                 static_cast<std::size_t>(displayHeight_)));
}

RadarSlice RadarViewer::fetch() const {
  return store_->readWindow(viewport_.traces, viewport_.samples, traceStride(),
                            sampleStride());
}

RenderedImage RadarViewer::colorize(const RadarSlice &slice) const {
  RenderedImage img;
  img.width = displayWidth_;
  img.height = displayHeight_;
  img.viewport = viewport_;
  img.pixels.resize(static_cast<std::size_t>(displayWidth_) * displayHeight_);
  if (slice.values.empty())
    return img;

  const Colormap &cmap = Colormap::byName(appearance_.colormap);

  std::vector<std::size_t> cols(displayWidth_);
  for (int x = 0; x < displayWidth_; ++x) {
    const std::size_t t = mapPixel(x, displayWidth_, slice.traces);
    cols[x] = std::min((t - slice.traces.start) / slice.traceStride,
                       slice.numTraces - 1);
  }
  for (int y = 0; y < displayHeight_; ++y) {
    const std::size_t s = mapPixel(y, displayHeight_, slice.samples);
    const std::size_t row = std::min(
        (s - slice.samples.start) / slice.sampleStride, slice.numSamples - 1);
    Rgba *out = &img.pixels[static_cast<std::size_t>(y) * displayWidth_];
    for (int x = 0; x < displayWidth_; ++x)
      out[x] = cmap.map(slice.at(cols[x], row), appearance_.min,
                        appearance_.max);
  }
  return img;
}

GeoBounds RadarViewer::viewportBounds() const {
  return store_->bounds(viewport_.traces);
}

GeoBounds RadarViewer::fullBounds() const {
  return store_->bounds({0, store_->traceCount()});
}

std::vector<LatLon> RadarViewer::viewportTrack(std::size_t maxPoints) const {
  std::vector<LatLon> track;
  if (maxPoints == 0)
    return track;
  const IndexRange &r = viewport_.traces;
  const std::size_t stride = std::max<std::size_t>(1, ceilDiv(r.size(), maxPoints));
  const auto &lat = store_->latitudes();
  const auto &lon = store_->longitudes();

  auto push = [&](std::size_t i) {
    if (std::isfinite(lat[i]) && std::isfinite(lon[i]))
      track.push_back({lat[i], lon[i]});
  };
  for (std::size_t i = r.start; i < r.end; i += stride)
    push(i);
  if ((r.size() - 1) % stride != 0)
    push(r.end - 1);
  return track;
}
