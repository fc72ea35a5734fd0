#pragma once

#include "Colormap.h"
#include "Constants.h"
#include "RadargramStore.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

struct Viewport {
  IndexRange traces;
  IndexRange samples;

  bool operator==(const Viewport &o) const {
    return traces == o.traces && samples == o.samples;
  }
  bool operator!=(const Viewport &o) const { return !(*this == o); }
};

// Rectangle in display pixels; corners may be given in any order.
struct PixelRect {
  int x0 = 0;
  int y0 = 0;
  int x1 = 0;
  int y1 = 0;
};

enum class StepDirection { Prev, Next };

struct Appearance {
  std::string colormap = "gray";
  float min = 0.0f;
  float max = 1.0f;
};

struct CursorInfo {
  std::size_t trace = 0;
  std::size_t sample = 0;
  float value = 0.0f;
  double twttUs = 0.0;
  TraceGeolocation geo;
};

struct RenderedImage {
  int width = 0;
  int height = 0;
  Viewport viewport;
  std::vector<Rgba> pixels; // row-major, width * height
};

// Pannable, zoomable view of one radargram. Pixel (0, 0) is the top-left of
// the display; x runs along traces and y down the sample axis.
//
// Not thread-safe: all calls come from the thread that owns the display.
// Only fetch() touches the file, so it may be handed to a worker.
class RadarViewer {
public:
  using CursorListener = std::function<void(const TraceGeolocation &)>;
  using ViewportListener = std::function<void(const Viewport &)>;

  // Throws std::invalid_argument for a null store, a non-positive display
  // size, or an overlap fraction outside
  // [MIN_STEP_OVERLAP, MAX_STEP_OVERLAP].
  RadarViewer(std::shared_ptr<const RadargramStore> store, int displayWidth,
              int displayHeight,
              double overlapFraction = QIceRadar::DEFAULT_STEP_OVERLAP);

  const Viewport &viewport() const { return viewport_; }
  const RadargramStore &store() const { return *store_; }
  double overlapFraction() const { return overlap_; }
  int displayWidth() const { return displayWidth_; }
  int displayHeight() const { return displayHeight_; }

  void setDisplaySize(int width, int height);

  // Viewport becomes `target` intersected with the matrix, at least 1 x 1.
  void zoomIn(const Viewport &target);
  // Same, with the rectangle given in display pixels.
  void zoomInPixels(const PixelRect &rect);
  // Grow the viewport by `factor` (>= 1) around its centre.
  void zoomOut(double factor = QIceRadar::DEFAULT_ZOOM_OUT_FACTOR);
  // Shrink the current view so that it fills `rect` in the new view.
  void zoomOutToRect(const PixelRect &rect);
  void fullExtent();
  // Move by (1 - overlap) of the trace width; stops at the edges.
  void step(StepDirection dir);
  void pan(long long traceDelta, long long sampleDelta);
  // Drag by (dx, dy) pixels: the image follows the pointer.
  void panPixels(int dx, int dy);
  // Viewport is clamped before it is applied.
  void setViewport(const Viewport &vp);

  std::size_t pixelToTrace(int px) const;
  std::size_t pixelToSample(int py) const;
  // First pixel column showing `trace`, or the nearest one when zoomed out
  // past one trace per pixel.
  int traceToPixel(std::size_t trace) const;

  TraceGeolocation cursorToGeolocation(int px) const;
  CursorInfo cursorInfo(int px, int py) const;
  // cursorInfo() plus notifying the cursor listener.
  CursorInfo hover(int px, int py);

  // Throws std::invalid_argument for an unknown colormap or min >= max.
  void setAppearance(const std::string &colormap, float min, float max);
  const Appearance &appearance() const { return appearance_; }

  // Decimation used for the current viewport, ceil(size / display size).
  std::size_t traceStride() const;
  std::size_t sampleStride() const;

  // Reads the current viewport at render stride (blocking I/O).
  RadarSlice fetch() const;
  // Colours a slice into an image of the current display size.
  RenderedImage colorize(const RadarSlice &slice) const;
  RenderedImage render() const { return colorize(fetch()); }

  GeoBounds viewportBounds() const;
  GeoBounds fullBounds() const;
  // Decimated groundtrack of the visible traces.
  std::vector<LatLon> viewportTrack(std::size_t maxPoints = 512) const;

  void setCursorListener(CursorListener l) { cursorListener_ = std::move(l); }
  void setViewportListener(ViewportListener l) {
    viewportListener_ = std::move(l);
  }

private:
  void apply(const Viewport &vp);

  std::shared_ptr<const RadargramStore> store_;
  int displayWidth_;
  int displayHeight_;
  double overlap_;
  Viewport viewport_;
  Appearance appearance_;
  CursorListener cursorListener_;
  ViewportListener viewportListener_;
};
