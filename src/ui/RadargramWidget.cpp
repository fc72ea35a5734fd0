#include "RadargramWidget.h"
#include "../core/Logger.h"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace {

// Drags shorter than this are clicks.
constexpr int kMinDragPx = 4;

} // namespace

RadargramWidget::RadargramWidget(int x, int y, int w, int h,
                                 WorkerService &worker,
                                 std::shared_ptr<const RadargramStore> store,
                                 double stepOverlap,
                                 const std::string &colormap,
                                 const std::string &theme)
    : Widget(x, y, w, h), worker_(worker), store_(store),
      viewer_(store, std::max(1, w), std::max(1, h), stepOverlap),
      colors_(getThemeColors(theme)),
      fetch_(std::make_shared<FetchState>()) {
  const Appearance &ap = viewer_.appearance();
  viewer_.setAppearance(colormap, ap.min, ap.max);
  viewer_.setViewportListener([this](const Viewport &) {
    dirty_ = true;
    if (onTrack_)
      onTrack_(viewer_.viewportTrack());
  });
}

RadargramWidget::~RadargramWidget() {
  if (texture_)
    SDL_DestroyTexture(texture_);
}

void RadargramWidget::setCursorListener(RadarViewer::CursorListener l) {
  onCursor_ = l;
  viewer_.setCursorListener(std::move(l));
}

void RadargramWidget::requestWindow() {
  const Viewport vp = viewer_.viewport();
  const std::size_t ts = viewer_.traceStride();
  const std::size_t ss = viewer_.sampleStride();
  auto state = fetch_;
  auto store = store_;

  bool queued = worker_.submitTask([state, store, vp, ts, ss] {
    RadarSlice slice;
    std::string error;
    try {
      slice = store->readWindow(vp.traces, vp.samples, ts, ss);
    } catch (const std::exception &e) {
      error = e.what();
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    state->slice = std::move(slice);
    state->error = std::move(error);
    state->ready = true;
  });
  if (queued) {
    inFlight_ = true;
    dirty_ = false;
  }
}

void RadargramWidget::recolor() {
  if (!haveSlice_)
    return;
  RenderedImage img = viewer_.colorize(lastSlice_);
  pixels_ = std::move(img.pixels);
  textureDirty_ = true;
}

void RadargramWidget::update() {
  if (inFlight_) {
    std::lock_guard<std::mutex> lock(fetch_->mutex);
    if (fetch_->ready) {
      fetch_->ready = false;
      inFlight_ = false;
      if (!fetch_->error.empty()) {
        LOG_E("RadargramWidget", "Window read failed: {}", fetch_->error);
      } else {
        lastSlice_ = std::move(fetch_->slice);
        haveSlice_ = true;
        recolor();
        const Viewport &vp = viewer_.viewport();
        // Stale reads are still shown until the fresh one lands
        if (lastSlice_.traces != vp.traces || lastSlice_.samples != vp.samples ||
            lastSlice_.traceStride != viewer_.traceStride() ||
            lastSlice_.sampleStride != viewer_.sampleStride())
          dirty_ = true;
      }
    }
  }
  if (dirty_ && !inFlight_)
    requestWindow();
}

void RadargramWidget::render(SDL_Renderer *renderer) {
  SDL_SetRenderDrawColor(renderer, colors_.bg.r, colors_.bg.g, colors_.bg.b,
                         colors_.bg.a);
  SDL_Rect rect = {x_, y_, width_, height_};
  SDL_RenderFillRect(renderer, &rect);

  if (textureDirty_) {
    const int w = viewer_.displayWidth();
    const int h = viewer_.displayHeight();
    if (!texture_ || texW_ != w || texH_ != h) {
      if (texture_)
        SDL_DestroyTexture(texture_);
      texture_ = SDL_CreateTexture(renderer, SDL_PIXELFORMAT_RGBA32,
                                   SDL_TEXTUREACCESS_STREAMING, w, h);
      if (!texture_) {
        LOG_E("RadargramWidget", "SDL_CreateTexture failed: {}",
              SDL_GetError());
        return;
      }
      SDL_SetTextureBlendMode(texture_, SDL_BLENDMODE_BLEND);
      texW_ = w;
      texH_ = h;
    }
    if (static_cast<int>(pixels_.size()) == w * h &&
        SDL_UpdateTexture(texture_, nullptr, pixels_.data(),
                          w * static_cast<int>(sizeof(Rgba))) != 0)
      LOG_E("RadargramWidget", "SDL_UpdateTexture failed: {}",
            SDL_GetError());
    textureDirty_ = false;
  }
  if (texture_)
    SDL_RenderCopy(renderer, texture_, nullptr, &rect);

  // Rubber band
  if (drag_ == DragMode::ZoomIn || drag_ == DragMode::ZoomOut) {
    const SDL_Color &c =
        drag_ == DragMode::ZoomIn ? colors_.zoomInBand : colors_.zoomOutBand;
    SDL_SetRenderDrawColor(renderer, c.r, c.g, c.b, c.a);
    SDL_Rect band = {std::min(dragX0_, mouseX_), std::min(dragY0_, mouseY_),
                     std::abs(mouseX_ - dragX0_), std::abs(mouseY_ - dragY0_)};
    SDL_RenderDrawRect(renderer, &band);
  }

  // Crosshair
  if (mouseInside_ && drag_ == DragMode::None) {
    SDL_SetRenderDrawColor(renderer, colors_.crosshair.r, colors_.crosshair.g,
                           colors_.crosshair.b, colors_.crosshair.a);
    SDL_RenderDrawLine(renderer, mouseX_, y_, mouseX_, y_ + height_ - 1);
    SDL_RenderDrawLine(renderer, x_, mouseY_, x_ + width_ - 1, mouseY_);
  }

  SDL_SetRenderDrawColor(renderer, colors_.border.r, colors_.border.g,
                         colors_.border.b, colors_.border.a);
  SDL_RenderDrawRect(renderer, &rect);
}

void RadargramWidget::onResize(int x, int y, int w, int h) {
  Widget::onResize(x, y, w, h);
  viewer_.setDisplaySize(std::max(1, w), std::max(1, h));
  recolor();
  dirty_ = true;
}

bool RadargramWidget::onMouseDown(int mx, int my, Uint8 button) {
  if (!contains(mx, my))
    return false;
  if (button == SDL_BUTTON_LEFT)
    drag_ = DragMode::ZoomIn;
  else if (button == SDL_BUTTON_RIGHT)
    drag_ = DragMode::ZoomOut;
  else if (button == SDL_BUTTON_MIDDLE)
    drag_ = DragMode::Pan;
  else
    return false;
  dragX0_ = mouseX_ = mx;
  dragY0_ = mouseY_ = my;
  return true;
}

bool RadargramWidget::onMouseUp(int mx, int my, Uint8 button) {
  (void)button;
  if (drag_ == DragMode::None)
    return false;
  DragMode mode = drag_;
  drag_ = DragMode::None;

  const bool click =
      std::abs(mx - dragX0_) < kMinDragPx && std::abs(my - dragY0_) < kMinDragPx;
  PixelRect r{dragX0_ - x_, dragY0_ - y_, mx - x_, my - y_};

  if (click) {
    if (mode != DragMode::Pan && contains(mx, my)) {
      // Reads one value from disk when the file is not held in memory
      try {
        CursorInfo info = viewer_.hover(mx - x_, my - y_);
        LOG_I("RadargramWidget",
              "trace {} sample {} value {:.3f} twtt {:.3f} us ({:.5f}, {:.5f})",
              info.trace, info.sample, info.value, info.twttUs, info.geo.lat,
              info.geo.lon);
      } catch (const std::exception &e) {
        LOG_W("RadargramWidget", "Cursor lookup failed: {}", e.what());
      }
    }
    return true;
  }
  if (mode == DragMode::ZoomIn)
    viewer_.zoomInPixels(r);
  else if (mode == DragMode::ZoomOut)
    viewer_.zoomOutToRect(r);
  return true;
}

void RadargramWidget::onMouseMove(int mx, int my) {
  if (drag_ == DragMode::Pan) {
    viewer_.panPixels(mx - mouseX_, my - mouseY_);
  }
  mouseInside_ = contains(mx, my);
  if (!crosshairFrozen_ || drag_ != DragMode::None) {
    mouseX_ = mx;
    mouseY_ = my;
  }
  if (mouseInside_ && drag_ == DragMode::None)
    reportCursor(mx - x_, my - y_);
}

void RadargramWidget::reportCursor(int px, int py) {
  const std::size_t trace = viewer_.pixelToTrace(px);
  const std::size_t sample = viewer_.pixelToSample(py);
  TraceGeolocation geo = store_->traceGeolocation(trace);

  if (!traceFrozen_ && onCursor_)
    onCursor_(geo);

  if (onStatus_) {
    // Value comes from the last window read; no file access while hovering
    float value = std::nanf("");
    if (haveSlice_ && lastSlice_.traces.contains(trace) &&
        lastSlice_.samples.contains(sample)) {
      const std::size_t t = std::min(
          (trace - lastSlice_.traces.start) / lastSlice_.traceStride,
          lastSlice_.numTraces - 1);
      const std::size_t s = std::min(
          (sample - lastSlice_.samples.start) / lastSlice_.sampleStride,
          lastSlice_.numSamples - 1);
      value = lastSlice_.at(t, s);
    }
    onStatus_(fmt::format("trace {} / {}  sample {}  value {:.3f}  "
                          "twtt {:.2f} us  lat {:.5f} lon {:.5f}  {:.1f} km",
                          trace, store_->traceCount(), sample, value,
                          store_->twttMicros(sample), geo.lat, geo.lon,
                          geo.alongTrackM / 1000.0));
  }
}

void RadargramWidget::cycleColormap() {
  const auto names = Colormap::names();
  auto it = std::find(names.begin(), names.end(),
                      viewer_.appearance().colormap);
  std::size_t idx = it == names.end() ? 0 : (it - names.begin() + 1);
  const Appearance ap = viewer_.appearance();
  viewer_.setAppearance(names[idx % names.size()], ap.min, ap.max);
  LOG_I("RadargramWidget", "Colormap {}", viewer_.appearance().colormap);
  recolor();
}

bool RadargramWidget::onKeyDown(SDL_Keycode key, Uint16 mod) {
  (void)mod;
  switch (key) {
  case SDLK_e:
  case SDLK_LEFT:
    viewer_.step(StepDirection::Prev);
    return true;
  case SDLK_r:
  case SDLK_RIGHT:
    viewer_.step(StepDirection::Next);
    return true;
  case SDLK_y:
  case SDLK_HOME:
    viewer_.fullExtent();
    return true;
  case SDLK_f:
    traceFrozen_ = !traceFrozen_;
    return true;
  case SDLK_g:
    crosshairFrozen_ = !crosshairFrozen_;
    return true;
  case SDLK_c:
    cycleColormap();
    return true;
  case SDLK_MINUS:
    viewer_.zoomOut();
    return true;
  case SDLK_EQUALS:
  case SDLK_PLUS:
    return onMouseWheel(1);
  default:
    return false;
  }
}

bool RadargramWidget::onMouseWheel(int scrollY) {
  if (scrollY < 0) {
    viewer_.zoomOut();
    return true;
  }
  if (scrollY > 0) {
    // Keep the middle half
    const Viewport &vp = viewer_.viewport();
    Viewport target;
    target.traces = {vp.traces.start + vp.traces.size() / 4,
                     vp.traces.end - vp.traces.size() / 4};
    target.samples = {vp.samples.start + vp.samples.size() / 4,
                      vp.samples.end - vp.samples.size() / 4};
    viewer_.zoomIn(target);
    return true;
  }
  return false;
}
