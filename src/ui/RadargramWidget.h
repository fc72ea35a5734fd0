#pragma once

#include "../core/RadarViewer.h"
#include "../core/Theme.h"
#include "../core/WorkerService.h"
#include "Widget.h"

#include <SDL.h>

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Interactive radargram display.
//
//   left drag    zoom to the rectangle
//   right drag   zoom out so the current view fits the rectangle
//   middle drag  pan
//   wheel        zoom in / out around the centre
//   E / R / Y    previous / next / full extent (arrows and Home too)
//   C            next colormap
//   F, G         freeze the reported position / the crosshair
//
// Window reads happen on the worker pool; colouring and texture upload on
// the render thread.
class RadargramWidget : public Widget {
public:
  using StatusCallback = std::function<void(const std::string &)>;

  RadargramWidget(int x, int y, int w, int h, WorkerService &worker,
                  std::shared_ptr<const RadargramStore> store,
                  double stepOverlap, const std::string &colormap,
                  const std::string &theme = "default");
  ~RadargramWidget() override;

  void update() override;
  void render(SDL_Renderer *renderer) override;
  void onResize(int x, int y, int w, int h) override;
  bool onMouseDown(int mx, int my, Uint8 button) override;
  bool onMouseUp(int mx, int my, Uint8 button) override;
  void onMouseMove(int mx, int my) override;
  bool onKeyDown(SDL_Keycode key, Uint16 mod) override;
  bool onMouseWheel(int scrollY) override;

  RadarViewer &viewer() { return viewer_; }

  // Position under the cursor, for the map host.
  void setCursorListener(RadarViewer::CursorListener l);
  // Visible track after each viewport change, for the map host.
  void setTrackListener(std::function<void(const std::vector<LatLon> &)> l) {
    onTrack_ = std::move(l);
  }
  void setStatusCallback(StatusCallback cb) { onStatus_ = std::move(cb); }

private:
  enum class DragMode { None, ZoomIn, ZoomOut, Pan };

  // Shared with in-flight worker tasks, which may outlive the widget.
  struct FetchState {
    std::mutex mutex;
    bool ready = false;
    RadarSlice slice;
    std::string error;
  };

  void requestWindow();
  void recolor();
  void reportCursor(int px, int py);
  void cycleColormap();

  WorkerService &worker_;
  std::shared_ptr<const RadargramStore> store_;
  RadarViewer viewer_;
  ThemeColors colors_;

  std::shared_ptr<FetchState> fetch_;
  bool inFlight_ = false;
  bool dirty_ = true;

  RadarSlice lastSlice_;
  bool haveSlice_ = false;
  std::vector<Rgba> pixels_;
  bool textureDirty_ = false;
  SDL_Texture *texture_ = nullptr;
  int texW_ = 0;
  int texH_ = 0;

  DragMode drag_ = DragMode::None;
  int dragX0_ = 0;
  int dragY0_ = 0;
  int mouseX_ = 0;
  int mouseY_ = 0;
  bool mouseInside_ = false;
  bool traceFrozen_ = false;
  bool crosshairFrozen_ = false;

  RadarViewer::CursorListener onCursor_;
  std::function<void(const std::vector<LatLon> &)> onTrack_;
  StatusCallback onStatus_;
};
