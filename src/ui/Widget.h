#pragma once

#include <SDL.h>

class Widget {
public:
  Widget(int x, int y, int width, int height)
      : x_(x), y_(y), width_(width), height_(height) {}

  virtual ~Widget() = default;

  SDL_Rect getRect() const { return {x_, y_, width_, height_}; }
  bool contains(int mx, int my) const {
    return mx >= x_ && mx < x_ + width_ && my >= y_ && my < y_ + height_;
  }

  virtual void update() = 0;
  virtual void render(SDL_Renderer *renderer) = 0;

  // Called when the window is resized.
  virtual void onResize(int x, int y, int w, int h) {
    x_ = x;
    y_ = y;
    width_ = w;
    height_ = h;
  }

  // Mouse coordinates are window coordinates. Return true if handled.
  virtual bool onMouseDown(int mx, int my, Uint8 button) {
    (void)mx;
    (void)my;
    (void)button;
    return false;
  }
  virtual bool onMouseUp(int mx, int my, Uint8 button) {
    (void)mx;
    (void)my;
    (void)button;
    return false;
  }
  virtual void onMouseMove(int mx, int my) {
    (void)mx;
    (void)my;
  }

  // Called on keyboard events. Returns true if consumed.
  virtual bool onKeyDown(SDL_Keycode key, Uint16 mod) {
    (void)key;
    (void)mod;
    return false;
  }
  virtual bool onMouseWheel(int scrollY) {
    (void)scrollY;
    return false;
  }

protected:
  int x_;
  int y_;
  int width_;
  int height_;
};
