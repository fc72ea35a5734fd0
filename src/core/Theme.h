#pragma once

#include <SDL.h>
#include <string>

struct ThemeColors {
  SDL_Color bg;
  SDL_Color border;
  SDL_Color crosshair;
  SDL_Color zoomInBand;
  SDL_Color zoomOutBand;
};

inline ThemeColors getThemeColors(const std::string &theme) {
  ThemeColors colors;
  if (theme == "light") {
    colors.bg = {235, 235, 235, 255};
    colors.border = {120, 120, 120, 255};
    colors.crosshair = {200, 0, 0, 255};
    colors.zoomInBand = {0, 90, 200, 255};
    colors.zoomOutBand = {200, 90, 0, 255};
  } else {
    colors.bg = {20, 20, 25, 255};
    colors.border = {80, 80, 80, 255};
    colors.crosshair = {255, 60, 60, 255};
    colors.zoomInBand = {0, 200, 255, 255};
    colors.zoomOutBand = {255, 165, 0, 255}; // Orange
  }
  return colors;
}
