#pragma once

#include <stdint.h>
#include <vector>

#include <SDL.h>

#include <lvGUI/display/Display.hpp>
#include <lvGUI/input/InputDevice.hpp>

// SDL2 window that stands in for the panel and the touch controller.
// LVGL renders RGB565 little-endian, which is SDL_PIXELFORMAT_RGB565 on the host.
class SimulatorDisplay final : public lvgui::FlushTarget, public lvgui::InputReader
{
public:
  SimulatorDisplay(int32_t width, int32_t height, int scale);
  ~SimulatorDisplay();

  SimulatorDisplay(const SimulatorDisplay &) = delete;
  SimulatorDisplay &operator=(const SimulatorDisplay &) = delete;

  // False with SDL_GetError() set when the window cannot be created.
  bool open(const char *title);

  // Drains the SDL queue. False once the window was closed.
  bool pollEvents();

  void flush(lvgui::FlushRequest &request) override;
  void read(lvgui::InputSample &sample) override;

  uint32_t presentedFrames() const { return _frames; }

private:
  void present();

  int32_t _width;
  int32_t _height;
  int _scale;

  SDL_Window *_window = nullptr;
  SDL_Renderer *_renderer = nullptr;
  SDL_Texture *_texture = nullptr;
  std::vector<uint16_t> _fb;

  int32_t _mouseX = 0;
  int32_t _mouseY = 0;
  bool _mouseDown = false;
  bool _sdlReady = false;
  uint32_t _frames = 0;
};
