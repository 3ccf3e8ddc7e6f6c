#include "SimulatorDisplay.hpp"

#include <string.h>

SimulatorDisplay::SimulatorDisplay(int32_t width, int32_t height, int scale)
    : _width(width),
      _height(height),
      _scale(scale < 1 ? 1 : scale),
      _fb(static_cast<size_t>(width) * static_cast<size_t>(height), 0)
{
}

SimulatorDisplay::~SimulatorDisplay()
{
  if (_texture)
    SDL_DestroyTexture(_texture);
  if (_renderer)
    SDL_DestroyRenderer(_renderer);
  if (_window)
    SDL_DestroyWindow(_window);
  if (_sdlReady)
    SDL_Quit();
}

bool SimulatorDisplay::open(const char *title)
{
  if (SDL_Init(SDL_INIT_VIDEO) != 0)
    return false;
  _sdlReady = true;

  _window = SDL_CreateWindow(title,
                             SDL_WINDOWPOS_CENTERED,
                             SDL_WINDOWPOS_CENTERED,
                             _width * _scale,
                             _height * _scale,
                             0);
  if (!_window)
    return false;

  _renderer = SDL_CreateRenderer(_window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
  if (!_renderer)
    _renderer = SDL_CreateRenderer(_window, -1, SDL_RENDERER_SOFTWARE);
  if (!_renderer)
    return false;

  _texture = SDL_CreateTexture(_renderer,
                               SDL_PIXELFORMAT_RGB565,
                               SDL_TEXTUREACCESS_STREAMING,
                               _width,
                               _height);
  if (!_texture)
    return false;

  present();
  return true;
}

bool SimulatorDisplay::pollEvents()
{
  SDL_Event e;
  while (SDL_PollEvent(&e))
  {
    switch (e.type)
    {
    case SDL_QUIT:
      return false;
    case SDL_WINDOWEVENT:
      if (e.window.event == SDL_WINDOWEVENT_CLOSE)
        return false;
      if (e.window.event == SDL_WINDOWEVENT_EXPOSED)
        present();
      break;
    case SDL_MOUSEMOTION:
      _mouseX = e.motion.x / _scale;
      _mouseY = e.motion.y / _scale;
      break;
    case SDL_MOUSEBUTTONDOWN:
      if (e.button.button == SDL_BUTTON_LEFT)
      {
        _mouseDown = true;
        _mouseX = e.button.x / _scale;
        _mouseY = e.button.y / _scale;
      }
      break;
    case SDL_MOUSEBUTTONUP:
      if (e.button.button == SDL_BUTTON_LEFT)
        _mouseDown = false;
      break;
    case SDL_KEYDOWN:
      if (e.key.keysym.sym == SDLK_ESCAPE)
        return false;
      break;
    default:
      break;
    }
  }
  return true;
}

void SimulatorDisplay::flush(lvgui::FlushRequest &request)
{
  const int32_t x1 = request.x1() < 0 ? 0 : request.x1();
  const int32_t y1 = request.y1() < 0 ? 0 : request.y1();
  const int32_t x2 = request.x2() >= _width ? _width - 1 : request.x2();
  const int32_t y2 = request.y2() >= _height ? _height - 1 : request.y2();
  const uint8_t *src = request.pixels();

  if (src && x1 <= x2 && y1 <= y2)
  {
    const size_t rowBytes = static_cast<size_t>(x2 - x1 + 1) * sizeof(uint16_t);
    for (int32_t y = y1; y <= y2; ++y)
    {
      const uint8_t *row = src + static_cast<size_t>(y - request.y1()) * request.stride() +
                           static_cast<size_t>(x1 - request.x1()) * sizeof(uint16_t);
      memcpy(&_fb[static_cast<size_t>(y) * _width + x1], row, rowBytes);
    }
  }

  if (request.isLast())
    present();

  request.ready();
}

void SimulatorDisplay::read(lvgui::InputSample &sample)
{
  sample.x = _mouseX;
  sample.y = _mouseY;
  sample.pressed = _mouseDown;
}

void SimulatorDisplay::present()
{
  if (!_texture)
    return;

  SDL_UpdateTexture(_texture, nullptr, _fb.data(), _width * static_cast<int>(sizeof(uint16_t)));
  SDL_RenderClear(_renderer);
  SDL_RenderCopy(_renderer, _texture, nullptr, nullptr);
  SDL_RenderPresent(_renderer);
  ++_frames;
}
