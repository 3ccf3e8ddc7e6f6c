#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <vector>

#include <SDL.h>

#include <lvGUI/core/api/lvGUI.hpp>

#include "SimulatorDisplay.hpp"

using namespace lvgui;

static const int32_t BUF_LINES = 24;

struct Options
{
  int32_t width = 320;
  int32_t height = 240;
  int scale = 2;
};

struct Demo
{
  Label clicks;
  Slider slider;
  Bar bar;
  Led led;
  Chart chart;
  ChartSeries series;
  Roller roller;
  Label rollerOut;
  Textarea input;
  Keyboard keyboard;
  uint32_t clickCount = 0;
  uint32_t sample = 0;
};

static Demo g_demo;

static void logToStderr(lv_log_level_t level, const char *msg)
{
  (void)level;
  fputs(msg, stderr);
  if (msg[0] && msg[strlen(msg) - 1] != '\n')
    fputc('\n', stderr);
}

static bool parseArgs(int argc, char **argv, Options &opt)
{
  for (int i = 1; i < argc; ++i)
  {
    const char *arg = argv[i];
    const char *val = (i + 1 < argc) ? argv[i + 1] : nullptr;
    if (!val)
    {
      fprintf(stderr, "missing value for %s\n", arg);
      return false;
    }

    long v = strtol(val, nullptr, 10);
    if (strcmp(arg, "--width") == 0)
      opt.width = static_cast<int32_t>(v);
    else if (strcmp(arg, "--height") == 0)
      opt.height = static_cast<int32_t>(v);
    else if (strcmp(arg, "--scale") == 0)
      opt.scale = static_cast<int>(v);
    else
    {
      fprintf(stderr, "unknown option %s\n", arg);
      return false;
    }
    ++i;
  }

  if (opt.width <= 0 || opt.height <= 0 || opt.scale <= 0)
  {
    fprintf(stderr, "width, height and scale must be positive\n");
    return false;
  }
  return true;
}

template <typename T>
static bool check(Result<T> &r, const char *what)
{
  if (r)
    return true;
  fprintf(stderr, "%s: %s\n", what, errorToString(r.error()));
  return false;
}

static bool buildControls(Obj page)
{
  page.setFlexFlow(FlexFlow::Column);
  page.setFlexAlign(FlexAlign::Start, FlexAlign::Center, FlexAlign::Center);

  Result<Button> btn = Button::createWithLabel(page, "Click me");
  Result<Label> clicks = Label::create(page);
  Result<Slider> slider = Slider::create(page);
  Result<Bar> bar = Bar::create(page);
  Result<Switch> sw = Switch::create(page);
  Result<Led> led = Led::create(page);
  Result<Spinner> spinner = Spinner::create(page);
  if (!check(btn, "button") || !check(clicks, "label") || !check(slider, "slider") || !check(bar, "bar") ||
      !check(sw, "switch") || !check(led, "led") || !check(spinner, "spinner"))
    return false;

  g_demo.clicks = clicks.take();
  g_demo.clicks.setText("Clicks: 0");
  btn->addEventHandler(EventCode::Clicked, [](Event &)
                       {
    ++g_demo.clickCount;
    g_demo.clicks.setTextFmt("Clicks: %u", static_cast<unsigned>(g_demo.clickCount)); });

  g_demo.slider = slider.take();
  g_demo.bar = bar.take();
  g_demo.slider.setWidth(pct(80));
  g_demo.bar.setWidth(pct(80));
  g_demo.slider.setValue(40);
  g_demo.bar.setValue(40);
  g_demo.slider.addEventHandler(EventCode::ValueChanged, [](Event &)
                                { g_demo.bar.setValue(g_demo.slider.value(), true); });

  g_demo.led = led.take();
  g_demo.led.setColor(Color::palette(LV_PALETTE_GREEN));
  g_demo.led.off();
  sw->addEventHandler(EventCode::ValueChanged, [](Event &e)
                      {
    Switch s = Switch::from(e.currentTarget());
    if (s.isChecked())
      g_demo.led.on();
    else
      g_demo.led.off(); });

  spinner->setSize(40, 40);
  spinner->setAnimParams(1000, 60);
  return true;
}

static bool buildData(Obj page)
{
  Result<Chart> chart = Chart::create(page);
  Result<Roller> roller = Roller::create(page);
  Result<Label> out = Label::create(page);
  Result<Dropdown> dd = Dropdown::create(page);
  if (!check(chart, "chart") || !check(roller, "roller") || !check(out, "label") || !check(dd, "dropdown"))
    return false;

  g_demo.chart = chart.take();
  g_demo.chart.setSize(pct(60), 110);
  g_demo.chart.align(Align::TopLeft);
  g_demo.chart.setType(ChartType::Line);
  g_demo.chart.setPointCount(30);
  g_demo.chart.setAxisRange(ChartAxis::PrimaryY, 0, 100);
  g_demo.series = g_demo.chart.addSeries(Color::palette(LV_PALETTE_RED));

  g_demo.roller = roller.take();
  g_demo.roller.setOptions("Mon\nTue\nWed\nThu\nFri\nSat\nSun");
  g_demo.roller.setVisibleRowCount(3);
  g_demo.roller.align(Align::TopRight);

  g_demo.rollerOut = out.take();
  g_demo.rollerOut.alignTo(g_demo.roller, Align::OutBottomMid, 0, 4);
  g_demo.rollerOut.setText("Mon");
  g_demo.roller.addEventHandler(EventCode::ValueChanged, [](Event &)
                                {
    char buf[16];
    g_demo.roller.selectedText(buf, sizeof(buf));
    g_demo.rollerOut.setText(buf); });

  dd->setOptions("Low\nMedium\nHigh");
  dd->align(Align::BottomLeft);
  return true;
}

static bool buildText(Obj page)
{
  Result<Textarea> ta = Textarea::create(page);
  Result<Keyboard> kb = Keyboard::create(page);
  Result<Button> about = Button::createWithLabel(page, "About");
  if (!check(ta, "textarea") || !check(kb, "keyboard") || !check(about, "button"))
    return false;

  g_demo.input = ta.take();
  g_demo.input.setOneLine(true);
  g_demo.input.setPlaceholderText("Type here");
  g_demo.input.setWidth(pct(70));
  g_demo.input.align(Align::TopLeft);

  about->align(Align::TopRight);
  about->addEventHandler(EventCode::Clicked, [](Event &e)
                         {
    Obj screen = e.currentTarget();
    while (screen.parent().isValid())
      screen = screen.parent();
    Result<Msgbox> box = Msgbox::create(screen);
    if (!box)
      return;
    box->addTitle("lvgui");
    box->addText(g_demo.input.text());
    box->addCloseButton(); });

  g_demo.keyboard = kb.take();
  g_demo.keyboard.setTextarea(g_demo.input);
  return true;
}

int main(int argc, char **argv)
{
  Options opt;
  if (!parseArgs(argc, argv, opt))
    return 2;

  Runtime runtime;
  if (Error err = runtime.init(); err != Error::Ok)
  {
    fprintf(stderr, "lvgl init: %s\n", errorToString(err));
    return 1;
  }
  runtime.setLogSink(logToStderr);

  SimulatorDisplay window(opt.width, opt.height, opt.scale);
  if (!window.open("lvgui simulator"))
  {
    fprintf(stderr, "sdl: %s\n", SDL_GetError());
    return 1;
  }

  const uint32_t bytes = bufferBytes(opt.width, BUF_LINES);
  std::vector<uint8_t> buf1(bytes);
  std::vector<uint8_t> buf2(bytes);

  Result<Display> display = Display::create(runtime, opt.width, opt.height);
  if (!check(display, "display"))
    return 1;
  if (Error err = display->setBuffers(buf1.data(), buf2.data(), bytes, RenderMode::Partial); err != Error::Ok)
  {
    fprintf(stderr, "display buffers: %s\n", errorToString(err));
    return 1;
  }
  display->setFlushTarget(window);

  Result<InputDevice> mouse = InputDevice::createPointer(runtime, window);
  if (!check(mouse, "mouse"))
    return 1;
  mouse->setDisplay(*display);

  Result<Tabview> tabs = Tabview::create(runtime.activeScreen());
  if (!check(tabs, "tabview"))
    return 1;
  tabs->setSize(opt.width, opt.height);
  tabs->setTabBarSize(32);

  if (!buildControls(tabs->addTab("Controls")) || !buildData(tabs->addTab("Data")) ||
      !buildText(tabs->addTab("Text")))
    return 1;

  uint32_t lastSampleMs = 0;
  while (window.pollEvents())
  {
    const uint32_t now = SDL_GetTicks();
    if (now - lastSampleMs >= 200)
    {
      lastSampleMs = now;
      ++g_demo.sample;
      g_demo.chart.setNextValue(g_demo.series, static_cast<int32_t>(50 + (g_demo.sample * 37) % 45 - 20));
    }
    SDL_Delay(runtime.pump(now, 16));
  }

  fprintf(stderr, "presented %u frames\n", static_cast<unsigned>(window.presentedFrames()));
  return 0;
}
