#include <Arduino.h>
#include <esp_log.h>
#include <stdlib.h>
#include <optional>

#include <lvGUI/core/api/lvGUI.hpp>
#include <lvCore/Platforms/ESP32/GUI.hpp>
#include <lvCore/Platforms/ESP32/SpiBus.hpp>
#include <lvCore/Platforms/ESP32/I2cBus.hpp>
#include <lvCore/Displays/ST7789/Driver.hpp>
#include <lvCore/Touch/CST816/Driver.hpp>
#include <lvCore/Button.hpp>

using namespace lvgui;

static const char *TAG = "lvgui";

static const int8_t PIN_MOSI = 11;
static const int8_t PIN_SCLK = 12;
static const int8_t PIN_CS = 10;
static const int8_t PIN_DC = 9;
static const int8_t PIN_BL = 14;
static const int8_t PIN_TOUCH_SDA = 6;
static const int8_t PIN_TOUCH_SCL = 7;
static const int8_t PIN_TOUCH_RST = 13;
static const int8_t PIN_TOUCH_IRQ = 5;
static const uint8_t PIN_BTN_NEXT = 2;

static const int32_t BUF_LINES = 32;

static lvcore::Esp32GuiPlatform g_platform;
static lvcore::Esp32SpiPanelBus g_spi;
static lvcore::Esp32I2cBus g_i2c;
static std::optional<lvcore::ST7789> g_panel;
static std::optional<lvcore::CST816> g_touch;
static lvcore::Button g_btnNext(g_platform, PIN_BTN_NEXT);

static Runtime g_runtime;
static std::optional<Display> g_display;
static std::optional<PanelFlush> g_flush;
static std::optional<TouchReader> g_touchReader;
static std::optional<ButtonReader> g_buttonReader;
static std::optional<InputDevice> g_touchDev;
static std::optional<InputDevice> g_buttonDev;

static Label g_countLabel;
static Arc g_arc;
static uint32_t g_clicks = 0;
static uint32_t g_lastArcMs = 0;
static int32_t g_arcValue = 0;
static int32_t g_arcStep = 2;
static uint32_t g_reportedFlushErrors = 0;

// The hardware button presses whatever sits at this point.
static lv_point_t g_btnPoints[1] = {{120, 120}};

[[noreturn]] static void halt(const char *what, int code)
{
  ESP_LOGE(TAG, "%s failed (%d)", what, code);
  abort();
}

static void lvglLog(lv_log_level_t level, const char *msg)
{
  if (level >= LV_LOG_LEVEL_ERROR)
    ESP_LOGE(TAG, "%s", msg);
  else if (level >= LV_LOG_LEVEL_WARN)
    ESP_LOGW(TAG, "%s", msg);
  else
    ESP_LOGI(TAG, "%s", msg);
}

template <typename T>
static T require(Result<T> r, const char *what)
{
  if (!r)
    halt(what, static_cast<int>(r.error()));
  return r.take();
}

static void requireOk(lvcore::BusError err, const char *what)
{
  if (err != lvcore::BusOk)
    halt(what, static_cast<int>(err));
}

static void buildUi()
{
  Obj scr = g_runtime.activeScreen();
  scr.setStyleBgColor(Color::black());

  Label title = require(Label::create(scr), "title");
  title.setText("lvgui");
  title.setStyleTextColor(Color::white());
  title.align(Align::TopMid, 0, 8);

  Button btn = require(Button::createWithLabel(scr, "Click me"), "button");
  btn.setSize(140, 44);
  btn.align(Align::Center, 0, -30);
  btn.addEventHandler(EventCode::Clicked, [](Event &)
                      {
    ++g_clicks;
    g_countLabel.setTextFmt("Clicks: %u", static_cast<unsigned>(g_clicks)); });

  g_btnPoints[0].x = 120;
  g_btnPoints[0].y = static_cast<int32_t>(g_panel->height() / 2 - 30);

  g_countLabel = require(Label::create(scr), "counter");
  g_countLabel.setText("Clicks: 0");
  g_countLabel.setStyleTextColor(Color::hex(0xA0A0A0));
  g_countLabel.alignTo(btn, Align::OutBottomMid, 0, 6);

  g_arc = require(Arc::create(scr), "arc");
  g_arc.setSize(90, 90);
  g_arc.setRange(0, 100);
  g_arc.setBgAngles(135, 45);
  g_arc.setClickable(false);
  g_arc.align(Align::BottomMid, 0, -60);

  Slider bright = require(Slider::create(scr), "brightness");
  bright.setWidth(180);
  bright.setRange(5, 100);
  bright.setValue(g_platform.loadMaxBrightnessPercent());
  bright.align(Align::BottomMid, 0, -20);
  bright.addEventHandler(EventCode::ValueChanged, [](Event &e)
                         {
    Slider s = Slider::from(e.currentTarget());
    g_platform.setBacklightPercent(static_cast<uint8_t>(s.value())); });
  // Flash is written once per drag, not on every step.
  bright.addEventHandler(EventCode::Released, [](Event &e)
                         {
    Slider s = Slider::from(e.currentTarget());
    g_platform.storeMaxBrightnessPercent(static_cast<uint8_t>(s.value())); });
}

void setup()
{
  Serial.begin(115200);
  ESP_LOGI(TAG, "boot");

  lvcore::SpiPanelBusConfig spiCfg;
  spiCfg.mosi = PIN_MOSI;
  spiCfg.sclk = PIN_SCLK;
  spiCfg.cs = PIN_CS;
  spiCfg.dc = PIN_DC;
  requireOk(g_spi.begin(spiCfg), "spi bus");

  lvcore::St7789Config panelCfg = lvcore::St7789Config::rect240x320();
  panelCfg.backlight = -1;
  g_panel.emplace(g_spi, g_platform, panelCfg);
  requireOk(g_panel->begin(), "st7789");

  g_platform.configureBacklightPin(PIN_BL);
  g_platform.setBacklightPercent(g_platform.loadMaxBrightnessPercent());

  lvcore::I2cBusConfig i2cCfg;
  i2cCfg.sda = PIN_TOUCH_SDA;
  i2cCfg.scl = PIN_TOUCH_SCL;
  requireOk(g_i2c.begin(i2cCfg), "i2c bus");

  lvcore::Cst816Config touchCfg;
  touchCfg.rst = PIN_TOUCH_RST;
  touchCfg.irq = PIN_TOUCH_IRQ;
  touchCfg.transform.width = g_panel->width();
  touchCfg.transform.height = g_panel->height();
  g_touch.emplace(g_i2c, g_platform, touchCfg);
  requireOk(g_touch->begin(), "cst816");
  ESP_LOGI(TAG, "touch chip id 0x%02X", g_touch->chipId());

  g_btnNext.begin();

  if (Error err = g_runtime.init(); err != Error::Ok)
    halt("lvgl init", static_cast<int>(err));
  g_runtime.setLogSink(lvglLog);

  const int32_t w = g_panel->width();
  const int32_t h = g_panel->height();
  const uint32_t bytes = bufferBytes(w, BUF_LINES);
  void *buf1 = g_platform.guiAlloc(bytes, lvcore::GuiAllocCaps::Dma);
  void *buf2 = g_platform.guiAlloc(bytes, lvcore::GuiAllocCaps::Dma);
  if (!buf1 || !buf2)
    halt("draw buffers", static_cast<int>(bytes));

  g_display.emplace(require(Display::create(g_runtime, w, h), "display"));
  if (Error err = g_display->setBuffers(buf1, buf2, bytes, RenderMode::Partial); err != Error::Ok)
    halt("display buffers", static_cast<int>(err));
  g_flush.emplace(*g_panel);
  g_display->setFlushTarget(*g_flush);

  g_touchReader.emplace(*g_touch);
  g_touchDev.emplace(require(InputDevice::createPointer(g_runtime, *g_touchReader), "touch indev"));
  g_touchDev->setDisplay(*g_display);

  g_buttonReader.emplace(g_btnNext);
  g_buttonDev.emplace(require(InputDevice::create(g_runtime), "button indev"));
  g_buttonDev->setType(InputType::Button);
  g_buttonDev->setReader(*g_buttonReader);
  g_buttonDev->setButtonPoints(g_btnPoints);
  g_buttonDev->setDisplay(*g_display);

  buildUi();
  ESP_LOGI(TAG, "ui ready %ldx%ld", static_cast<long>(w), static_cast<long>(h));
}

void loop()
{
  const uint32_t now = millis();
  if (now - g_lastArcMs >= 30)
  {
    g_lastArcMs = now;
    g_arcValue += g_arcStep;
    if (g_arcValue >= 100 || g_arcValue <= 0)
      g_arcStep = -g_arcStep;
    g_arc.setValue(g_arcValue);
  }

  if (g_flush->errorCount() != g_reportedFlushErrors)
  {
    g_reportedFlushErrors = g_flush->errorCount();
    ESP_LOGW(TAG, "panel write error %d (total %lu)",
             static_cast<int>(g_flush->lastError()),
             static_cast<unsigned long>(g_reportedFlushErrors));
  }

  delay(g_runtime.pump(now, 5));
}
