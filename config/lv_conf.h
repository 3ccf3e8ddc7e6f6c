/* LVGL 9.2 configuration for the ESP32 firmware (no PSRAM required). */

#ifndef LV_CONF_H
#define LV_CONF_H

#include <stdint.h>

/* Color */
#define LV_COLOR_DEPTH 16

/* Memory: builtin pool, the wrapper allocates draw buffers itself */
#define LV_USE_STDLIB_MALLOC    LV_STDLIB_BUILTIN
#define LV_USE_STDLIB_STRING    LV_STDLIB_CLIB
#define LV_USE_STDLIB_SPRINTF   LV_STDLIB_CLIB
#define LV_MEM_SIZE (48 * 1024U)

/* HAL: the tick is advanced by Runtime::pump */
#define LV_DEF_REFR_PERIOD 33
#define LV_DPI_DEF 130

/* Logging, forwarded to ESP_LOG by the firmware */
#define LV_USE_LOG 1
#if LV_USE_LOG
    #define LV_LOG_LEVEL LV_LOG_LEVEL_WARN
    #define LV_LOG_PRINTF 0
#endif

#define LV_USE_ASSERT_NULL          1
#define LV_USE_ASSERT_MALLOC        1
#define LV_USE_ASSERT_STYLE         0
#define LV_USE_ASSERT_MEM_INTEGRITY 0
#define LV_USE_ASSERT_OBJ           0

#define LV_USE_PERF_MONITOR 0
#define LV_USE_MEM_MONITOR 0

/* Fonts */
#define LV_FONT_MONTSERRAT_12 1
#define LV_FONT_MONTSERRAT_14 1
#define LV_FONT_MONTSERRAT_16 1
#define LV_FONT_MONTSERRAT_20 1
#define LV_FONT_DEFAULT &lv_font_montserrat_14
#define LV_USE_FREETYPE 0

#define LV_TXT_ENC LV_TXT_ENC_UTF8
#define LV_USE_BIDI 0
#define LV_USE_ARABIC_PERSIAN_CHARS 0

/* Widgets wrapped by lvgui */
#define LV_USE_ARC          1
#define LV_USE_BAR          1
#define LV_USE_BUTTON       1
#define LV_USE_BUTTONMATRIX 1
#define LV_USE_CALENDAR     1
#if LV_USE_CALENDAR
    #define LV_CALENDAR_WEEK_STARTS_MONDAY 1
    #define LV_USE_CALENDAR_HEADER_ARROW 1
    #define LV_USE_CALENDAR_HEADER_DROPDOWN 0
#endif
#define LV_USE_CANVAS       1
#define LV_USE_CHART        1
#define LV_USE_CHECKBOX     1
#define LV_USE_DROPDOWN     1
#define LV_USE_IMAGE        1
#define LV_USE_KEYBOARD     1
#define LV_USE_LABEL        1
#define LV_USE_LED          1
#define LV_USE_LINE         1
#define LV_USE_LIST         1
#define LV_USE_MSGBOX       1
#define LV_USE_ROLLER       1
#define LV_USE_SCALE        1
#define LV_USE_SLIDER       1
#define LV_USE_SPINBOX      1
#define LV_USE_SPINNER      1
#define LV_USE_SWITCH       1
#define LV_USE_TABLE        1
#define LV_USE_TABVIEW      1
#define LV_USE_TEXTAREA     1

#define LV_USE_ANIMIMG      0
#define LV_USE_IMAGEBUTTON  0
#define LV_USE_MENU         0
#define LV_USE_SPAN         0
#define LV_USE_TILEVIEW     0
#define LV_USE_WIN          0

#define LV_USE_FLEX 1
#define LV_USE_GRID 1

/* Software renderer only */
#define LV_USE_DRAW_SW 1
#define LV_USE_DRAW_ARM2D 0
#define LV_USE_DRAW_VG_LITE 0
#define LV_USE_VECTOR_GRAPHIC 0

#define LV_USE_FS_STDIO 0
#define LV_USE_FS_POSIX 0
#define LV_USE_FS_FATFS 0
#define LV_USE_PNG 0
#define LV_USE_BMP 0
#define LV_USE_TJPGD 0
#define LV_USE_GIF 0
#define LV_USE_QRCODE 0
#define LV_USE_SNAPSHOT 0

#define LV_USE_OBSERVER 1
#define LV_USE_OBJ_ID 0

#endif /* LV_CONF_H */
