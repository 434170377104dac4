/**
 * InkDeck - Configuration Constants
 * Centralized configuration for panel, input, storage and networking
 */

#ifndef CONFIG_H
#define CONFIG_H

#include <stdint.h>  // For uint8_t, uint32_t types

// ==================== Firmware ====================

#define INKDECK_VERSION_MAJOR       0
#define INKDECK_VERSION_MINOR       3
#define INKDECK_VERSION_PATCH       0
#define INKDECK_VERSION             "0.3.0"

// ==================== Feature Flags ====================

// E-paper panel attached
//   1: Frames are pushed to the ThinkInk FeatherWing
//   0: Demo mode - frames are written to EPD_PREVIEW_PATH on LittleFS
#define EPD_PANEL_ENABLED           1

// NTP sync of the wall clock after Wi-Fi connects for a weather fetch
#define ENABLE_NTP_SYNC             1

// ==================== Debug Configuration ====================

// Default debug flags (runtime control via g_debug_* globals)
#define DEBUG_ENABLED               1   // 0 = quiet mode, 1 = verbose debug output
#define DEBUG_DISPLAY_UPDATES       1   // Frame pushes, refresh mode decisions
#define DEBUG_INPUT                 0   // Decoded key events (noisy)
#define DEBUG_STORAGE               1   // Notes/settings load and save
#define DEBUG_WEATHER               1   // Wi-Fi and HTTP fetch progress
#define DEBUG_UI                    1   // Screen transitions

// Runtime debug control - defined in debug_flags.cpp
#ifndef CONFIG_H_GLOBALS_ONLY
#include "console.h"

extern bool g_debug_enabled;
extern bool g_debug_display;
extern bool g_debug_input;
extern bool g_debug_storage;
extern bool g_debug_weather;
extern bool g_debug_ui;

// Helper macros for conditional debug output (runtime control)
#define DEBUG_PRINTF(category, ...) \
    do { \
        if (g_debug_enabled && category) { \
            consolePrintf(__VA_ARGS__); \
        } \
    } while(0)

#define DEBUG_PRINTLN(category, text) \
    do { \
        if (g_debug_enabled && category) { \
            consolePrintln(text); \
        } \
    } while(0)

// Unconditional output for warnings and errors
#define LOG_PRINTF(...)     consolePrintf(__VA_ARGS__)
#define LOG_PRINTLN(text)   consolePrintln(text)
#endif

// ==================== E-Paper Display ====================

// 2.13" mono panel in landscape
#define EPD_WIDTH                   250
#define EPD_HEIGHT                  122
#define EPD_ROTATION                2   // Landscape, FeatherWing connector at the top

// Pixel values of the 8-bit frame canvas
#define COLOR_BLACK                 0
#define COLOR_WHITE                 255

// Consecutive partial refreshes before a full refresh is forced (ghosting)
#define EPD_PARTIAL_REFRESH_LIMIT   30

// Fallback output when no panel is attached (binary PGM)
#define EPD_PREVIEW_PATH            "/eink_preview.pgm"

// Built-in 5x7 font: 6px advance, 8px line at text size 1
#define FONT_CHAR_WIDTH             6
#define FONT_CHAR_HEIGHT            8

// ==================== Input ====================

#define SERIAL_BAUD_RATE            115200
#define KEY_QUEUE_LENGTH            32      // Bounded FIFO between reader task and UI loop
#define KEY_POLL_TIMEOUT_MS         100     // UI loop wait per iteration
#define KEY_ESC_TIMEOUT_MS          50      // Lone ESC is emitted after this much silence
#define KEYBOARD_TASK_STACK         4096
#define KEYBOARD_TASK_PRIORITY      2
#define KEYBOARD_TASK_CORE          0

// ==================== UI Timing ====================

#define UI_COMING_SOON_MS           2000    // "Coming Soon" overlay on unbound menu slots
#define UI_NOTE_SAVED_MS            1500    // "Note Saved" confirmation
#define UI_RESET_DONE_MS            1500    // Factory reset confirmation
#define UI_CLOCK_CHECK_MS           250     // How often the clock face checks for a new value
#define UI_BUSY_WAIT_MS             50      // Loop wait while an overlay holds input queued

// ==================== UI Limits ====================

#define NOTE_TITLE_MAX_LEN          40
#define NOTE_CONTENT_MAX_LEN        200
#define ZIP_CODE_MAX_LEN            10
#define WIFI_SSID_MAX_LEN           32
#define WIFI_PASSWORD_MAX_LEN       63

#define NOTES_VISIBLE_ROWS          5
#define NOTE_VIEW_CHARS_PER_LINE    35
#define NOTE_VIEW_LINES_PER_PAGE    6
#define SETTINGS_VISIBLE_ROWS       6

// ==================== Storage ====================

#define STORAGE_DIR                 "/inkdeck"
#define NOTES_FILE_PATH             "/inkdeck/notes.json"
#define SETTINGS_FILE_PATH          "/inkdeck/settings.json"
#define NVS_NAMESPACE               "inkdeck"   // NVS namespace for network credentials

// ==================== Weather ====================

#define WEATHER_URL_PREFIX          "http://wttr.in/"
#define WEATHER_URL_SUFFIX          "?format=j1"
#define WEATHER_HTTP_TIMEOUT_MS     10000   // Bounded request timeout
#define WIFI_CONNECT_TIMEOUT_MS     15000

// Defaults used until credentials are entered on the device (stored in NVS)
#define WIFI_DEFAULT_SSID           ""
#define WIFI_DEFAULT_PASSWORD       ""

// ==================== Time ====================

// POSIX TZ string for local time (US Eastern by default)
#define TIMEZONE_POSIX              "EST5EDT,M3.2.0,M11.1.0"
#define NTP_SERVER_PRIMARY          "pool.ntp.org"
#define NTP_SERVER_SECONDARY        "time.nist.gov"
#define NTP_SYNC_TIMEOUT_MS         5000

#endif // CONFIG_H
