/**
 * InkDeck - E-Ink Clock, Notes and Weather Firmware
 * Main entry point
 */

#include <Arduino.h>
#include <Wire.h>
#include "esp_sleep.h"
#include "inkdeck.h"
#include "config.h"
#include "Adafruit_ThinkInk.h"

#include "eink_panel.h"
#include "keyboard_input.h"
#include "littlefs_store.h"
#include "notes_store.h"
#include "rtc_clock.h"
#include "settings_store.h"
#include "storage.h"
#include "ui_app.h"
#include "weather_client.h"

// 2.13" Mono E-Paper display (GDEY0213B74 variant - no 8-pixel shift)
ThinkInk_213_Mono_GDEY0213B74 display(PIN_EPD_DC, PIN_EPD_RESET, PIN_EPD_CS, PIN_SRAM_CS, PIN_EPD_BUSY);

// Dependencies, constructed once and handed to the UI by reference
static LittleFsStore g_files;
static RtcClock g_clock;
static KeyboardInput g_keyboard(Serial);
static EinkPanel g_panel(display, g_files);
static NotesStore g_notes(g_files, g_clock, NOTES_FILE_PATH);
static SettingsStore g_settings(g_files, SETTINGS_FILE_PATH);
static WeatherClient g_weather(g_clock);

static AppContext g_context = { g_panel, g_keyboard, g_notes, g_settings, g_clock, g_weather };
static UiApp g_app(g_context);

// Enter deep sleep with no wake source: only reset restarts the device
static void halt() {
    LOG_PRINTLN("Halted. Press RESET to restart.");
    Serial.flush();
    esp_deep_sleep_start();
}

void setup() {
    Serial.begin(SERIAL_BAUD_RATE);
    delay(1000);

    // Initialize LED (lit during network fetches)
    pinMode(PIN_LED, OUTPUT);
    digitalWrite(PIN_LED, LOW);

    Serial.println("=================================");
    Serial.printf("InkDeck v%d.%d.%d | Adafruit ESP32 Feather V2\n",
                  INKDECK_VERSION_MAJOR, INKDECK_VERSION_MINOR, INKDECK_VERSION_PATCH);
    Serial.println("Press any key while the clock is showing to open the menu");
    Serial.println("=================================");

    // Storage first: the panel falls back to the preview file without it
    if (!g_files.begin()) {
        LOG_PRINTLN("WARNING: LittleFS unavailable, notes and settings will not persist");
    } else if (!g_files.ensureDir(STORAGE_DIR)) {
        LOG_PRINTF("WARNING: Could not create %s\n", STORAGE_DIR);
    }

    if (!storageInit()) {
        LOG_PRINTLN("WARNING: NVS unavailable, Wi-Fi credentials will not persist");
    }

    // Initialize E-Paper display
    if (!g_panel.begin(EPD_PANEL_ENABLED)) {
        LOG_PRINTLN("WARNING: Display unavailable");
    }

    // Wall clock (DS3231 on I2C when fitted)
    Wire.begin();
    g_clock.begin();

    if (!g_notes.load()) {
        LOG_PRINTLN("WARNING: Notes file unreadable, starting with no notes");
    }
    if (!g_settings.load()) {
        LOG_PRINTLN("WARNING: Settings file unreadable, using defaults");
    }

    if (!g_keyboard.begin()) {
        LOG_PRINTLN("ERROR: Keyboard input unavailable");
    }

    g_app.begin();
}

void loop() {
    if (g_app.step()) {
        return;
    }

    // Ctrl-C: stop input, sleep the panel, halt
    g_app.shutdown();
    halt();
}
