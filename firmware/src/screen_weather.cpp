/**
 * InkDeck - Weather Screen
 * Current conditions and a two day forecast for the configured ZIP code
 *
 * One fetch per visit: the entry frame shows "Loading...", the next tick
 * performs the (blocking) request and the result replaces it. There is no
 * auto-refresh while the screen is open.
 */

#include "screens.h"
#include "config.h"
#include "glyphs.h"
#include <stdio.h>

static const char* const DAY_LABELS[WEATHER_FORECAST_DAYS] = { "Today", "Tomorrow" };

WeatherScreen::WeatherScreen() : ctx_(nullptr), state_(STATE_NO_ZIP) {}

void WeatherScreen::enter(AppContext& ctx) {
    ctx_ = &ctx;
    zip_ = ctx.settings.zipCode();
    ssid_.clear();
    error_.clear();
    report_ = WeatherReport();

    if (zip_.empty()) {
        state_ = STATE_NO_ZIP;
    } else if (!ctx.weather.hasNetworkConfig()) {
        state_ = STATE_WIFI_SSID;
        prompt_.begin("Wi-Fi network name:", WIFI_SSID_MAX_LEN);
    } else {
        state_ = STATE_LOADING;
    }
    DEBUG_PRINTF(g_debug_weather, "Weather: Enter (zip \"%s\", state %d)\n", zip_.c_str(), state_);
}

void WeatherScreen::render(Canvas& canvas, const Palette& palette) const {
    switch (state_) {
        case STATE_NO_ZIP:
            canvas.fillScreen(palette.background);
            printCentered(canvas, "WEATHER", 5, 2, palette.foreground);
            printCentered(canvas, "No ZIP code set", 40, 1, palette.foreground);
            printCentered(canvas, "Configure it in Settings", 55, 1, palette.foreground);
            printFooter(canvas, "ESC=Back", palette.foreground);
            break;

        case STATE_WIFI_SSID:
            prompt_.render(canvas, palette, "WI-FI SETUP");
            break;

        case STATE_WIFI_PASSWORD:
            prompt_.render(canvas, palette, "WI-FI SETUP", true);
            break;

        case STATE_LOADING: {
            canvas.fillScreen(palette.background);
            printCentered(canvas, "Loading...", 45, 2, palette.foreground);
            char line[40];
            snprintf(line, sizeof(line), "Weather for %s", zip_.c_str());
            printCentered(canvas, line, 75, 1, palette.foreground);
            break;
        }

        case STATE_ERROR: {
            canvas.fillScreen(palette.background);
            printCentered(canvas, "Weather", 20, 2, palette.foreground);
            printCentered(canvas, "unavailable", 42, 2, palette.foreground);
            char reason[40];
            truncateText(error_.c_str(), 38, reason, sizeof(reason));
            printCentered(canvas, reason, 72, 1, palette.foreground);
            printFooter(canvas, "ESC=Back", palette.foreground);
            break;
        }

        case STATE_READY:
            renderReport(canvas, palette);
            break;
    }
}

void WeatherScreen::renderReport(Canvas& canvas, const Palette& palette) const {
    const uint8_t fg = palette.foreground;
    const uint8_t bg = palette.background;
    char line[48];

    canvas.fillScreen(bg);

    // Location header
    if (report_.region.empty()) {
        snprintf(line, sizeof(line), "%s", report_.location.c_str());
    } else {
        snprintf(line, sizeof(line), "%s, %s", report_.location.c_str(), report_.region.c_str());
    }
    char header[40];
    truncateText(line, 38, header, sizeof(header));
    drawTitleBar(canvas, palette, header);

    // Current conditions
    drawWeatherGlyph(canvas, weatherGlyphFor(report_.code), 30, 42, 2, fg, bg);

    snprintf(line, sizeof(line), "%dF", report_.temp_f);
    canvas.drawText(62, 18, line, 3, fg);

    char desc[28];
    truncateText(report_.description.c_str(), 26, desc, sizeof(desc));
    canvas.drawText(62, 44, desc, 1, fg);

    snprintf(line, sizeof(line), "Feels %dF  Hum %d%%", report_.feels_like_f, report_.humidity);
    canvas.drawText(62, 54, line, 1, fg);
    snprintf(line, sizeof(line), "Wind %d mph", report_.wind_mph);
    canvas.drawText(62, 64, line, 1, fg);

    canvas.drawLine(0, 76, canvas.width() - 1, 76, fg);

    // Forecast columns
    const int16_t column_w = canvas.width() / WEATHER_FORECAST_DAYS;
    for (int i = 0; i < report_.day_count && i < WEATHER_FORECAST_DAYS; ++i) {
        const WeatherDay& day = report_.days[i];
        int16_t x = i * column_w;
        drawWeatherGlyph(canvas, weatherGlyphFor(day.code), x + 16, 93, 1, fg, bg);
        canvas.drawText(x + 34, 81, DAY_LABELS[i], 1, fg);
        snprintf(line, sizeof(line), "H %d  L %d", day.max_f, day.min_f);
        canvas.drawText(x + 34, 92, line, 1, fg);
    }

    printFooter(canvas, "ESC=Back", fg);
}

Transition WeatherScreen::handleKey(const KeyEvent& key) {
    if (state_ == STATE_WIFI_SSID || state_ == STATE_WIFI_PASSWORD) {
        PromptResult result = prompt_.feed(key);
        if (result == PROMPT_ABORTED) {
            return Transition::go(SCREEN_MAIN_MENU);
        }
        if (result == PROMPT_EDITING) {
            return Transition::redraw();
        }

        if (state_ == STATE_WIFI_SSID) {
            if (prompt_.value().empty()) {
                prompt_.begin("Wi-Fi network name:", WIFI_SSID_MAX_LEN);
                return Transition::redraw();
            }
            ssid_ = prompt_.value();
            state_ = STATE_WIFI_PASSWORD;
            prompt_.begin("Wi-Fi password:", WIFI_PASSWORD_MAX_LEN);
            return Transition::redraw();
        }

        if (!ctx_->weather.configureNetwork(ssid_, prompt_.value())) {
            LOG_PRINTLN("Weather: WARNING - could not store Wi-Fi credentials");
        }
        state_ = STATE_LOADING;
        return Transition::redraw();
    }

    if (key.code == KEYCODE_ESC) {
        return Transition::go(SCREEN_MAIN_MENU);
    }
    return Transition::stay();
}

Transition WeatherScreen::tick(uint32_t now_ms) {
    (void)now_ms;
    if (state_ != STATE_LOADING) {
        return Transition::stay();
    }

    // Blocks the UI for up to WEATHER_HTTP_TIMEOUT_MS
    if (ctx_->weather.fetch(zip_, report_)) {
        state_ = STATE_READY;
    } else {
        error_ = ctx_->weather.lastError();
        if (error_.empty()) error_ = "Unknown error";
        state_ = STATE_ERROR;
        LOG_PRINTF("Weather: Fetch failed: %s\n", error_.c_str());
    }
    return Transition::redraw();
}
