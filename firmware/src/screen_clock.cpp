/**
 * InkDeck - Clock Screen
 * 7-segment time with the date above and AM/PM below
 *
 * The face is only redrawn when the displayed text changes, so a minute
 * clock refreshes once a minute and a seconds clock once a second.
 */

#include "screens.h"
#include "config.h"
#include "glyphs.h"
#include <string.h>

#define CLOCK_DATE_Y        5
#define CLOCK_DIGITS_Y      35
#define CLOCK_AMPM_Y        95

ClockScreen::ClockScreen()
    : ctx_(nullptr), time_valid_(false), last_check_ms_(0) {
    time_[0] = '\0';
    ampm_[0] = '\0';
    date_[0] = '\0';
}

void ClockScreen::enter(AppContext& ctx) {
    ctx_ = &ctx;
    last_check_ms_ = ctx.clock.millis();
    refresh();
}

bool ClockScreen::refresh() {
    char time_text[sizeof(time_)];
    char ampm_text[sizeof(ampm_)];
    char date_text[sizeof(date_)];

    struct tm now;
    bool valid = ctx_->clock.localTime(now);
    if (valid) {
        formatClockTime(now, ctx_->settings.clockFormat(), ctx_->settings.showSeconds(),
                        time_text, sizeof(time_text), ampm_text, sizeof(ampm_text));
        std::string date_format = ctx_->settings.dateFormat();
        formatDate(now, date_format.c_str(), date_text, sizeof(date_text));
    } else {
        time_text[0] = '\0';
        ampm_text[0] = '\0';
        strcpy(date_text, "Clock not set");
    }

    bool changed = valid != time_valid_ ||
                   strcmp(time_text, time_) != 0 ||
                   strcmp(ampm_text, ampm_) != 0 ||
                   strcmp(date_text, date_) != 0;

    time_valid_ = valid;
    strcpy(time_, time_text);
    strcpy(ampm_, ampm_text);
    strcpy(date_, date_text);
    return changed;
}

void ClockScreen::render(Canvas& canvas, const Palette& palette) const {
    canvas.fillScreen(palette.background);
    printCentered(canvas, date_, CLOCK_DATE_Y, 2, palette.foreground);

    if (!time_valid_) {
        printCentered(canvas, "--:--", CLOCK_DIGITS_Y + 10, 4, palette.foreground);
        printFooter(canvas, "Time syncs on Weather fetch", palette.foreground);
        return;
    }

    int16_t x = (canvas.width() - segmentTimeWidth(time_)) / 2;
    drawSegmentTime(canvas, time_, x, CLOCK_DIGITS_Y, palette.foreground);

    if (ampm_[0] != '\0') {
        printCentered(canvas, ampm_, CLOCK_AMPM_Y, 2, palette.foreground);
    }
}

Transition ClockScreen::handleKey(const KeyEvent& key) {
    (void)key;
    return Transition::go(SCREEN_MAIN_MENU);
}

Transition ClockScreen::tick(uint32_t now_ms) {
    if (now_ms - last_check_ms_ < UI_CLOCK_CHECK_MS) {
        return Transition::stay();
    }
    last_check_ms_ = now_ms;

    if (refresh()) {
        DEBUG_PRINTF(g_debug_ui, "Clock: %s %s\n", time_, ampm_);
        return Transition::redraw();
    }
    return Transition::stay();
}
