/**
 * InkDeck - Settings Screen
 * Scrollable settings list with ZIP entry, display info and factory reset
 */

#include "screens.h"
#include "config.h"
#include <stdio.h>

#define SETTINGS_LIST_TOP   16
#define SETTINGS_ROW_HEIGHT 15

struct SettingsRowInfo {
    const char* label;
    const char* key;        // nullptr for action rows
};

static const SettingsRowInfo SETTINGS_ROWS[SettingsScreen::ROW_COUNT] = {
    { "Dark Mode",     SETTING_DARK_MODE },
    { "Clock Format",  SETTING_CLOCK_FORMAT },
    { "Date Format",   SETTING_DATE_FORMAT },
    { "Refresh Mode",  SETTING_REFRESH_MODE },
    { "Auto Sleep",    SETTING_AUTO_SLEEP },
    { "Show Seconds",  SETTING_SHOW_SECONDS },
    { "ZIP Code",      SETTING_ZIP_CODE },
    { "Display Info",  nullptr },
    { "Factory Reset", nullptr },
};

SettingsScreen::SettingsScreen()
    : ctx_(nullptr), mode_(MODE_LIST), selected_(0), scroll_(0) {}

void SettingsScreen::enter(AppContext& ctx) {
    ctx_ = &ctx;
    mode_ = MODE_LIST;
    selected_ = 0;
    scroll_ = 0;
    overlay_.clear();
}

std::string SettingsScreen::rowValue(Row row) const {
    const SettingsStore& settings = ctx_->settings;
    char text[24];

    switch (row) {
        case ROW_DARK_MODE:
            return settings.darkMode() ? "On" : "Off";
        case ROW_CLOCK_FORMAT:
            snprintf(text, sizeof(text), "%dh", settings.clockFormat());
            return text;
        case ROW_DATE_FORMAT: {
            std::string format = settings.dateFormat();
            if (format == "short") return "Short";
            if (format == "iso") return "ISO";
            return "Long";
        }
        case ROW_REFRESH_MODE:
            return settings.partialRefresh() ? "Partial" : "Full";
        case ROW_AUTO_SLEEP:
            if (settings.autoSleepMinutes() <= 0) return "Never";
            snprintf(text, sizeof(text), "%d min", settings.autoSleepMinutes());
            return text;
        case ROW_SHOW_SECONDS:
            return settings.showSeconds() ? "On" : "Off";
        case ROW_ZIP_CODE: {
            std::string zip = settings.zipCode();
            return zip.empty() ? "(not set)" : zip;
        }
        case ROW_DISPLAY_INFO:
        case ROW_FACTORY_RESET:
        case ROW_COUNT:
            break;
    }
    return ">";
}

// ---- Rendering ----

void SettingsScreen::render(Canvas& canvas, const Palette& palette) const {
    if (overlay_.active) {
        overlay_.render(canvas, palette);
        return;
    }

    switch (mode_) {
        case MODE_LIST:
            renderList(canvas, palette);
            break;
        case MODE_ZIP_PROMPT:
            prompt_.render(canvas, palette, "ZIP CODE");
            break;
        case MODE_DISPLAY_INFO:
            renderDisplayInfo(canvas, palette);
            break;
        case MODE_CONFIRM_RESET:
            renderConfirmReset(canvas, palette);
            break;
    }
}

void SettingsScreen::renderList(Canvas& canvas, const Palette& palette) const {
    canvas.fillScreen(palette.background);
    drawTitleBar(canvas, palette, "SETTINGS");

    int end = scroll_ + SETTINGS_VISIBLE_ROWS;
    if (end > ROW_COUNT) end = ROW_COUNT;

    for (int i = scroll_; i < end; ++i) {
        int16_t y = SETTINGS_LIST_TOP + (i - scroll_) * SETTINGS_ROW_HEIGHT;
        if (i == selected_) {
            canvas.drawText(3, y, ">", 1, palette.foreground);
        }
        canvas.drawText(12, y, SETTINGS_ROWS[i].label, 1, palette.foreground);

        std::string value = rowValue(static_cast<Row>(i));
        canvas.drawText(canvas.width() - 20 - textWidth(value.c_str(), 1), y, value.c_str(), 1,
                        palette.foreground);
    }

    if (scroll_ > 0) {
        canvas.drawText(canvas.width() - 10, SETTINGS_LIST_TOP, "^", 1, palette.foreground);
    }
    if (end < ROW_COUNT) {
        canvas.drawText(canvas.width() - 10, SETTINGS_LIST_TOP + (SETTINGS_VISIBLE_ROWS - 1) * SETTINGS_ROW_HEIGHT,
                        "v", 1, palette.foreground);
    }

    printFooter(canvas, "ENTER=Change ESC=Back", palette.foreground);
}

void SettingsScreen::renderDisplayInfo(Canvas& canvas, const Palette& palette) const {
    char line[48];
    canvas.fillScreen(palette.background);
    drawTitleBar(canvas, palette, "DISPLAY INFO");

    canvas.drawText(8, 18, "Panel: 2.13in mono e-paper", 1, palette.foreground);
    snprintf(line, sizeof(line), "Resolution: %dx%d", canvas.width(), canvas.height());
    canvas.drawText(8, 30, line, 1, palette.foreground);
    snprintf(line, sizeof(line), "Output: %s", ctx_->surface.hasPanel() ? "GDEY0213B74" : "Preview file");
    canvas.drawText(8, 42, line, 1, palette.foreground);
    snprintf(line, sizeof(line), "Refresh: %s", ctx_->settings.partialRefresh() ? "Partial" : "Full");
    canvas.drawText(8, 54, line, 1, palette.foreground);
    snprintf(line, sizeof(line), "Notes stored: %u", static_cast<unsigned>(ctx_->notes.count()));
    canvas.drawText(8, 66, line, 1, palette.foreground);
    snprintf(line, sizeof(line), "Firmware: InkDeck %s", INKDECK_VERSION);
    canvas.drawText(8, 78, line, 1, palette.foreground);

    printFooter(canvas, "ESC=Back", palette.foreground);
}

void SettingsScreen::renderConfirmReset(Canvas& canvas, const Palette& palette) const {
    canvas.fillScreen(palette.background);
    printCentered(canvas, "Factory Reset?", 20, 2, palette.foreground);
    printCentered(canvas, "All notes will be deleted", 50, 1, palette.foreground);
    printCentered(canvas, "and settings restored.", 62, 1, palette.foreground);
    printFooter(canvas, "ENTER=Confirm ESC=Cancel", palette.foreground);
}

// ---- Input ----

Transition SettingsScreen::activateRow() {
    const SettingsRowInfo& info = SETTINGS_ROWS[selected_];

    switch (selected_) {
        case ROW_ZIP_CODE: {
            std::string zip = ctx_->settings.zipCode();
            prompt_.begin("ZIP Code:", ZIP_CODE_MAX_LEN, zip.c_str());
            mode_ = MODE_ZIP_PROMPT;
            return Transition::redraw();
        }
        case ROW_DISPLAY_INFO:
            mode_ = MODE_DISPLAY_INFO;
            return Transition::redraw();
        case ROW_FACTORY_RESET:
            mode_ = MODE_CONFIRM_RESET;
            return Transition::redraw();
        default:
            break;
    }

    if (!ctx_->settings.cycle(info.key)) {
        LOG_PRINTF("Settings: WARNING - could not change %s\n", info.key);
    }
    return Transition::redraw();
}

Transition SettingsScreen::handleKey(const KeyEvent& key) {
    switch (mode_) {
        case MODE_ZIP_PROMPT: {
            PromptResult result = prompt_.feed(key);
            if (result == PROMPT_EDITING) {
                return Transition::redraw();
            }
            if (result == PROMPT_SUBMITTED) {
                ctx_->settings.set(SETTING_ZIP_CODE, prompt_.value());
            }
            mode_ = MODE_LIST;
            return Transition::redraw();
        }

        case MODE_DISPLAY_INFO:
            if (key.code == KEYCODE_ESC || key.code == KEYCODE_ENTER) {
                mode_ = MODE_LIST;
                return Transition::redraw();
            }
            return Transition::stay();

        case MODE_CONFIRM_RESET:
            if (key.code == KEYCODE_ESC) {
                mode_ = MODE_LIST;
                return Transition::redraw();
            }
            if (key.code == KEYCODE_ENTER) {
                LOG_PRINTLN("Settings: Factory reset");
                ctx_->notes.clear();
                ctx_->settings.resetToDefaults();
                if (!ctx_->weather.forgetNetwork()) {
                    LOG_PRINTLN("Settings: Could not clear Wi-Fi credentials");
                }
                // Wipe the old notes off the panel before the confirmation
                ctx_->surface.clear();
                mode_ = MODE_LIST;
                overlay_.start(ctx_->clock.millis(), UI_RESET_DONE_MS, "Reset Complete", "");
                return Transition::redraw();
            }
            return Transition::stay();

        case MODE_LIST:
            break;
    }

    if (key.code == KEYCODE_ESC) {
        return Transition::go(SCREEN_MAIN_MENU);
    }
    if (key.code == KEYCODE_ENTER) {
        return activateRow();
    }

    int previous = selected_;
    if (keyIsUp(key) && selected_ > 0) {
        selected_--;
    } else if (keyIsDown(key) && selected_ < ROW_COUNT - 1) {
        selected_++;
    }
    if (selected_ == previous) {
        return Transition::stay();
    }
    scrollIntoView(selected_, SETTINGS_VISIBLE_ROWS, scroll_);
    return Transition::redraw();
}

Transition SettingsScreen::tick(uint32_t now_ms) {
    if (overlay_.expired(now_ms)) {
        overlay_.clear();
        return Transition::redraw();
    }
    return Transition::stay();
}
