/**
 * InkDeck - Main Menu Screen
 * 2x4 launcher grid with direct numeric selection
 */

#include "screens.h"
#include "config.h"
#include "glyphs.h"
#include <stdio.h>

struct MenuSlot {
    const char* name;
    MenuIcon icon;
    bool bound;
    ScreenId target;
};

static const MenuSlot MENU_SLOTS[MAIN_MENU_SLOTS] = {
    { "Clock",    MENU_ICON_CLOCK,    true,  SCREEN_CLOCK },
    { "Notes",    MENU_ICON_NOTES,    true,  SCREEN_NOTES_MENU },
    { "?",        MENU_ICON_NONE,     false, SCREEN_MAIN_MENU },
    { "?",        MENU_ICON_NONE,     false, SCREEN_MAIN_MENU },
    { "?",        MENU_ICON_NONE,     false, SCREEN_MAIN_MENU },
    { "?",        MENU_ICON_NONE,     false, SCREEN_MAIN_MENU },
    { "Weather",  MENU_ICON_WEATHER,  true,  SCREEN_WEATHER },
    { "Settings", MENU_ICON_SETTINGS, true,  SCREEN_SETTINGS },
};

#define MENU_GRID_TOP   14

MainMenuScreen::MainMenuScreen() : ctx_(nullptr), selected_(0) {}

void MainMenuScreen::enter(AppContext& ctx) {
    ctx_ = &ctx;
    selected_ = 0;
    overlay_.clear();
}

void MainMenuScreen::render(Canvas& canvas, const Palette& palette) const {
    if (overlay_.active) {
        overlay_.render(canvas, palette);
        return;
    }

    canvas.fillScreen(palette.background);
    printCentered(canvas, "MAIN MENU", 3, 1, palette.foreground);

    const int16_t cell_w = canvas.width() / MAIN_MENU_COLUMNS;
    const int16_t cell_h = (canvas.height() - MENU_GRID_TOP) / 2;

    for (int i = 0; i < MAIN_MENU_SLOTS; ++i) {
        const MenuSlot& slot = MENU_SLOTS[i];
        int16_t x = (i % MAIN_MENU_COLUMNS) * cell_w;
        int16_t y = MENU_GRID_TOP + (i / MAIN_MENU_COLUMNS) * cell_h;

        if (i == selected_) {
            canvas.drawRect(x + 2, y + 1, cell_w - 4, cell_h - 2, palette.foreground);
            canvas.drawRect(x + 3, y + 2, cell_w - 6, cell_h - 4, palette.foreground);
        }

        char number[4];
        snprintf(number, sizeof(number), "%d", i + 1);
        canvas.drawText(x + 6, y + 5, number, 1, palette.foreground);

        drawMenuIcon(canvas, slot.icon, x + cell_w / 2, y + 22, palette.foreground, palette.background);

        int16_t name_x = x + (cell_w - textWidth(slot.name, 1)) / 2;
        canvas.drawText(name_x, y + cell_h - 12, slot.name, 1, palette.foreground);
    }
}

Transition MainMenuScreen::handleKey(const KeyEvent& key) {
    if (key.code == KEYCODE_ESC) {
        return Transition::go(SCREEN_CLOCK);
    }

    if (key.code == KEYCODE_ENTER) {
        const MenuSlot& slot = MENU_SLOTS[selected_];
        if (slot.bound) {
            return Transition::go(slot.target);
        }
        char title[16];
        snprintf(title, sizeof(title), "App %d", selected_ + 1);
        DEBUG_PRINTF(g_debug_ui, "Menu: Slot %d is not assigned\n", selected_ + 1);
        overlay_.start(ctx_->clock.millis(), UI_COMING_SOON_MS, title, "Coming Soon!");
        return Transition::redraw();
    }

    int previous = selected_;
    if (keyIsUp(key)) {
        if (selected_ >= MAIN_MENU_COLUMNS) selected_ -= MAIN_MENU_COLUMNS;
    } else if (keyIsDown(key)) {
        if (selected_ < MAIN_MENU_COLUMNS) selected_ += MAIN_MENU_COLUMNS;
    } else if (keyIsLeft(key)) {
        if (selected_ % MAIN_MENU_COLUMNS != 0) selected_--;
    } else if (keyIsRight(key)) {
        if (selected_ % MAIN_MENU_COLUMNS != MAIN_MENU_COLUMNS - 1) selected_++;
    } else if (key.isDigit() && key.digit() >= 1 && key.digit() <= MAIN_MENU_SLOTS) {
        selected_ = key.digit() - 1;
    }

    return selected_ != previous ? Transition::redraw() : Transition::stay();
}

Transition MainMenuScreen::tick(uint32_t now_ms) {
    if (overlay_.expired(now_ms)) {
        overlay_.clear();
        return Transition::redraw();
    }
    return Transition::stay();
}
