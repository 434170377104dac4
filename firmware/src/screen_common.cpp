/**
 * InkDeck - Screens
 * Names, overlays and layout helpers shared by every screen
 */

#include "screens.h"
#include "config.h"
#include <string.h>

const char* screenName(ScreenId id) {
    switch (id) {
        case SCREEN_CLOCK:          return "Clock";
        case SCREEN_MAIN_MENU:      return "MainMenu";
        case SCREEN_NOTES_MENU:     return "NotesMenu";
        case SCREEN_CREATE_NOTE:    return "CreateNote";
        case SCREEN_VIEW_NOTES:     return "ViewNotes";
        case SCREEN_WEATHER:        return "Weather";
        case SCREEN_SETTINGS:       return "Settings";
    }
    return "Unknown";
}

Overlay::Overlay() : active(false), until_ms(0) {
    title[0] = '\0';
    message[0] = '\0';
}

void Overlay::start(uint32_t now_ms, uint32_t duration_ms, const char* title_text, const char* message_text) {
    active = true;
    until_ms = now_ms + duration_ms;
    strncpy(title, title_text, sizeof(title) - 1);
    title[sizeof(title) - 1] = '\0';
    strncpy(message, message_text, sizeof(message) - 1);
    message[sizeof(message) - 1] = '\0';
}

bool Overlay::expired(uint32_t now_ms) const {
    // Signed difference survives millis() wrap
    return active && static_cast<int32_t>(now_ms - until_ms) >= 0;
}

void Overlay::render(Canvas& canvas, const Palette& palette) const {
    canvas.fillScreen(palette.background);
    if (message[0] == '\0') {
        printCentered(canvas, title, 50, 2, palette.foreground);
        return;
    }
    printCentered(canvas, title, 38, 2, palette.foreground);
    printCentered(canvas, message, 65, 2, palette.foreground);
}

void drawTitleBar(Canvas& canvas, const Palette& palette, const char* title) {
    printCentered(canvas, title, 2, 1, palette.foreground);
    canvas.drawLine(0, 12, canvas.width() - 1, 12, palette.foreground);
}

void scrollIntoView(int selected, int visible, int& scroll) {
    if (selected < scroll) {
        scroll = selected;
    } else if (selected >= scroll + visible) {
        scroll = selected - visible + 1;
    }
    if (scroll < 0) scroll = 0;
}
