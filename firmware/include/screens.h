/**
 * InkDeck - Screens
 * The closed set of UI screens driven by UiApp
 *
 * Every screen is a plain object with the same shape:
 *   enter(ctx)               reset transient state, capture the shared context
 *   render(canvas, palette)  draw the complete frame
 *   handleKey(key)           react to one key, return the next Transition
 *   tick(now_ms)             timers (overlays, clock, deferred fetch)
 *   busy()                   true while keys must stay queued (overlays, loading)
 *
 * Screens share nothing with each other except the stores reached through
 * AppContext.
 */

#ifndef SCREENS_H
#define SCREENS_H

#include <stdint.h>
#include <string>
#include "canvas.h"
#include "keys.h"
#include "notes_store.h"
#include "render_surface.h"
#include "settings_store.h"
#include "text_input.h"
#include "time_source.h"
#include "weather.h"

// ==================== Transitions ====================

enum ScreenId {
    SCREEN_CLOCK,
    SCREEN_MAIN_MENU,
    SCREEN_NOTES_MENU,
    SCREEN_CREATE_NOTE,
    SCREEN_VIEW_NOTES,
    SCREEN_WEATHER,
    SCREEN_SETTINGS,
};

const char* screenName(ScreenId id);

enum TransitionKind {
    TRANSITION_STAY,     // Nothing changed on screen
    TRANSITION_REDRAW,   // Same screen, new frame
    TRANSITION_GOTO,     // Replace the screen with `next`
};

struct Transition {
    TransitionKind kind;
    ScreenId next;

    static Transition stay() { Transition t = { TRANSITION_STAY, SCREEN_CLOCK }; return t; }
    static Transition redraw() { Transition t = { TRANSITION_REDRAW, SCREEN_CLOCK }; return t; }
    static Transition go(ScreenId id) { Transition t = { TRANSITION_GOTO, id }; return t; }
};

// Dependencies constructed once at startup and shared by reference
struct AppContext {
    RenderSurface& surface;
    KeySource& keys;
    NotesStore& notes;
    SettingsStore& settings;
    TimeSource& clock;
    WeatherProvider& weather;
};

// ==================== Shared Helpers ====================

// Timed full-screen message ("Coming Soon!", "Note Saved!")
struct Overlay {
    bool active;
    uint32_t until_ms;
    char title[24];
    char message[32];

    Overlay();
    void start(uint32_t now_ms, uint32_t duration_ms, const char* title_text, const char* message_text);
    bool expired(uint32_t now_ms) const;
    void clear() { active = false; }
    void render(Canvas& canvas, const Palette& palette) const;
};

// Title centered at the top with a rule below it
void drawTitleBar(Canvas& canvas, const Palette& palette, const char* title);

// Keep `selected` inside a window of `visible` rows starting at `scroll`
void scrollIntoView(int selected, int visible, int& scroll);

// ==================== Screens ====================

class ClockScreen {
public:
    ClockScreen();
    void enter(AppContext& ctx);
    void render(Canvas& canvas, const Palette& palette) const;
    Transition handleKey(const KeyEvent& key);
    Transition tick(uint32_t now_ms);
    bool busy() const { return false; }

    const char* timeText() const { return time_; }
    const char* dateText() const { return date_; }

private:
    // Recompute the displayed strings; true if any changed
    bool refresh();

    AppContext* ctx_;
    bool time_valid_;
    char time_[12];
    char ampm_[4];
    char date_[32];
    uint32_t last_check_ms_;
};

// 2x4 launcher grid
#define MAIN_MENU_SLOTS     8
#define MAIN_MENU_COLUMNS   4

class MainMenuScreen {
public:
    MainMenuScreen();
    void enter(AppContext& ctx);
    void render(Canvas& canvas, const Palette& palette) const;
    Transition handleKey(const KeyEvent& key);
    Transition tick(uint32_t now_ms);
    bool busy() const { return overlay_.active; }

    int selected() const { return selected_; }

private:
    AppContext* ctx_;
    int selected_;         // 0-based slot
    Overlay overlay_;
};

class NotesMenuScreen {
public:
    NotesMenuScreen();
    void enter(AppContext& ctx);
    void render(Canvas& canvas, const Palette& palette) const;
    Transition handleKey(const KeyEvent& key);
    Transition tick(uint32_t) { return Transition::stay(); }
    bool busy() const { return false; }

    int selected() const { return selected_; }

private:
    AppContext* ctx_;
    int selected_;
};

class CreateNoteScreen {
public:
    CreateNoteScreen();
    void enter(AppContext& ctx);
    void render(Canvas& canvas, const Palette& palette) const;
    Transition handleKey(const KeyEvent& key);
    Transition tick(uint32_t now_ms);
    bool busy() const { return overlay_.active; }

private:
    enum Stage {
        STAGE_TITLE,
        STAGE_CONTENT,
        STAGE_SAVED,
    };

    AppContext* ctx_;
    Stage stage_;
    TextPrompt prompt_;
    std::string title_;
    Overlay overlay_;
};

class ViewNotesScreen {
public:
    ViewNotesScreen();
    void enter(AppContext& ctx);
    void render(Canvas& canvas, const Palette& palette) const;
    Transition handleKey(const KeyEvent& key);
    Transition tick(uint32_t now_ms);
    bool busy() const { return overlay_.active; }

    bool viewing() const { return mode_ == MODE_VIEWER; }
    int selected() const { return selected_; }
    int scroll() const { return scroll_; }
    int page() const { return page_; }
    int pageCount() const;

private:
    enum Mode {
        MODE_LIST,
        MODE_VIEWER,
        MODE_EDIT_TITLE,
        MODE_EDIT_CONTENT,
        MODE_CONFIRM_DELETE,
    };

    Transition handleListKey(const KeyEvent& key);
    Transition handleViewerKey(const KeyEvent& key);
    Transition handleEditKey(const KeyEvent& key);
    Transition handleDeleteKey(const KeyEvent& key);

    void renderEmpty(Canvas& canvas, const Palette& palette) const;
    void renderList(Canvas& canvas, const Palette& palette) const;
    void renderViewer(Canvas& canvas, const Palette& palette) const;
    void renderConfirmDelete(Canvas& canvas, const Palette& palette) const;

    void openViewer();
    const Note* selectedNote() const;

    AppContext* ctx_;
    Mode mode_;
    int selected_;
    int scroll_;
    int page_;
    std::vector<std::string> lines_;   // Wrapped content of the open note
    TextPrompt prompt_;
    std::string edit_title_;
    Overlay overlay_;
};

class WeatherScreen {
public:
    WeatherScreen();
    void enter(AppContext& ctx);
    void render(Canvas& canvas, const Palette& palette) const;
    Transition handleKey(const KeyEvent& key);
    Transition tick(uint32_t now_ms);
    bool busy() const { return state_ == STATE_LOADING; }

    enum State {
        STATE_NO_ZIP,
        STATE_WIFI_SSID,
        STATE_WIFI_PASSWORD,
        STATE_LOADING,
        STATE_ERROR,
        STATE_READY,
    };

    State state() const { return state_; }
    const std::string& error() const { return error_; }

private:
    void renderReport(Canvas& canvas, const Palette& palette) const;

    AppContext* ctx_;
    State state_;
    std::string zip_;
    TextPrompt prompt_;
    std::string ssid_;
    WeatherReport report_;
    std::string error_;
};

class SettingsScreen {
public:
    SettingsScreen();
    void enter(AppContext& ctx);
    void render(Canvas& canvas, const Palette& palette) const;
    Transition handleKey(const KeyEvent& key);
    Transition tick(uint32_t now_ms);
    bool busy() const { return overlay_.active; }

    enum Row {
        ROW_DARK_MODE,
        ROW_CLOCK_FORMAT,
        ROW_DATE_FORMAT,
        ROW_REFRESH_MODE,
        ROW_AUTO_SLEEP,
        ROW_SHOW_SECONDS,
        ROW_ZIP_CODE,
        ROW_DISPLAY_INFO,
        ROW_FACTORY_RESET,
        ROW_COUNT,
    };

    enum Mode {
        MODE_LIST,
        MODE_ZIP_PROMPT,
        MODE_DISPLAY_INFO,
        MODE_CONFIRM_RESET,
    };

    int selected() const { return selected_; }
    int scroll() const { return scroll_; }
    Mode mode() const { return mode_; }

    // Value column text for a row ("On", "24h", "Never")
    std::string rowValue(Row row) const;

private:
    Transition activateRow();

    void renderList(Canvas& canvas, const Palette& palette) const;
    void renderDisplayInfo(Canvas& canvas, const Palette& palette) const;
    void renderConfirmReset(Canvas& canvas, const Palette& palette) const;

    AppContext* ctx_;
    Mode mode_;
    int selected_;
    int scroll_;
    TextPrompt prompt_;
    Overlay overlay_;
};

#endif // SCREENS_H
