/**
 * InkDeck - UI State Machine
 * Owns one instance of every screen and drives the active one
 *
 * Loop contract (step):
 *   1. Stop when Ctrl-C was seen on the console
 *   2. Tick the active screen (timers, deferred work)
 *   3. While the screen is busy, wait without touching the key queue
 *   4. Otherwise poll one key with a short timeout and dispatch it
 *
 * A GOTO transition resets the target screen, enters it and draws it with a
 * full refresh. REDRAW uses the refresh_mode setting.
 */

#ifndef UI_APP_H
#define UI_APP_H

#include <stdint.h>
#include "screens.h"

class UiApp {
public:
    explicit UiApp(AppContext& ctx);

    // Enter the initial screen (Clock) and draw it
    void begin();

    // One loop iteration; false once an interrupt was requested
    bool step();

    // step() until interrupted, then shutdown()
    void run();

    // Stop input (restores the terminal), put the panel to sleep
    void shutdown();

    ScreenId activeScreen() const { return active_; }
    bool asleep() const { return asleep_; }
    uint32_t frameCount() const { return frames_; }

    // Direct access for tests and diagnostics
    ClockScreen& clockScreen() { return clock_; }
    MainMenuScreen& mainMenuScreen() { return main_menu_; }
    NotesMenuScreen& notesMenuScreen() { return notes_menu_; }
    CreateNoteScreen& createNoteScreen() { return create_note_; }
    ViewNotesScreen& viewNotesScreen() { return view_notes_; }
    WeatherScreen& weatherScreen() { return weather_; }
    SettingsScreen& settingsScreen() { return settings_; }

private:
    // Call f with the active screen object
    template <typename F>
    void withActive(F f) {
        switch (active_) {
            case SCREEN_CLOCK:          f(clock_); break;
            case SCREEN_MAIN_MENU:      f(main_menu_); break;
            case SCREEN_NOTES_MENU:     f(notes_menu_); break;
            case SCREEN_CREATE_NOTE:    f(create_note_); break;
            case SCREEN_VIEW_NOTES:     f(view_notes_); break;
            case SCREEN_WEATHER:        f(weather_); break;
            case SCREEN_SETTINGS:       f(settings_); break;
        }
    }

    void switchTo(ScreenId next);
    void apply(const Transition& transition);
    void draw(bool full_refresh);
    bool activeBusy();
    void checkAutoSleep(uint32_t now_ms);

    AppContext& ctx_;
    ScreenId active_;

    ClockScreen clock_;
    MainMenuScreen main_menu_;
    NotesMenuScreen notes_menu_;
    CreateNoteScreen create_note_;
    ViewNotesScreen view_notes_;
    WeatherScreen weather_;
    SettingsScreen settings_;

    uint32_t last_key_ms_;
    uint32_t frames_;
    bool asleep_;
    bool stopped_;
};

#endif // UI_APP_H
