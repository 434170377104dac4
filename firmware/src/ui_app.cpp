/**
 * InkDeck - UI State Machine
 * Implementation
 */

#include "ui_app.h"
#include "config.h"

UiApp::UiApp(AppContext& ctx)
    : ctx_(ctx), active_(SCREEN_CLOCK), last_key_ms_(0), frames_(0),
      asleep_(false), stopped_(false) {}

void UiApp::begin() {
    LOG_PRINTLN("UI: Starting on Clock");
    last_key_ms_ = ctx_.clock.millis();
    switchTo(SCREEN_CLOCK);
}

void UiApp::switchTo(ScreenId next) {
    DEBUG_PRINTF(g_debug_ui, "UI: %s -> %s\n", screenName(active_), screenName(next));
    active_ = next;

    // Fresh transient state on every entry
    switch (next) {
        case SCREEN_CLOCK:          clock_ = ClockScreen(); break;
        case SCREEN_MAIN_MENU:      main_menu_ = MainMenuScreen(); break;
        case SCREEN_NOTES_MENU:     notes_menu_ = NotesMenuScreen(); break;
        case SCREEN_CREATE_NOTE:    create_note_ = CreateNoteScreen(); break;
        case SCREEN_VIEW_NOTES:     view_notes_ = ViewNotesScreen(); break;
        case SCREEN_WEATHER:        weather_ = WeatherScreen(); break;
        case SCREEN_SETTINGS:       settings_ = SettingsScreen(); break;
    }

    AppContext& ctx = ctx_;
    withActive([&ctx](auto& screen) { screen.enter(ctx); });
    draw(true);
}

void UiApp::draw(bool full_refresh) {
    if (asleep_) {
        return;  // Redrawn in full on wake
    }

    Canvas& canvas = ctx_.surface.canvas();
    const Palette palette = paletteFor(ctx_.settings.darkMode());
    withActive([&canvas, &palette](auto& screen) { screen.render(canvas, palette); });

    const bool partial = !full_refresh && ctx_.settings.partialRefresh();
    ctx_.surface.show(partial);
    frames_++;
    DEBUG_PRINTF(g_debug_display, "UI: Frame %u (%s)\n", static_cast<unsigned>(frames_),
                 partial ? "partial" : "full");
}

void UiApp::apply(const Transition& transition) {
    switch (transition.kind) {
        case TRANSITION_STAY:
            break;
        case TRANSITION_REDRAW:
            draw(false);
            break;
        case TRANSITION_GOTO:
            switchTo(transition.next);
            break;
    }
}

bool UiApp::activeBusy() {
    bool busy = false;
    withActive([&busy](auto& screen) { busy = screen.busy(); });
    return busy;
}

void UiApp::checkAutoSleep(uint32_t now_ms) {
    const int minutes = ctx_.settings.autoSleepMinutes();
    if (asleep_ || minutes <= 0) {
        return;
    }
    if (now_ms - last_key_ms_ >= static_cast<uint32_t>(minutes) * 60000UL) {
        LOG_PRINTF("UI: No input for %d min, display sleeping\n", minutes);
        ctx_.surface.sleep();
        asleep_ = true;
    }
}

bool UiApp::step() {
    if (stopped_) {
        return false;
    }
    if (ctx_.keys.interruptRequested()) {
        LOG_PRINTLN("UI: Interrupt requested");
        stopped_ = true;
        return false;
    }

    Transition transition = Transition::stay();
    const uint32_t now = ctx_.clock.millis();
    withActive([&transition, now](auto& screen) { transition = screen.tick(now); });
    apply(transition);

    if (activeBusy()) {
        // Keys stay queued until the overlay or fetch is done
        ctx_.clock.delayMs(UI_BUSY_WAIT_MS);
        return true;
    }

    KeyEvent key;
    if (!ctx_.keys.pollKey(key, KEY_POLL_TIMEOUT_MS)) {
        checkAutoSleep(ctx_.clock.millis());
        return true;
    }

    last_key_ms_ = ctx_.clock.millis();

    if (g_debug_enabled && g_debug_input) {
        char name[8];
        consolePrintf("UI: Key %s on %s\n", keyName(key, name, sizeof(name)), screenName(active_));
    }

    if (asleep_) {
        // Waking key is consumed
        LOG_PRINTLN("UI: Waking display");
        asleep_ = false;
        draw(true);
        return true;
    }

    withActive([&transition, &key](auto& screen) { transition = screen.handleKey(key); });
    apply(transition);
    return true;
}

void UiApp::run() {
    while (step()) {
    }
    shutdown();
}

void UiApp::shutdown() {
    LOG_PRINTLN("UI: Shutting down...");
    ctx_.keys.stop();
    ctx_.surface.sleep();
    LOG_PRINTLN("Goodbye!");
}
