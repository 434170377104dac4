// Screen flows driven through UiApp with scripted keys

#include <gtest/gtest.h>
#include <string>
#include "config.h"
#include "ui_app.h"
#include "support/fakes.h"

class UiAppTest : public ::testing::Test {
protected:
    UiAppTest()
        : keys(clock),
          notes(files, clock, NOTES_FILE_PATH),
          settings(files, SETTINGS_FILE_PATH),
          ctx{ surface, keys, notes, settings, clock, weather },
          app(ctx) {}

    void SetUp() override {
        app.begin();
    }

    // Step until every queued key has been handled
    void drain() {
        for (int guard = 0; guard < 10000 && !keys.queue.empty(); ++guard) {
            app.step();
        }
        ASSERT_TRUE(keys.queue.empty());
    }

    // Step with no input until at least `ms` has passed on the clock
    void idle(uint32_t ms) {
        const uint32_t end = clock.millis() + ms;
        while (static_cast<int32_t>(clock.millis() - end) < 0) {
            app.step();
        }
    }

    void press(KeyCode code) {
        keys.push(code);
        drain();
    }

    void press(char ch) {
        keys.push(ch);
        drain();
    }

    void typeLine(const std::string& text) {
        keys.type(text);
        keys.push(KEYCODE_ENTER);
        drain();
    }

    void openMainMenu() {
        press('m');
        ASSERT_EQ(SCREEN_MAIN_MENU, app.activeScreen());
    }

    void launchSlot(char digit, ScreenId expected) {
        openMainMenu();
        press(digit);
        press(KEYCODE_ENTER);
        ASSERT_EQ(expected, app.activeScreen());
    }

    void openViewNotes() {
        launchSlot('2', SCREEN_NOTES_MENU);
        press('2');
        press(KEYCODE_ENTER);
        ASSERT_EQ(SCREEN_VIEW_NOTES, app.activeScreen());
    }

    MemoryFileStore files;
    FakeClock clock;
    ScriptedKeys keys;
    FakeSurface surface;
    NotesStore notes;
    SettingsStore settings;
    FakeWeather weather;
    AppContext ctx;
    UiApp app;
};

// ---- Clock and main menu ----

TEST_F(UiAppTest, StartsOnClockWithFullRefresh) {
    EXPECT_EQ(SCREEN_CLOCK, app.activeScreen());
    EXPECT_EQ(1, surface.full_shows);
    EXPECT_EQ(0, surface.partial_shows);
    EXPECT_STREQ(" 9:41", app.clockScreen().timeText());
    EXPECT_STREQ("Mon, Jan 05, 2026", app.clockScreen().dateText());
}

TEST_F(UiAppTest, AnyKeyOnClockOpensMainMenu) {
    press(KEYCODE_LEFT);
    EXPECT_EQ(SCREEN_MAIN_MENU, app.activeScreen());
    EXPECT_TRUE(surface.frame.hasText("MAIN MENU"));
}

TEST_F(UiAppTest, EnterOnFirstSlotReturnsToClock) {
    openMainMenu();
    press(KEYCODE_ENTER);
    EXPECT_EQ(SCREEN_CLOCK, app.activeScreen());
}

TEST_F(UiAppTest, EscFromMainMenuReturnsToClock) {
    openMainMenu();
    press(KEYCODE_ESC);
    EXPECT_EQ(SCREEN_CLOCK, app.activeScreen());
}

TEST_F(UiAppTest, MenuNavigationClampsAtEdges) {
    openMainMenu();
    for (int i = 0; i < 5; ++i) press('d');
    EXPECT_EQ(3, app.mainMenuScreen().selected());
    press('s');
    EXPECT_EQ(7, app.mainMenuScreen().selected());
    press(KEYCODE_DOWN);
    EXPECT_EQ(7, app.mainMenuScreen().selected());
    press('w');
    EXPECT_EQ(3, app.mainMenuScreen().selected());
    for (int i = 0; i < 5; ++i) press(KEYCODE_LEFT);
    EXPECT_EQ(0, app.mainMenuScreen().selected());
}

TEST_F(UiAppTest, DigitSelectsWithoutLaunching) {
    openMainMenu();
    press('7');
    EXPECT_EQ(SCREEN_MAIN_MENU, app.activeScreen());
    EXPECT_EQ(6, app.mainMenuScreen().selected());
    press('9');
    EXPECT_EQ(6, app.mainMenuScreen().selected());
}

TEST_F(UiAppTest, UnboundSlotShowsComingSoonAndHoldsKeys) {
    openMainMenu();
    press('3');
    keys.push(KEYCODE_ENTER);
    keys.push(KEYCODE_ESC);

    app.step();
    const uint32_t shown_at = clock.millis();
    EXPECT_TRUE(surface.frame.hasText("App 3"));
    EXPECT_TRUE(surface.frame.hasText("Coming Soon!"));

    // ESC waits behind the overlay
    app.step();
    EXPECT_EQ(1u, keys.queue.size());
    EXPECT_EQ(SCREEN_MAIN_MENU, app.activeScreen());

    drain();
    EXPECT_EQ(SCREEN_CLOCK, app.activeScreen());
    EXPECT_GE(clock.millis() - shown_at, static_cast<uint32_t>(UI_COMING_SOON_MS));
}

TEST_F(UiAppTest, ComingSoonClearsBackToMenu) {
    openMainMenu();
    press('5');
    press(KEYCODE_ENTER);
    EXPECT_TRUE(app.mainMenuScreen().busy());

    idle(UI_COMING_SOON_MS + 100);
    EXPECT_FALSE(app.mainMenuScreen().busy());
    EXPECT_TRUE(surface.frame.hasText("MAIN MENU"));
    EXPECT_EQ(4, app.mainMenuScreen().selected());
}

// ---- Refresh policy ----

TEST_F(UiAppTest, ClockRedrawsOnlyWhenMinuteChanges) {
    idle(58000);
    EXPECT_EQ(1, surface.shows);
    EXPECT_EQ(1u, app.frameCount());

    idle(3000);
    EXPECT_EQ(2, surface.shows);
    EXPECT_EQ(2u, app.frameCount());
    EXPECT_EQ(1, surface.partial_shows);
    EXPECT_STREQ(" 9:42", app.clockScreen().timeText());
}

TEST_F(UiAppTest, ScreenEntryIsFullAndUpdatesArePartial) {
    openMainMenu();
    EXPECT_EQ(2, surface.full_shows);
    press('d');
    EXPECT_EQ(1, surface.partial_shows);
}

TEST_F(UiAppTest, FullRefreshSettingDisablesPartials) {
    settings.set(SETTING_REFRESH_MODE, "full");
    openMainMenu();
    press('d');
    EXPECT_EQ(0, surface.partial_shows);
    EXPECT_EQ(3, surface.full_shows);
}

TEST_F(UiAppTest, DarkModeInvertsFrame) {
    EXPECT_EQ(COLOR_WHITE, surface.frame.pixel(0, surface.frame.height() - 1));

    settings.set(SETTING_DARK_MODE, true);
    openMainMenu();
    EXPECT_EQ(COLOR_BLACK, surface.frame.pixel(0, surface.frame.height() - 1));
    EXPECT_GT(surface.frame.countPixels(COLOR_WHITE), 0);
}

// ---- Notes ----

TEST_F(UiAppTest, CreateNoteFlowSavesAndReturnsToNotesMenu) {
    launchSlot('2', SCREEN_NOTES_MENU);
    press(KEYCODE_ENTER);
    ASSERT_EQ(SCREEN_CREATE_NOTE, app.activeScreen());

    typeLine("Groceries");
    EXPECT_TRUE(surface.frame.hasText("Note Content:"));
    typeLine("Milk, eggs");

    EXPECT_TRUE(surface.frame.hasText("Note Saved!"));
    EXPECT_EQ(SCREEN_CREATE_NOTE, app.activeScreen());

    idle(UI_NOTE_SAVED_MS + 100);
    EXPECT_EQ(SCREEN_NOTES_MENU, app.activeScreen());

    ASSERT_EQ(1u, notes.count());
    EXPECT_EQ(1, notes.list()[0].id);
    EXPECT_EQ("Groceries", notes.list()[0].title);
    EXPECT_EQ("Milk, eggs", notes.list()[0].content);
}

TEST_F(UiAppTest, EscDuringContentDiscardsNote) {
    launchSlot('2', SCREEN_NOTES_MENU);
    press(KEYCODE_ENTER);
    typeLine("Draft");
    keys.type("half written");
    keys.push(KEYCODE_ESC);
    drain();

    EXPECT_EQ(SCREEN_NOTES_MENU, app.activeScreen());
    EXPECT_EQ(0u, notes.count());
}

TEST_F(UiAppTest, EmptySubmissionsStillCreateNote) {
    launchSlot('2', SCREEN_NOTES_MENU);
    press(KEYCODE_ENTER);
    press(KEYCODE_ENTER);
    press(KEYCODE_ENTER);

    ASSERT_EQ(1u, notes.count());
    EXPECT_EQ("", notes.list()[0].title);
    EXPECT_EQ("", notes.list()[0].content);
}

TEST_F(UiAppTest, EmptyNoteListOnlyAnswersEsc) {
    openViewNotes();
    EXPECT_TRUE(surface.frame.hasText("No notes yet"));

    const int shows = surface.shows;
    keys.push('s');
    keys.push('w');
    keys.push(KEYCODE_ENTER);
    keys.push('1');
    keys.push('e');
    keys.push('x');
    drain();
    EXPECT_EQ(shows, surface.shows);
    EXPECT_EQ(SCREEN_VIEW_NOTES, app.activeScreen());

    press(KEYCODE_ESC);
    EXPECT_EQ(SCREEN_NOTES_MENU, app.activeScreen());
}

TEST_F(UiAppTest, NoteListScrollsWithSelection) {
    for (int i = 0; i < 7; ++i) {
        notes.create("Note " + std::to_string(i + 1), "body");
    }
    openViewNotes();

    for (int i = 0; i < 6; ++i) press('s');
    EXPECT_EQ(6, app.viewNotesScreen().selected());
    EXPECT_EQ(2, app.viewNotesScreen().scroll());
    press('s');
    EXPECT_EQ(6, app.viewNotesScreen().selected());

    press('1');
    EXPECT_EQ(0, app.viewNotesScreen().selected());
    EXPECT_EQ(0, app.viewNotesScreen().scroll());
    press('9');
    EXPECT_EQ(0, app.viewNotesScreen().selected());
}

TEST_F(UiAppTest, ViewerPagesAndReturnsOnEscOnly) {
    std::string body;
    for (int i = 0; i < 60; ++i) body += "word ";
    notes.create("Long", body);
    openViewNotes();

    press(KEYCODE_ENTER);
    ASSERT_TRUE(app.viewNotesScreen().viewing());
    EXPECT_EQ(2, app.viewNotesScreen().pageCount());
    EXPECT_TRUE(surface.frame.hasText("..."));

    press(KEYCODE_DOWN);
    EXPECT_EQ(1, app.viewNotesScreen().page());
    press('s');
    EXPECT_EQ(1, app.viewNotesScreen().page());
    press('w');
    EXPECT_EQ(0, app.viewNotesScreen().page());

    press(KEYCODE_ENTER);
    press('q');
    EXPECT_TRUE(app.viewNotesScreen().viewing());

    press(KEYCODE_ESC);
    EXPECT_FALSE(app.viewNotesScreen().viewing());
    EXPECT_EQ(SCREEN_VIEW_NOTES, app.activeScreen());
}

TEST_F(UiAppTest, EditPrefillsAndUpdatesNote) {
    notes.create("Groceries", "Milk");
    const std::string created = notes.list()[0].created;
    openViewNotes();

    press('e');
    EXPECT_TRUE(surface.frame.hasText("Groceries_"));
    for (int i = 0; i < 9; ++i) keys.push(KEYCODE_BACKSPACE);
    typeLine("Shopping");
    EXPECT_TRUE(surface.frame.hasText("Milk_"));
    typeLine(", eggs");

    EXPECT_TRUE(surface.frame.hasText("Note Saved!"));
    ASSERT_EQ(1u, notes.count());
    EXPECT_EQ("Shopping", notes.list()[0].title);
    EXPECT_EQ("Milk, eggs", notes.list()[0].content);
    EXPECT_EQ(created, notes.list()[0].created);

    idle(UI_NOTE_SAVED_MS + 100);
    EXPECT_TRUE(surface.frame.hasText("YOUR NOTES"));
}

TEST_F(UiAppTest, EscDuringEditKeepsNote) {
    notes.create("Groceries", "Milk");
    openViewNotes();

    press('e');
    typeLine("Changed");
    press(KEYCODE_ESC);
    EXPECT_EQ("Groceries", notes.list()[0].title);
    EXPECT_EQ(SCREEN_VIEW_NOTES, app.activeScreen());
}

TEST_F(UiAppTest, DeleteAsksForConfirmation) {
    notes.create("First", "");
    notes.create("Second", "");
    openViewNotes();

    press('s');
    press('x');
    EXPECT_TRUE(surface.frame.hasText("Delete note?"));
    press(KEYCODE_ESC);
    EXPECT_EQ(2u, notes.count());

    press('x');
    press(KEYCODE_ENTER);
    ASSERT_EQ(1u, notes.count());
    EXPECT_EQ("First", notes.list()[0].title);
    EXPECT_EQ(0, app.viewNotesScreen().selected());
    EXPECT_TRUE(surface.frame.hasText("Note Deleted"));
}

TEST_F(UiAppTest, DeletingLastRowKeepsListWindowFull) {
    for (int i = 0; i < 7; ++i) {
        notes.create("Note " + std::to_string(i + 1), "body");
    }
    openViewNotes();
    for (int i = 0; i < 6; ++i) press('s');
    ASSERT_EQ(2, app.viewNotesScreen().scroll());

    press('x');
    press(KEYCODE_ENTER);
    ASSERT_EQ(6u, notes.count());
    EXPECT_EQ(5, app.viewNotesScreen().selected());
    EXPECT_EQ(1, app.viewNotesScreen().scroll());

    idle(UI_NOTE_SAVED_MS + 100);
    EXPECT_TRUE(surface.frame.hasText("Note 2"));
    EXPECT_TRUE(surface.frame.hasText("Note 6"));
    EXPECT_FALSE(surface.frame.hasText("Note 1"));
}

// ---- Weather ----

TEST_F(UiAppTest, WeatherWithoutZipOnlyAnswersEsc) {
    launchSlot('7', SCREEN_WEATHER);
    EXPECT_EQ(WeatherScreen::STATE_NO_ZIP, app.weatherScreen().state());
    EXPECT_TRUE(surface.frame.hasText("No ZIP code set"));

    press(KEYCODE_ENTER);
    press('r');
    EXPECT_EQ(SCREEN_WEATHER, app.activeScreen());
    EXPECT_EQ(0, weather.fetches);

    press(KEYCODE_ESC);
    EXPECT_EQ(SCREEN_MAIN_MENU, app.activeScreen());
}

TEST_F(UiAppTest, WeatherFetchShowsReport) {
    settings.set(SETTING_ZIP_CODE, "62701");
    weather.ssid = "home";

    launchSlot('7', SCREEN_WEATHER);
    EXPECT_EQ(WeatherScreen::STATE_LOADING, app.weatherScreen().state());
    EXPECT_TRUE(surface.frame.hasText("Loading..."));

    app.step();
    EXPECT_EQ(WeatherScreen::STATE_READY, app.weatherScreen().state());
    EXPECT_EQ(1, weather.fetches);
    EXPECT_EQ("62701", weather.last_location);
    EXPECT_TRUE(surface.frame.hasText("Springfield, Illinois"));
    EXPECT_TRUE(surface.frame.hasText("54F"));
    EXPECT_TRUE(surface.frame.hasText("Tomorrow"));

    // No periodic refetch
    idle(60000);
    EXPECT_EQ(1, weather.fetches);
}

TEST_F(UiAppTest, WeatherFailureShowsErrorAndEscReturns) {
    settings.set(SETTING_ZIP_CODE, "62701");
    weather.ssid = "home";
    weather.succeed = false;

    launchSlot('7', SCREEN_WEATHER);
    app.step();
    EXPECT_EQ(WeatherScreen::STATE_ERROR, app.weatherScreen().state());
    EXPECT_EQ("Network: connection refused", app.weatherScreen().error());
    EXPECT_TRUE(surface.frame.hasText("unavailable"));

    press(KEYCODE_ESC);
    EXPECT_EQ(SCREEN_MAIN_MENU, app.activeScreen());
}

TEST_F(UiAppTest, WeatherAsksForNetworkFirst) {
    settings.set(SETTING_ZIP_CODE, "62701");

    launchSlot('7', SCREEN_WEATHER);
    EXPECT_EQ(WeatherScreen::STATE_WIFI_SSID, app.weatherScreen().state());

    press(KEYCODE_ENTER);
    EXPECT_EQ(WeatherScreen::STATE_WIFI_SSID, app.weatherScreen().state());

    typeLine("home");
    EXPECT_EQ(WeatherScreen::STATE_WIFI_PASSWORD, app.weatherScreen().state());
    keys.type("secret");
    drain();
    EXPECT_TRUE(surface.frame.hasText("******_"));
    EXPECT_FALSE(surface.frame.hasText("secret"));
    press(KEYCODE_ENTER);
    EXPECT_EQ("home", weather.ssid);
    EXPECT_EQ("secret", weather.password);

    app.step();
    EXPECT_EQ(WeatherScreen::STATE_READY, app.weatherScreen().state());
}

TEST_F(UiAppTest, EscDuringNetworkPromptLeavesWeather) {
    settings.set(SETTING_ZIP_CODE, "62701");
    launchSlot('7', SCREEN_WEATHER);
    keys.type("ho");
    keys.push(KEYCODE_ESC);
    drain();
    EXPECT_EQ(SCREEN_MAIN_MENU, app.activeScreen());
    EXPECT_TRUE(weather.ssid.empty());
}

// ---- Settings ----

TEST_F(UiAppTest, SettingsRowsCycleAndPersist) {
    launchSlot('8', SCREEN_SETTINGS);
    EXPECT_EQ("Off", app.settingsScreen().rowValue(SettingsScreen::ROW_DARK_MODE));

    press(KEYCODE_ENTER);
    EXPECT_TRUE(settings.darkMode());
    EXPECT_EQ("On", app.settingsScreen().rowValue(SettingsScreen::ROW_DARK_MODE));

    SettingsStore reloaded(files, SETTINGS_FILE_PATH);
    ASSERT_TRUE(reloaded.load());
    EXPECT_TRUE(reloaded.darkMode());

    press('s');
    press(KEYCODE_ENTER);
    EXPECT_EQ(24, settings.clockFormat());
    EXPECT_EQ("24h", app.settingsScreen().rowValue(SettingsScreen::ROW_CLOCK_FORMAT));

    press('s');
    press('s');
    press('s');
    EXPECT_EQ("Never", app.settingsScreen().rowValue(SettingsScreen::ROW_AUTO_SLEEP));
    press(KEYCODE_ENTER);
    EXPECT_EQ("5 min", app.settingsScreen().rowValue(SettingsScreen::ROW_AUTO_SLEEP));
}

TEST_F(UiAppTest, ZipCodeEnteredFromSettings) {
    launchSlot('8', SCREEN_SETTINGS);
    for (int i = 0; i < 6; ++i) press('s');
    EXPECT_EQ(SettingsScreen::ROW_ZIP_CODE, app.settingsScreen().selected());
    EXPECT_EQ(1, app.settingsScreen().scroll());
    EXPECT_EQ("(not set)", app.settingsScreen().rowValue(SettingsScreen::ROW_ZIP_CODE));

    press(KEYCODE_ENTER);
    EXPECT_EQ(SettingsScreen::MODE_ZIP_PROMPT, app.settingsScreen().mode());
    typeLine("62701");
    EXPECT_EQ(SettingsScreen::MODE_LIST, app.settingsScreen().mode());
    EXPECT_EQ("62701", settings.zipCode());

    // Abort keeps the stored value
    press(KEYCODE_ENTER);
    keys.push(KEYCODE_BACKSPACE);
    keys.push(KEYCODE_ESC);
    drain();
    EXPECT_EQ("62701", settings.zipCode());
}

TEST_F(UiAppTest, DisplayInfoShowsPanelDetails) {
    launchSlot('8', SCREEN_SETTINGS);
    for (int i = 0; i < 7; ++i) press('s');
    press(KEYCODE_ENTER);
    EXPECT_EQ(SettingsScreen::MODE_DISPLAY_INFO, app.settingsScreen().mode());
    EXPECT_TRUE(surface.frame.hasText("Resolution: 250x122"));
    EXPECT_TRUE(surface.frame.hasText("InkDeck " INKDECK_VERSION));

    press(KEYCODE_ESC);
    EXPECT_EQ(SettingsScreen::MODE_LIST, app.settingsScreen().mode());
    EXPECT_EQ(SCREEN_SETTINGS, app.activeScreen());
}

TEST_F(UiAppTest, FactoryResetNeedsConfirmation) {
    notes.create("One", "");
    notes.create("Two", "");
    settings.set(SETTING_DARK_MODE, true);
    settings.set(SETTING_ZIP_CODE, "62701");
    weather.configureNetwork("home", "secret");

    launchSlot('8', SCREEN_SETTINGS);
    for (int i = 0; i < 8; ++i) press('s');
    press(KEYCODE_ENTER);
    EXPECT_EQ(SettingsScreen::MODE_CONFIRM_RESET, app.settingsScreen().mode());
    press(KEYCODE_ESC);
    EXPECT_EQ(2u, notes.count());
    EXPECT_TRUE(settings.darkMode());
    EXPECT_EQ("home", weather.ssid);
    EXPECT_EQ(0, surface.clears);

    press(KEYCODE_ENTER);
    press(KEYCODE_ENTER);
    EXPECT_TRUE(surface.frame.hasText("Reset Complete"));
    EXPECT_EQ(0u, notes.count());
    EXPECT_FALSE(settings.darkMode());
    EXPECT_EQ("", settings.zipCode());
    EXPECT_TRUE(weather.ssid.empty());
    EXPECT_TRUE(weather.password.empty());
    EXPECT_EQ(1, surface.clears);

    idle(UI_RESET_DONE_MS + 100);
    EXPECT_TRUE(surface.frame.hasText("SETTINGS"));
}

// ---- Sleep and shutdown ----

TEST_F(UiAppTest, AutoSleepAfterIdleAndWakeKeyIsConsumed) {
    settings.set(SETTING_AUTO_SLEEP, 5);
    idle(4 * 60000);
    EXPECT_FALSE(app.asleep());

    idle(60000 + 200);
    EXPECT_TRUE(app.asleep());
    EXPECT_EQ(1, surface.sleeps);

    // Clock ticks do not reach the sleeping panel
    const int shows = surface.shows;
    idle(120000);
    EXPECT_EQ(shows, surface.shows);

    const int full = surface.full_shows;
    press('x');
    EXPECT_FALSE(app.asleep());
    EXPECT_EQ(SCREEN_CLOCK, app.activeScreen());
    EXPECT_EQ(full + 1, surface.full_shows);

    press('x');
    EXPECT_EQ(SCREEN_MAIN_MENU, app.activeScreen());
}

TEST_F(UiAppTest, NeverSleepsWhenDisabled) {
    idle(40 * 60000);
    EXPECT_FALSE(app.asleep());
    EXPECT_EQ(0, surface.sleeps);
}

TEST_F(UiAppTest, InterruptStopsLoopAndSleepsPanel) {
    openMainMenu();
    keys.interrupt = true;
    app.run();

    EXPECT_FALSE(app.step());
    EXPECT_EQ(1, keys.stopped);
    EXPECT_EQ(1, surface.sleeps);
}

TEST_F(UiAppTest, InterruptHonoredWhilePromptOpen) {
    launchSlot('2', SCREEN_NOTES_MENU);
    press(KEYCODE_ENTER);
    keys.type("unfinished");
    keys.interrupt = true;

    EXPECT_FALSE(app.step());
    EXPECT_EQ(0u, notes.count());
}
