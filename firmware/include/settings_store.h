/**
 * InkDeck - Settings Store
 * Flat key/value settings persisted as a JSON object
 *
 * Load merges the file over the defaults, so keys added by a firmware update
 * appear for existing installs and unknown keys survive a rewrite.
 */

#ifndef SETTINGS_STORE_H
#define SETTINGS_STORE_H

#include <ArduinoJson.h>
#include <string>
#include "file_store.h"

// Setting keys
#define SETTING_DARK_MODE       "dark_mode"       // bool
#define SETTING_CLOCK_FORMAT    "clock_format"    // int: 12, 24
#define SETTING_DATE_FORMAT     "date_format"     // "long", "short", "iso"
#define SETTING_REFRESH_MODE    "refresh_mode"    // "partial", "full"
#define SETTING_AUTO_SLEEP      "auto_sleep"      // int minutes, 0 = never
#define SETTING_SHOW_SECONDS    "show_seconds"    // bool
#define SETTING_ZIP_CODE        "zip_code"        // string

enum SettingType {
    SETTING_TYPE_BOOL,
    SETTING_TYPE_INT,
    SETTING_TYPE_STRING,
};

struct SettingDefault {
    const char* key;
    SettingType type;
    bool bool_value;
    int int_value;
    const char* string_value;
};

// Hardcoded defaults, one entry per known key
const SettingDefault* settingDefaults(int& count);

class SettingsStore {
public:
    SettingsStore(FileStore& files, const char* path);

    // Defaults merged with the file; missing or corrupt file keeps defaults.
    // Returns false only when an existing file could not be parsed.
    bool load();

    // Typed reads; a missing key or a value of another type yields def
    bool getBool(const char* key, bool def) const;
    int getInt(const char* key, int def) const;
    std::string getString(const char* key, const char* def) const;
    bool contains(const char* key) const;

    // Writes persist immediately
    bool set(const char* key, bool value);
    bool set(const char* key, int value);
    bool set(const char* key, const char* value);
    bool set(const char* key, const std::string& value);

    // Step a bool or finite-choice setting to its next value and persist.
    // A current value outside the choice list moves to the first choice.
    // Returns false for keys without a choice list.
    bool cycle(const char* key);

    // Rebuild the map from the default table and persist (unknown keys dropped)
    bool resetToDefaults();

    // Convenience accessors with the hardcoded defaults
    bool darkMode() const;
    int clockFormat() const;
    std::string dateFormat() const;
    bool partialRefresh() const;
    int autoSleepMinutes() const;
    bool showSeconds() const;
    std::string zipCode() const;

    // Result of the most recent write
    bool lastSaveOk() const { return last_save_ok_; }

private:
    void applyDefaults();
    bool save();

    FileStore& files_;
    std::string path_;
    JsonDocument doc_;
    bool last_save_ok_;
};

#endif // SETTINGS_STORE_H
