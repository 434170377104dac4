/**
 * InkDeck - Settings Store
 * Implementation
 */

#include "settings_store.h"
#include "config.h"
#include <string.h>

static const SettingDefault SETTING_DEFAULTS[] = {
    // key                   type                 bool   int  string
    { SETTING_DARK_MODE,     SETTING_TYPE_BOOL,   false, 0,   nullptr   },
    { SETTING_CLOCK_FORMAT,  SETTING_TYPE_INT,    false, 12,  nullptr   },
    { SETTING_DATE_FORMAT,   SETTING_TYPE_STRING, false, 0,   "long"    },
    { SETTING_REFRESH_MODE,  SETTING_TYPE_STRING, false, 0,   "partial" },
    { SETTING_AUTO_SLEEP,    SETTING_TYPE_INT,    false, 0,   nullptr   },
    { SETTING_SHOW_SECONDS,  SETTING_TYPE_BOOL,   false, 0,   nullptr   },
    { SETTING_ZIP_CODE,      SETTING_TYPE_STRING, false, 0,   ""        },
};

static const int SETTING_DEFAULT_COUNT = sizeof(SETTING_DEFAULTS) / sizeof(SETTING_DEFAULTS[0]);

// Cycle orders for finite-choice settings
static const int CLOCK_FORMAT_CHOICES[] = { 12, 24 };
static const int AUTO_SLEEP_CHOICES[] = { 0, 5, 10, 15, 30 };
static const char* const DATE_FORMAT_CHOICES[] = { "long", "short", "iso" };
static const char* const REFRESH_MODE_CHOICES[] = { "partial", "full" };

#define CHOICE_COUNT(a) (static_cast<int>(sizeof(a) / sizeof((a)[0])))

const SettingDefault* settingDefaults(int& count) {
    count = SETTING_DEFAULT_COUNT;
    return SETTING_DEFAULTS;
}

static const SettingDefault* findDefault(const char* key) {
    for (int i = 0; i < SETTING_DEFAULT_COUNT; ++i) {
        if (strcmp(SETTING_DEFAULTS[i].key, key) == 0) {
            return &SETTING_DEFAULTS[i];
        }
    }
    return nullptr;
}

SettingsStore::SettingsStore(FileStore& files, const char* path)
    : files_(files), path_(path), last_save_ok_(true) {
    applyDefaults();
}

void SettingsStore::applyDefaults() {
    doc_.clear();
    JsonObject root = doc_.to<JsonObject>();
    for (int i = 0; i < SETTING_DEFAULT_COUNT; ++i) {
        const SettingDefault& def = SETTING_DEFAULTS[i];
        switch (def.type) {
            case SETTING_TYPE_BOOL:
                root[def.key] = def.bool_value;
                break;
            case SETTING_TYPE_INT:
                root[def.key] = def.int_value;
                break;
            case SETTING_TYPE_STRING:
                root[def.key] = def.string_value;
                break;
        }
    }
}

bool SettingsStore::load() {
    applyDefaults();

    std::string text;
    if (!files_.readFile(path_, text)) {
        DEBUG_PRINTLN(g_debug_storage, "Settings: No settings file, using defaults");
        return true;
    }

    JsonDocument file_doc;
    DeserializationError error = deserializeJson(file_doc, text);
    if (error) {
        LOG_PRINTF("Settings: WARNING - %s is corrupt (%s), using defaults\n",
                   path_.c_str(), error.c_str());
        return false;
    }

    JsonObjectConst stored = file_doc.as<JsonObjectConst>();
    if (stored.isNull()) {
        LOG_PRINTF("Settings: WARNING - %s is not an object, using defaults\n", path_.c_str());
        return false;
    }

    JsonObject root = doc_.as<JsonObject>();
    for (JsonPairConst kv : stored) {
        root[kv.key()] = kv.value();
    }

    DEBUG_PRINTF(g_debug_storage, "Settings: Loaded %u keys\n", static_cast<unsigned>(root.size()));
    return true;
}

bool SettingsStore::getBool(const char* key, bool def) const {
    JsonVariantConst value = doc_[key];
    return value.is<bool>() ? value.as<bool>() : def;
}

int SettingsStore::getInt(const char* key, int def) const {
    JsonVariantConst value = doc_[key];
    return value.is<int>() ? value.as<int>() : def;
}

std::string SettingsStore::getString(const char* key, const char* def) const {
    JsonVariantConst value = doc_[key];
    return value.is<const char*>() ? std::string(value.as<const char*>()) : std::string(def);
}

bool SettingsStore::contains(const char* key) const {
    return !doc_[key].isNull();
}

bool SettingsStore::set(const char* key, bool value) {
    doc_[key] = value;
    DEBUG_PRINTF(g_debug_storage, "Settings: %s = %s\n", key, value ? "true" : "false");
    return save();
}

bool SettingsStore::set(const char* key, int value) {
    doc_[key] = value;
    DEBUG_PRINTF(g_debug_storage, "Settings: %s = %d\n", key, value);
    return save();
}

bool SettingsStore::set(const char* key, const char* value) {
    doc_[key] = value;
    DEBUG_PRINTF(g_debug_storage, "Settings: %s = \"%s\"\n", key, value);
    return save();
}

bool SettingsStore::set(const char* key, const std::string& value) {
    return set(key, value.c_str());
}

bool SettingsStore::cycle(const char* key) {
    const SettingDefault* def = findDefault(key);
    if (def == nullptr) {
        return false;
    }

    if (def->type == SETTING_TYPE_BOOL) {
        return set(key, !getBool(key, def->bool_value));
    }

    const int* int_choices = nullptr;
    const char* const* string_choices = nullptr;
    int count = 0;

    if (strcmp(key, SETTING_CLOCK_FORMAT) == 0) {
        int_choices = CLOCK_FORMAT_CHOICES;
        count = CHOICE_COUNT(CLOCK_FORMAT_CHOICES);
    } else if (strcmp(key, SETTING_AUTO_SLEEP) == 0) {
        int_choices = AUTO_SLEEP_CHOICES;
        count = CHOICE_COUNT(AUTO_SLEEP_CHOICES);
    } else if (strcmp(key, SETTING_DATE_FORMAT) == 0) {
        string_choices = DATE_FORMAT_CHOICES;
        count = CHOICE_COUNT(DATE_FORMAT_CHOICES);
    } else if (strcmp(key, SETTING_REFRESH_MODE) == 0) {
        string_choices = REFRESH_MODE_CHOICES;
        count = CHOICE_COUNT(REFRESH_MODE_CHOICES);
    } else {
        return false;  // Free text (zip_code)
    }

    int next = 0;
    if (int_choices != nullptr) {
        int current = getInt(key, def->int_value);
        for (int i = 0; i < count; ++i) {
            if (int_choices[i] == current) {
                next = (i + 1) % count;
                break;
            }
        }
        return set(key, int_choices[next]);
    }

    std::string current = getString(key, def->string_value);
    for (int i = 0; i < count; ++i) {
        if (current == string_choices[i]) {
            next = (i + 1) % count;
            break;
        }
    }
    return set(key, string_choices[next]);
}

bool SettingsStore::resetToDefaults() {
    applyDefaults();
    LOG_PRINTLN("Settings: Reset to defaults");
    return save();
}

bool SettingsStore::darkMode() const {
    return getBool(SETTING_DARK_MODE, false);
}

int SettingsStore::clockFormat() const {
    return getInt(SETTING_CLOCK_FORMAT, 12);
}

std::string SettingsStore::dateFormat() const {
    return getString(SETTING_DATE_FORMAT, "long");
}

bool SettingsStore::partialRefresh() const {
    return getString(SETTING_REFRESH_MODE, "partial") != "full";
}

int SettingsStore::autoSleepMinutes() const {
    return getInt(SETTING_AUTO_SLEEP, 0);
}

bool SettingsStore::showSeconds() const {
    return getBool(SETTING_SHOW_SECONDS, false);
}

std::string SettingsStore::zipCode() const {
    return getString(SETTING_ZIP_CODE, "");
}

bool SettingsStore::save() {
    std::string text;
    serializeJsonPretty(doc_, text);

    last_save_ok_ = files_.writeFile(path_, text);
    if (!last_save_ok_) {
        LOG_PRINTF("Settings: ERROR - failed to write %s\n", path_.c_str());
    }
    return last_save_ok_;
}
