/**
 * InkDeck - Notes Store
 * Implementation
 */

#include <ArduinoJson.h>
#include "notes_store.h"
#include "config.h"

NotesStore::NotesStore(FileStore& files, TimeSource& clock, const char* path)
    : files_(files), clock_(clock), path_(path), last_save_ok_(true) {}

bool NotesStore::load() {
    notes_.clear();

    std::string text;
    if (!files_.readFile(path_, text)) {
        DEBUG_PRINTLN(g_debug_storage, "Notes: No notes file, starting empty");
        return true;
    }

    JsonDocument doc;
    DeserializationError error = deserializeJson(doc, text);
    if (error) {
        LOG_PRINTF("Notes: WARNING - %s is corrupt (%s), starting empty\n",
                   path_.c_str(), error.c_str());
        return false;
    }

    JsonArrayConst array = doc.as<JsonArrayConst>();
    if (array.isNull()) {
        LOG_PRINTF("Notes: WARNING - %s is not an array, starting empty\n", path_.c_str());
        return false;
    }

    for (JsonObjectConst entry : array) {
        if (entry.isNull()) {
            continue;
        }
        Note note;
        note.id = entry["id"] | 0;
        note.title = entry["title"] | "";
        note.content = entry["content"] | "";
        note.created = entry["created"] | "";
        notes_.push_back(note);
    }

    DEBUG_PRINTF(g_debug_storage, "Notes: Loaded %u notes\n", static_cast<unsigned>(notes_.size()));
    return true;
}

Note NotesStore::create(const std::string& title, const std::string& content) {
    Note note;
    note.id = nextId();
    note.title = title;
    note.content = content;

    struct tm now;
    if (clock_.localTime(now)) {
        char stamp[24];
        formatTimestamp(now, stamp, sizeof(stamp));
        note.created = stamp;
    } else {
        LOG_PRINTLN("Notes: WARNING - clock not set, note has no timestamp");
    }

    notes_.push_back(note);
    save();

    DEBUG_PRINTF(g_debug_storage, "Notes: Created note %d \"%s\"\n", note.id, note.title.c_str());
    return note;
}

bool NotesStore::get(int id, Note& out) const {
    for (size_t i = 0; i < notes_.size(); ++i) {
        if (notes_[i].id == id) {
            out = notes_[i];
            return true;
        }
    }
    return false;
}

bool NotesStore::update(int id, const std::string& title, const std::string& content) {
    for (size_t i = 0; i < notes_.size(); ++i) {
        if (notes_[i].id == id) {
            notes_[i].title = title;
            notes_[i].content = content;
            save();
            DEBUG_PRINTF(g_debug_storage, "Notes: Updated note %d\n", id);
            return true;
        }
    }
    return false;
}

void NotesStore::remove(int id) {
    std::vector<Note> kept;
    kept.reserve(notes_.size());
    for (size_t i = 0; i < notes_.size(); ++i) {
        if (notes_[i].id != id) {
            kept.push_back(notes_[i]);
        }
    }
    notes_.swap(kept);
    save();
    DEBUG_PRINTF(g_debug_storage, "Notes: Deleted note %d\n", id);
}

void NotesStore::clear() {
    notes_.clear();
    save();
    DEBUG_PRINTLN(g_debug_storage, "Notes: Cleared all notes");
}

int NotesStore::nextId() const {
    int max_id = 0;
    for (size_t i = 0; i < notes_.size(); ++i) {
        if (notes_[i].id > max_id) {
            max_id = notes_[i].id;
        }
    }
    return max_id + 1;
}

bool NotesStore::save() {
    JsonDocument doc;
    JsonArray array = doc.to<JsonArray>();
    for (size_t i = 0; i < notes_.size(); ++i) {
        const Note& note = notes_[i];
        JsonObject entry = array.add<JsonObject>();
        entry["id"] = note.id;
        entry["title"] = note.title;
        entry["content"] = note.content;
        entry["created"] = note.created;
    }

    std::string text;
    serializeJsonPretty(doc, text);

    last_save_ok_ = files_.writeFile(path_, text);
    if (!last_save_ok_) {
        LOG_PRINTF("Notes: ERROR - failed to write %s\n", path_.c_str());
    }
    return last_save_ok_;
}
