/**
 * InkDeck - Notes Store
 * Ordered note list persisted as a JSON array, rewritten on every mutation
 */

#ifndef NOTES_STORE_H
#define NOTES_STORE_H

#include <string>
#include <vector>
#include "file_store.h"
#include "time_source.h"

struct Note {
    int id;                 // 1-based, max(existing) + 1
    std::string title;
    std::string content;
    std::string created;    // "YYYY-MM-DD HH:MM:SS"
};

class NotesStore {
public:
    NotesStore(FileStore& files, TimeSource& clock, const char* path);

    // Load from disk; a missing or corrupt file leaves an empty list.
    // Returns false only when an existing file could not be parsed.
    bool load();

    // Append a note with the next id and persist it
    Note create(const std::string& title, const std::string& content);

    // Notes in creation order
    const std::vector<Note>& list() const { return notes_; }
    size_t count() const { return notes_.size(); }

    // Copy of the note with this id; false if not found
    bool get(int id, Note& out) const;

    // Replace title and content; false if no note has this id
    bool update(int id, const std::string& title, const std::string& content);

    // Drop every note with this id and persist
    void remove(int id);

    // Drop all notes (factory reset)
    void clear();

    // Result of the most recent write
    bool lastSaveOk() const { return last_save_ok_; }

private:
    int nextId() const;
    bool save();

    FileStore& files_;
    TimeSource& clock_;
    std::string path_;
    std::vector<Note> notes_;
    bool last_save_ok_;
};

#endif // NOTES_STORE_H
