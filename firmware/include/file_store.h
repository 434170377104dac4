// file_store.h
// Whole-file read/write access used by the notes and settings stores

#ifndef FILE_STORE_H
#define FILE_STORE_H

#include <string>

class FileStore {
public:
    virtual ~FileStore() {}

    // Read the whole file; false if missing or unreadable
    virtual bool readFile(const std::string& path, std::string& out) = 0;

    // Replace the whole file; false on any write error
    virtual bool writeFile(const std::string& path, const std::string& data) = 0;

    // Create a directory if it does not exist yet
    virtual bool ensureDir(const std::string& path) = 0;
};

#endif // FILE_STORE_H
