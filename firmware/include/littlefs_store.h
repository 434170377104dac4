// littlefs_store.h
// FileStore on the LittleFS flash partition

#ifndef LITTLEFS_STORE_H
#define LITTLEFS_STORE_H

#include "file_store.h"

class LittleFsStore : public FileStore {
public:
    LittleFsStore();

    // Mount LittleFS, formatting on first boot
    bool begin();

    bool readFile(const std::string& path, std::string& out);
    bool writeFile(const std::string& path, const std::string& data);
    bool ensureDir(const std::string& path);

private:
    bool mounted_;
};

#endif // LITTLEFS_STORE_H
