// littlefs_store.cpp - LittleFS access for notes, settings and the preview frame
// Part of the InkDeck firmware

#include <LittleFS.h>
#include "littlefs_store.h"
#include "config.h"

LittleFsStore::LittleFsStore() : mounted_(false) {}

bool LittleFsStore::begin() {
    if (mounted_) {
        return true;  // Already mounted
    }

    // Mount LittleFS, format if needed (first boot after partition change)
    if (!LittleFS.begin(true)) {
        LOG_PRINTLN("ERROR: LittleFS mount failed");
        return false;
    }

    mounted_ = true;

    size_t total = LittleFS.totalBytes();
    size_t used = LittleFS.usedBytes();
    LOG_PRINTF("LittleFS: %u bytes used / %u bytes total\n",
               static_cast<unsigned>(used), static_cast<unsigned>(total));
    return true;
}

bool LittleFsStore::readFile(const std::string& path, std::string& out) {
    if (!mounted_) {
        LOG_PRINTLN("ERROR: LittleFS not mounted");
        return false;
    }
    if (!LittleFS.exists(path.c_str())) {
        DEBUG_PRINTF(g_debug_storage, "Storage: %s not found\n", path.c_str());
        return false;
    }

    File file = LittleFS.open(path.c_str(), "r");
    if (!file) {
        LOG_PRINTF("ERROR: Failed to open %s for reading\n", path.c_str());
        return false;
    }

    out.clear();
    out.reserve(file.size());
    uint8_t chunk[128];
    while (file.available()) {
        size_t n = file.read(chunk, sizeof(chunk));
        if (n == 0) {
            break;
        }
        out.append(reinterpret_cast<const char*>(chunk), n);
    }
    file.close();
    return true;
}

bool LittleFsStore::writeFile(const std::string& path, const std::string& data) {
    if (!mounted_) {
        LOG_PRINTLN("ERROR: LittleFS not mounted");
        return false;
    }

    File file = LittleFS.open(path.c_str(), "w");
    if (!file) {
        LOG_PRINTF("ERROR: Failed to open %s for writing\n", path.c_str());
        return false;
    }

    size_t written = file.write(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    file.close();

    if (written != data.size()) {
        LOG_PRINTF("ERROR: Short write to %s (%u of %u bytes)\n", path.c_str(),
                   static_cast<unsigned>(written), static_cast<unsigned>(data.size()));
        return false;
    }
    return true;
}

bool LittleFsStore::ensureDir(const std::string& path) {
    if (!mounted_) {
        return false;
    }
    if (LittleFS.exists(path.c_str())) {
        return true;
    }
    if (!LittleFS.mkdir(path.c_str())) {
        LOG_PRINTF("ERROR: Failed to create %s\n", path.c_str());
        return false;
    }
    return true;
}
