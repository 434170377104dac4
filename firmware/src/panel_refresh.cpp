/**
 * InkDeck - Panel Refresh
 * Implementation
 */

#include "panel_refresh.h"
#include "config.h"
#include <stdio.h>

std::string encodePgm(const uint8_t* pixels, int16_t width, int16_t height) {
    char header[24];
    int header_len = snprintf(header, sizeof(header), "P5\n%d %d\n255\n", width, height);
    const size_t body_len = static_cast<size_t>(width) * height;

    std::string data;
    data.reserve(header_len + body_len);
    data.append(header, header_len);
    data.append(reinterpret_cast<const char*>(pixels), body_len);
    return data;
}

bool savePgm(FileStore& files, const char* path, const uint8_t* pixels, int16_t width, int16_t height) {
    return files.writeFile(path, encodePgm(pixels, width, height));
}

RefreshPolicy::RefreshPolicy(uint32_t partial_limit)
    : partial_limit_(partial_limit), partial_count_(0), sleeping_(false) {}

bool RefreshPolicy::next(bool partial_requested) {
    // Waking from powerDown() always gets a full refresh
    const bool waking = sleeping_;
    bool use_partial = partial_requested && !waking && partial_count_ < partial_limit_;
    sleeping_ = false;

    if (use_partial) {
        partial_count_++;
        DEBUG_PRINTF(g_debug_display, "Display: Partial refresh (%u/%u)\n",
                     static_cast<unsigned>(partial_count_), static_cast<unsigned>(partial_limit_));
        return true;
    }

    if (partial_requested && !waking) {
        DEBUG_PRINTLN(g_debug_display, "Display: Partial limit reached, forcing full refresh");
    }
    partial_count_ = 0;
    DEBUG_PRINTLN(g_debug_display, "Display: Full refresh");
    return false;
}

void RefreshPolicy::reset() {
    partial_count_ = 0;
    sleeping_ = false;
}
