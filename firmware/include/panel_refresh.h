/**
 * InkDeck - Panel Refresh
 * Refresh-mode bookkeeping and the preview file written without a panel
 */

#ifndef PANEL_REFRESH_H
#define PANEL_REFRESH_H

#include <stdint.h>
#include <string>
#include "file_store.h"

// Binary PGM (P5, maxval 255) of an 8-bit frame, row-major
std::string encodePgm(const uint8_t* pixels, int16_t width, int16_t height);

// Write encodePgm() output to path; false when the store rejects it
bool savePgm(FileStore& files, const char* path, const uint8_t* pixels, int16_t width, int16_t height);

// Decides partial vs full refresh for each frame pushed to the panel.
// A partial request turns into a full refresh after partial_limit
// consecutive partials, and on the first frame after sleep.
class RefreshPolicy {
public:
    explicit RefreshPolicy(uint32_t partial_limit);

    // Record one frame; true when it should use a partial refresh
    bool next(bool partial_requested);

    // The panel was powered down
    void sleep() { sleeping_ = true; }

    // The panel was fully refreshed outside next() (clear, begin)
    void reset();

    uint32_t partialCount() const { return partial_count_; }
    bool sleeping() const { return sleeping_; }

private:
    uint32_t partial_limit_;
    uint32_t partial_count_;     // Partial refreshes since the last full one
    bool sleeping_;
};

#endif // PANEL_REFRESH_H
