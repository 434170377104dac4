/**
 * InkDeck - E-Ink Panel
 * Implementation
 */

#include "eink_panel.h"
#include "config.h"

void GfxCanvas::drawText(int16_t x, int16_t y, const char* text, uint8_t size, uint8_t color) {
    gfx_.setTextSize(size);
    gfx_.setTextColor(color);
    gfx_.setTextWrap(false);
    gfx_.setCursor(x, y);
    gfx_.print(text);
}

EinkPanel::EinkPanel(ThinkInk_213_Mono_GDEY0213B74& display, FileStore& files)
    : display_(display),
      files_(files),
      frame_(EPD_WIDTH, EPD_HEIGHT),
      canvas_(frame_),
      panel_(false),
      refresh_(EPD_PARTIAL_REFRESH_LIMIT) {}

bool EinkPanel::begin(bool use_panel) {
    if (frame_.getBuffer() == nullptr) {
        LOG_PRINTLN("Display: ERROR - frame buffer allocation failed");
        return false;
    }
    frame_.fillScreen(COLOR_WHITE);

    if (!use_panel) {
        LOG_PRINTF("Display: Demo mode, frames saved to %s\n", EPD_PREVIEW_PATH);
        panel_ = false;
        return true;
    }

    display_.begin(THINKINK_MONO);
    display_.setRotation(EPD_ROTATION);
    display_.clearBuffer();
    panel_ = true;
    refresh_.reset();

    LOG_PRINTF("E-Paper: OK (%dx%d)\n", display_.width(), display_.height());
    return true;
}

void EinkPanel::show(bool partial) {
    if (frame_.getBuffer() == nullptr) {
        LOG_PRINTLN("Display: No frame buffer, skipping update");
        return;
    }

    if (!panel_) {
        writePreview();
        return;
    }
    pushToPanel(partial);
}

void EinkPanel::pushToPanel(bool partial) {
    const uint8_t* pixels = frame_.getBuffer();

    // Threshold the 8-bit frame onto the 1-bit panel buffer
    display_.clearBuffer();
    for (int16_t y = 0; y < EPD_HEIGHT; ++y) {
        const uint8_t* row = pixels + static_cast<size_t>(y) * EPD_WIDTH;
        for (int16_t x = 0; x < EPD_WIDTH; ++x) {
            if (row[x] < 128) {
                display_.drawPixel(x, y, EPD_BLACK);
            }
        }
    }

    if (refresh_.next(partial)) {
        display_.displayPartial(0, 0, EPD_WIDTH - 1, EPD_HEIGHT - 1);
    } else {
        display_.display();
    }
}

void EinkPanel::writePreview() {
    if (savePgm(files_, EPD_PREVIEW_PATH, frame_.getBuffer(), EPD_WIDTH, EPD_HEIGHT)) {
        DEBUG_PRINTF(g_debug_display, "Display: Demo mode, frame saved to %s\n", EPD_PREVIEW_PATH);
    } else {
        LOG_PRINTF("Display: ERROR - could not write %s\n", EPD_PREVIEW_PATH);
    }
}

void EinkPanel::clear() {
    frame_.fillScreen(COLOR_WHITE);
    if (!panel_) {
        writePreview();
        return;
    }
    display_.clearBuffer();
    display_.display();
    refresh_.reset();
}

void EinkPanel::sleep() {
    if (!panel_ || refresh_.sleeping()) {
        return;
    }
    display_.powerDown();
    refresh_.sleep();
    DEBUG_PRINTLN(g_debug_display, "Display: Powered down");
}
