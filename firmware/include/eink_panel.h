/**
 * InkDeck - E-Ink Panel
 * RenderSurface on the ThinkInk 2.13" mono FeatherWing
 *
 * Screens draw into an 8-bit GFXcanvas8 frame. show() thresholds it onto the
 * panel buffer and refreshes. Without a panel the frame is written to
 * EPD_PREVIEW_PATH as a binary PGM instead.
 */

#ifndef EINK_PANEL_H
#define EINK_PANEL_H

#include <Adafruit_GFX.h>
#include "Adafruit_ThinkInk.h"
#include "file_store.h"
#include "panel_refresh.h"
#include "render_surface.h"

// Canvas over any Adafruit_GFX target (built-in 5x7 font)
class GfxCanvas : public Canvas {
public:
    explicit GfxCanvas(Adafruit_GFX& gfx) : gfx_(gfx) {}

    int16_t width() const { return gfx_.width(); }
    int16_t height() const { return gfx_.height(); }

    void fillScreen(uint8_t color) { gfx_.fillScreen(color); }
    void drawPixel(int16_t x, int16_t y, uint8_t color) { gfx_.drawPixel(x, y, color); }
    void drawLine(int16_t x0, int16_t y0, int16_t x1, int16_t y1, uint8_t color) {
        gfx_.drawLine(x0, y0, x1, y1, color);
    }
    void drawRect(int16_t x, int16_t y, int16_t w, int16_t h, uint8_t color) { gfx_.drawRect(x, y, w, h, color); }
    void fillRect(int16_t x, int16_t y, int16_t w, int16_t h, uint8_t color) { gfx_.fillRect(x, y, w, h, color); }
    void drawCircle(int16_t x, int16_t y, int16_t r, uint8_t color) { gfx_.drawCircle(x, y, r, color); }
    void fillCircle(int16_t x, int16_t y, int16_t r, uint8_t color) { gfx_.fillCircle(x, y, r, color); }
    void drawText(int16_t x, int16_t y, const char* text, uint8_t size, uint8_t color);

private:
    Adafruit_GFX& gfx_;
};

class EinkPanel : public RenderSurface {
public:
    EinkPanel(ThinkInk_213_Mono_GDEY0213B74& display, FileStore& files);

    // Initialise the panel (or demo mode when use_panel is false)
    bool begin(bool use_panel);

    Canvas& canvas() { return canvas_; }
    void show(bool partial);
    void clear();
    void sleep();
    bool hasPanel() const { return panel_; }

private:
    void pushToPanel(bool partial);
    void writePreview();

    ThinkInk_213_Mono_GDEY0213B74& display_;
    FileStore& files_;
    GFXcanvas8 frame_;
    GfxCanvas canvas_;
    bool panel_;
    RefreshPolicy refresh_;
};

#endif // EINK_PANEL_H
