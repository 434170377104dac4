/**
 * InkDeck - Drawing Canvas
 * Monochrome frame drawing interface and the palette derived from dark mode
 *
 * Pixel values are 8-bit: COLOR_BLACK (0) and COLOR_WHITE (255). Text uses the
 * built-in 5x7 font, FONT_CHAR_WIDTH * size pixels per character.
 */

#ifndef CANVAS_H
#define CANVAS_H

#include <stdint.h>
#include <string>
#include <vector>

struct Palette {
    uint8_t foreground;
    uint8_t background;
};

// dark_mode=false: black on white, dark_mode=true: white on black
Palette paletteFor(bool dark_mode);

class Canvas {
public:
    virtual ~Canvas() {}

    virtual int16_t width() const = 0;
    virtual int16_t height() const = 0;

    virtual void fillScreen(uint8_t color) = 0;
    virtual void drawPixel(int16_t x, int16_t y, uint8_t color) = 0;
    virtual void drawLine(int16_t x0, int16_t y0, int16_t x1, int16_t y1, uint8_t color) = 0;
    virtual void drawRect(int16_t x, int16_t y, int16_t w, int16_t h, uint8_t color) = 0;
    virtual void fillRect(int16_t x, int16_t y, int16_t w, int16_t h, uint8_t color) = 0;
    virtual void drawCircle(int16_t x, int16_t y, int16_t r, uint8_t color) = 0;
    virtual void fillCircle(int16_t x, int16_t y, int16_t r, uint8_t color) = 0;

    // Text at the top-left corner (x, y)
    virtual void drawText(int16_t x, int16_t y, const char* text, uint8_t size, uint8_t color) = 0;
};

// Text width in pixels for the built-in font
int16_t textWidth(const char* text, uint8_t size);

// Horizontally centered text (left margin when too wide)
void printCentered(Canvas& canvas, const char* text, int16_t y, uint8_t size, uint8_t color);

// Footer hint line along the bottom edge ("ENTER=View ESC=Back")
void printFooter(Canvas& canvas, const char* text, uint8_t color);

// Copy text into buffer, cutting it to max_chars with a "..." tail
void truncateText(const char* text, int max_chars, char* buffer, int size);

// Word-wrap into lines of at most chars_per_line; words longer than a line
// are split, explicit newlines start a new line
void wrapText(const std::string& text, int chars_per_line, std::vector<std::string>& lines);

#endif // CANVAS_H
