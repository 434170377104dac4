/**
 * InkDeck - Glyphs
 * Procedural graphics: 7-segment clock digits, menu icons, weather icons
 */

#ifndef GLYPHS_H
#define GLYPHS_H

#include <stdint.h>
#include "canvas.h"

// 7-segment geometry: segment thickness and length, digit and colon advance
#define SEG_THICKNESS       4
#define SEG_LENGTH          20
#define SEG_DIGIT_ADVANCE   30
#define SEG_COLON_ADVANCE   10
#define SEG_DIGIT_HEIGHT    (3 * SEG_THICKNESS + 2 * SEG_LENGTH)

// One digit ('0'-'9'); space and unknown characters draw nothing
void drawSegmentDigit(Canvas& canvas, char digit, int16_t x, int16_t y, uint8_t color);

// Digits and colons of a clock string; returns the width drawn
int16_t drawSegmentTime(Canvas& canvas, const char* text, int16_t x, int16_t y, uint8_t color);

// Width drawSegmentTime() would use
int16_t segmentTimeWidth(const char* text);

// Menu icons, drawn centered on (cx, cy) inside roughly a 24x24 box
enum MenuIcon {
    MENU_ICON_NONE,
    MENU_ICON_CLOCK,
    MENU_ICON_NOTES,
    MENU_ICON_WEATHER,
    MENU_ICON_SETTINGS,
};

void drawMenuIcon(Canvas& canvas, MenuIcon icon, int16_t cx, int16_t cy, uint8_t fg, uint8_t bg);

// Weather icon families
enum WeatherGlyph {
    WEATHER_GLYPH_SUNNY,
    WEATHER_GLYPH_PARTLY_CLOUDY,
    WEATHER_GLYPH_CLOUDY,
    WEATHER_GLYPH_FOG,
    WEATHER_GLYPH_RAIN,
    WEATHER_GLYPH_SNOW,
    WEATHER_GLYPH_THUNDER,
};

// Map a provider weather code (World Weather Online numbering) to an icon
WeatherGlyph weatherGlyphFor(int code);

// Weather icon centered on (cx, cy); scale 1 is about 24px wide
void drawWeatherGlyph(Canvas& canvas, WeatherGlyph glyph, int16_t cx, int16_t cy,
                      uint8_t scale, uint8_t fg, uint8_t bg);

#endif // GLYPHS_H
