/**
 * InkDeck - Glyphs
 * Implementation
 */

#include "glyphs.h"

// ==================== 7-Segment Digits ====================

// Segment order: a (top), b (top right), c (bottom right), d (bottom),
// e (bottom left), f (top left), g (middle)
static const uint8_t SEGMENT_MASKS[10] = {
    0x3F,  // 0: a b c d e f
    0x06,  // 1: b c
    0x5B,  // 2: a b d e g
    0x4F,  // 3: a b c d g
    0x66,  // 4: b c f g
    0x6D,  // 5: a c d f g
    0x7D,  // 6: a c d e f g
    0x07,  // 7: a b c
    0x7F,  // 8: all
    0x6F,  // 9: a b c d f g
};

void drawSegmentDigit(Canvas& canvas, char digit, int16_t x, int16_t y, uint8_t color) {
    if (digit < '0' || digit > '9') {
        return;
    }

    const uint8_t mask = SEGMENT_MASKS[digit - '0'];
    const int16_t w = SEG_THICKNESS;
    const int16_t l = SEG_LENGTH;

    if (mask & 0x01) canvas.fillRect(x + w, y, l, w, color);                          // a
    if (mask & 0x02) canvas.fillRect(x + w + l, y + w, w, l, color);                  // b
    if (mask & 0x04) canvas.fillRect(x + w + l, y + 2 * w + l, w, l, color);          // c
    if (mask & 0x08) canvas.fillRect(x + w, y + 2 * w + 2 * l, l, w, color);          // d
    if (mask & 0x10) canvas.fillRect(x, y + 2 * w + l, w, l, color);                  // e
    if (mask & 0x20) canvas.fillRect(x, y + w, w, l, color);                          // f
    if (mask & 0x40) canvas.fillRect(x + w, y + w + l, l, w, color);                  // g
}

int16_t drawSegmentTime(Canvas& canvas, const char* text, int16_t x, int16_t y, uint8_t color) {
    int16_t cursor = x;
    for (const char* p = text; *p != '\0'; ++p) {
        if (*p == ':') {
            canvas.fillRect(cursor + 3, y + 15, 4, 4, color);
            canvas.fillRect(cursor + 3, y + 35, 4, 4, color);
            cursor += SEG_COLON_ADVANCE;
        } else {
            drawSegmentDigit(canvas, *p, cursor, y, color);
            cursor += SEG_DIGIT_ADVANCE;
        }
    }
    return cursor - x;
}

int16_t segmentTimeWidth(const char* text) {
    int16_t width = 0;
    for (const char* p = text; *p != '\0'; ++p) {
        width += (*p == ':') ? SEG_COLON_ADVANCE : SEG_DIGIT_ADVANCE;
    }
    // Last digit has no trailing gap
    if (width >= SEG_DIGIT_ADVANCE) {
        width -= SEG_DIGIT_ADVANCE - (2 * SEG_THICKNESS + SEG_LENGTH);
    }
    return width;
}

// ==================== Menu Icons ====================

static void drawClockIcon(Canvas& canvas, int16_t cx, int16_t cy, uint8_t fg) {
    canvas.drawCircle(cx, cy, 11, fg);
    canvas.drawCircle(cx, cy, 10, fg);
    canvas.drawLine(cx, cy, cx, cy - 7, fg);      // Minute hand
    canvas.drawLine(cx, cy, cx + 5, cy + 2, fg);  // Hour hand
    canvas.fillCircle(cx, cy, 1, fg);
}

static void drawNotesIcon(Canvas& canvas, int16_t cx, int16_t cy, uint8_t fg) {
    canvas.drawRect(cx - 8, cy - 11, 17, 22, fg);
    for (int i = 0; i < 4; ++i) {
        canvas.drawLine(cx - 5, cy - 6 + i * 5, cx + 5, cy - 6 + i * 5, fg);
    }
}

static void drawCloudShape(Canvas& canvas, int16_t cx, int16_t cy, int16_t s, uint8_t fg, uint8_t bg) {
    // Three puffs on a flat base, outlined then hollowed
    canvas.fillCircle(cx - 5 * s, cy + 1 * s, 5 * s, fg);
    canvas.fillCircle(cx + 1 * s, cy - 3 * s, 7 * s, fg);
    canvas.fillCircle(cx + 7 * s, cy + 1 * s, 5 * s, fg);
    canvas.fillRect(cx - 5 * s, cy + 1 * s, 12 * s, 5 * s + 1, fg);

    canvas.fillCircle(cx - 5 * s, cy + 1 * s, 5 * s - 2, bg);
    canvas.fillCircle(cx + 1 * s, cy - 3 * s, 7 * s - 2, bg);
    canvas.fillCircle(cx + 7 * s, cy + 1 * s, 5 * s - 2, bg);
    canvas.fillRect(cx - 5 * s, cy + 1 * s, 12 * s, 5 * s - 1, bg);
}

static void drawGearIcon(Canvas& canvas, int16_t cx, int16_t cy, uint8_t fg, uint8_t bg) {
    // Teeth on the axes and diagonals
    canvas.fillRect(cx - 2, cy - 12, 5, 24, fg);
    canvas.fillRect(cx - 12, cy - 2, 24, 5, fg);
    for (int d = -1; d <= 1; ++d) {
        canvas.drawLine(cx - 8 + d, cy - 8, cx + 8 + d, cy + 8, fg);
        canvas.drawLine(cx + 8 + d, cy - 8, cx - 8 + d, cy + 8, fg);
    }
    canvas.fillCircle(cx, cy, 8, fg);
    canvas.fillCircle(cx, cy, 3, bg);
}

void drawMenuIcon(Canvas& canvas, MenuIcon icon, int16_t cx, int16_t cy, uint8_t fg, uint8_t bg) {
    switch (icon) {
        case MENU_ICON_CLOCK:
            drawClockIcon(canvas, cx, cy, fg);
            break;
        case MENU_ICON_NOTES:
            drawNotesIcon(canvas, cx, cy, fg);
            break;
        case MENU_ICON_WEATHER:
            drawCloudShape(canvas, cx - 1, cy + 1, 1, fg, bg);
            break;
        case MENU_ICON_SETTINGS:
            drawGearIcon(canvas, cx, cy, fg, bg);
            break;
        case MENU_ICON_NONE:
        default:
            canvas.drawText(cx - 5, cy - 7, "?", 2, fg);
            break;
    }
}

// ==================== Weather Icons ====================

static bool codeIn(int code, const int* codes, int count) {
    for (int i = 0; i < count; ++i) {
        if (codes[i] == code) return true;
    }
    return false;
}

WeatherGlyph weatherGlyphFor(int code) {
    static const int FOG_CODES[] = { 143, 248, 260 };
    static const int THUNDER_CODES[] = { 200, 386, 389, 392, 395 };
    static const int SNOW_CODES[] = {
        179, 182, 185, 227, 230, 317, 320, 323, 326, 329, 332, 335, 338,
        350, 362, 365, 368, 371, 374, 377,
    };
    static const int RAIN_CODES[] = {
        176, 263, 266, 281, 284, 293, 296, 299, 302, 305, 308, 311, 314,
        353, 356, 359,
    };

    if (code == 113) return WEATHER_GLYPH_SUNNY;
    if (code == 116) return WEATHER_GLYPH_PARTLY_CLOUDY;
    if (code == 119 || code == 122) return WEATHER_GLYPH_CLOUDY;
    if (codeIn(code, FOG_CODES, sizeof(FOG_CODES) / sizeof(FOG_CODES[0]))) return WEATHER_GLYPH_FOG;
    if (codeIn(code, THUNDER_CODES, sizeof(THUNDER_CODES) / sizeof(THUNDER_CODES[0]))) return WEATHER_GLYPH_THUNDER;
    if (codeIn(code, SNOW_CODES, sizeof(SNOW_CODES) / sizeof(SNOW_CODES[0]))) return WEATHER_GLYPH_SNOW;
    if (codeIn(code, RAIN_CODES, sizeof(RAIN_CODES) / sizeof(RAIN_CODES[0]))) return WEATHER_GLYPH_RAIN;
    return WEATHER_GLYPH_CLOUDY;
}

static void drawSun(Canvas& canvas, int16_t cx, int16_t cy, int16_t s, uint8_t fg) {
    canvas.fillCircle(cx, cy, 5 * s, fg);
    // Eight rays
    static const int8_t RAYS[8][2] = {
        { 0, -1 }, { 1, -1 }, { 1, 0 }, { 1, 1 }, { 0, 1 }, { -1, 1 }, { -1, 0 }, { -1, -1 },
    };
    for (int i = 0; i < 8; ++i) {
        int16_t x0 = cx + RAYS[i][0] * 7 * s;
        int16_t y0 = cy + RAYS[i][1] * 7 * s;
        int16_t x1 = cx + RAYS[i][0] * 10 * s;
        int16_t y1 = cy + RAYS[i][1] * 10 * s;
        canvas.drawLine(x0, y0, x1, y1, fg);
    }
}

void drawWeatherGlyph(Canvas& canvas, WeatherGlyph glyph, int16_t cx, int16_t cy,
                      uint8_t scale, uint8_t fg, uint8_t bg) {
    const int16_t s = scale < 1 ? 1 : scale;

    switch (glyph) {
        case WEATHER_GLYPH_SUNNY:
            drawSun(canvas, cx, cy, s, fg);
            break;

        case WEATHER_GLYPH_PARTLY_CLOUDY:
            drawSun(canvas, cx - 4 * s, cy - 4 * s, s, fg);
            drawCloudShape(canvas, cx + 2 * s, cy + 3 * s, s, fg, bg);
            break;

        case WEATHER_GLYPH_CLOUDY:
            drawCloudShape(canvas, cx, cy, s, fg, bg);
            break;

        case WEATHER_GLYPH_FOG:
            for (int i = 0; i < 4; ++i) {
                int16_t y = cy - 6 * s + i * 4 * s;
                int16_t inset = (i % 2) ? 3 * s : 0;
                canvas.fillRect(cx - 10 * s + inset, y, 20 * s - inset, s + 1, fg);
            }
            break;

        case WEATHER_GLYPH_RAIN:
            drawCloudShape(canvas, cx, cy - 4 * s, s, fg, bg);
            for (int i = 0; i < 3; ++i) {
                int16_t x = cx - 5 * s + i * 5 * s;
                canvas.drawLine(x, cy + 5 * s, x - 2 * s, cy + 10 * s, fg);
            }
            break;

        case WEATHER_GLYPH_SNOW:
            drawCloudShape(canvas, cx, cy - 4 * s, s, fg, bg);
            for (int i = 0; i < 3; ++i) {
                int16_t x = cx - 5 * s + i * 5 * s;
                int16_t y = cy + 8 * s;
                canvas.drawLine(x - 2 * s, y, x + 2 * s, y, fg);
                canvas.drawLine(x, y - 2 * s, x, y + 2 * s, fg);
            }
            break;

        case WEATHER_GLYPH_THUNDER:
            drawCloudShape(canvas, cx, cy - 4 * s, s, fg, bg);
            // Bolt
            canvas.drawLine(cx + 1 * s, cy + 3 * s, cx - 2 * s, cy + 7 * s, fg);
            canvas.drawLine(cx - 2 * s, cy + 7 * s, cx + 2 * s, cy + 7 * s, fg);
            canvas.drawLine(cx + 2 * s, cy + 7 * s, cx - 1 * s, cy + 11 * s, fg);
            break;
    }
}
