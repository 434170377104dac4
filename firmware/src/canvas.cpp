/**
 * InkDeck - Drawing Canvas
 * Palette and text layout helpers
 */

#include "canvas.h"
#include "config.h"
#include <string.h>

Palette paletteFor(bool dark_mode) {
    Palette palette;
    if (dark_mode) {
        palette.foreground = COLOR_WHITE;
        palette.background = COLOR_BLACK;
    } else {
        palette.foreground = COLOR_BLACK;
        palette.background = COLOR_WHITE;
    }
    return palette;
}

int16_t textWidth(const char* text, uint8_t size) {
    return static_cast<int16_t>(strlen(text) * FONT_CHAR_WIDTH * size);
}

void printCentered(Canvas& canvas, const char* text, int16_t y, uint8_t size, uint8_t color) {
    int16_t x = (canvas.width() - textWidth(text, size)) / 2;
    if (x < 0) x = 5;  // Left margin if text too long
    canvas.drawText(x, y, text, size, color);
}

void printFooter(Canvas& canvas, const char* text, uint8_t color) {
    canvas.drawText(5, canvas.height() - FONT_CHAR_HEIGHT - 4, text, 1, color);
}

void truncateText(const char* text, int max_chars, char* buffer, int size) {
    if (size <= 0) return;

    int len = static_cast<int>(strlen(text));
    int keep = len;
    bool ellipsis = false;
    if (len > max_chars) {
        keep = max_chars > 3 ? max_chars - 3 : 0;
        ellipsis = true;
    }
    int room = ellipsis ? size - 4 : size - 1;
    if (room < 0) room = 0;
    if (keep > room) keep = room;

    memcpy(buffer, text, keep);
    if (ellipsis && keep + 3 < size) {
        memcpy(buffer + keep, "...", 3);
        keep += 3;
    }
    buffer[keep] = '\0';
}

void wrapText(const std::string& text, int chars_per_line, std::vector<std::string>& lines) {
    lines.clear();
    if (chars_per_line <= 0) return;

    std::string line;
    size_t i = 0;
    while (i <= text.size()) {
        if (i == text.size() || text[i] == '\n') {
            lines.push_back(line);
            line.clear();
            ++i;
            if (i > text.size()) break;
            continue;
        }

        // Next word and the spaces that follow it
        size_t end = i;
        while (end < text.size() && text[end] != ' ' && text[end] != '\n') ++end;
        std::string word = text.substr(i, end - i);
        i = end;

        while (static_cast<int>(word.size()) > chars_per_line) {
            if (!line.empty()) {
                lines.push_back(line);
                line.clear();
            }
            lines.push_back(word.substr(0, chars_per_line));
            word.erase(0, chars_per_line);
        }

        int needed = static_cast<int>(line.size() + (line.empty() ? 0 : 1) + word.size());
        if (!line.empty() && needed > chars_per_line) {
            lines.push_back(line);
            line.clear();
        }
        if (!word.empty()) {
            if (!line.empty()) line += ' ';
            line += word;
        }

        while (i < text.size() && text[i] == ' ') ++i;
    }

    // Drop trailing blank lines from a final newline
    while (lines.size() > 1 && lines.back().empty()) {
        lines.pop_back();
    }
}
