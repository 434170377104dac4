/**
 * InkDeck - Text Prompt
 * Implementation
 */

#include "text_input.h"
#include "config.h"
#include <stdio.h>

// Characters that fit in the input box at text size 1
#define PROMPT_VISIBLE_CHARS    38

TextPrompt::TextPrompt()
    : label_(""), max_len_(0), active_(false) {}

void TextPrompt::begin(const char* label, int max_len, const char* initial) {
    label_ = label;
    max_len_ = max_len;
    buffer_ = initial;
    if (static_cast<int>(buffer_.size()) > max_len_) {
        buffer_.resize(max_len_);
    }
    active_ = true;
}

PromptResult TextPrompt::feed(const KeyEvent& key) {
    if (!active_) {
        return PROMPT_ABORTED;
    }

    switch (key.code) {
        case KEYCODE_ENTER:
            active_ = false;
            DEBUG_PRINTF(g_debug_ui, "Prompt: \"%s\" submitted (%u chars)\n",
                         label_, static_cast<unsigned>(buffer_.size()));
            return PROMPT_SUBMITTED;

        case KEYCODE_ESC:
            active_ = false;
            DEBUG_PRINTF(g_debug_ui, "Prompt: \"%s\" aborted\n", label_);
            return PROMPT_ABORTED;

        case KEYCODE_BACKSPACE:
            if (!buffer_.empty()) {
                buffer_.erase(buffer_.size() - 1);
            }
            return PROMPT_EDITING;

        case KEYCODE_CHAR:
            if (static_cast<int>(buffer_.size()) < max_len_) {
                buffer_ += key.ch;
            }
            return PROMPT_EDITING;

        default:
            // Arrows have no meaning in a single-line prompt
            return PROMPT_EDITING;
    }
}

void TextPrompt::render(Canvas& canvas, const Palette& palette, const char* title, bool masked) const {
    canvas.fillScreen(palette.background);

    if (title != nullptr && title[0] != '\0') {
        printCentered(canvas, title, 5, 2, palette.foreground);
    }

    canvas.drawText(5, 32, label_, 1, palette.foreground);

    // Input box; long values scroll so the tail stays visible
    canvas.drawRect(3, 44, canvas.width() - 6, 16, palette.foreground);
    std::string shown = masked ? std::string(buffer_.size(), '*') : buffer_;
    if (static_cast<int>(shown.size()) > PROMPT_VISIBLE_CHARS - 1) {
        shown = shown.substr(shown.size() - (PROMPT_VISIBLE_CHARS - 1));
    }
    shown += '_';
    canvas.drawText(7, 48, shown.c_str(), 1, palette.foreground);

    char counter[16];
    snprintf(counter, sizeof(counter), "%u/%d", static_cast<unsigned>(buffer_.size()), max_len_);
    canvas.drawText(canvas.width() - textWidth(counter, 1) - 5, 66, counter, 1, palette.foreground);

    printFooter(canvas, "ENTER=OK  ESC=Cancel  BKSP=Delete", palette.foreground);
}
