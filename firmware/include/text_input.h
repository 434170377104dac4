/**
 * InkDeck - Text Prompt
 * Single-line text entry fed one key at a time
 *
 * The prompt never blocks: the UI loop keeps polling keys (and the Ctrl-C
 * flag) and hands each one to feed(). ESC aborts with no value, which is
 * not the same as submitting an empty string.
 */

#ifndef TEXT_INPUT_H
#define TEXT_INPUT_H

#include <string>
#include "canvas.h"
#include "keys.h"

enum PromptResult {
    PROMPT_EDITING,      // Still collecting characters
    PROMPT_SUBMITTED,    // ENTER: value() holds the text (may be empty)
    PROMPT_ABORTED,      // ESC: no value
};

class TextPrompt {
public:
    TextPrompt();

    // Start a prompt; initial text is pre-filled (edits), cut to max_len
    void begin(const char* label, int max_len, const char* initial = "");

    PromptResult feed(const KeyEvent& key);

    bool active() const { return active_; }
    const std::string& value() const { return buffer_; }
    int maxLength() const { return max_len_; }

    // Label, boxed input line with cursor, length counter and key hints.
    // masked draws '*' for every character (passwords).
    void render(Canvas& canvas, const Palette& palette, const char* title, bool masked = false) const;

private:
    const char* label_;
    int max_len_;
    std::string buffer_;
    bool active_;
};

#endif // TEXT_INPUT_H
