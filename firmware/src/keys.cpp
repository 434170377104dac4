/**
 * InkDeck - Key Events
 * Implementation
 */

#include "keys.h"
#include "config.h"
#include <stdio.h>

#define BYTE_CTRL_C     0x03
#define BYTE_BS         0x08
#define BYTE_LF         0x0A
#define BYTE_CR         0x0D
#define BYTE_ESC        0x1B
#define BYTE_DEL        0x7F

KeyEvent makeKey(KeyCode code) {
    KeyEvent key;
    key.code = code;
    key.ch = '\0';
    return key;
}

KeyEvent makeCharKey(char ch) {
    KeyEvent key;
    key.code = KEYCODE_CHAR;
    key.ch = ch;
    return key;
}

const char* keyName(const KeyEvent& key, char* buffer, int size) {
    switch (key.code) {
        case KEYCODE_CHAR:
            snprintf(buffer, size, "'%c'", key.ch);
            return buffer;
        case KEYCODE_ENTER:     return "ENTER";
        case KEYCODE_ESC:       return "ESC";
        case KEYCODE_BACKSPACE: return "BACKSPACE";
        case KEYCODE_UP:        return "UP";
        case KEYCODE_DOWN:      return "DOWN";
        case KEYCODE_LEFT:      return "LEFT";
        case KEYCODE_RIGHT:     return "RIGHT";
        default:                return "NONE";
    }
}

bool keyIsUp(const KeyEvent& key) {
    return key.code == KEYCODE_UP || key.isChar('w');
}

bool keyIsDown(const KeyEvent& key) {
    return key.code == KEYCODE_DOWN || key.isChar('s');
}

bool keyIsLeft(const KeyEvent& key) {
    return key.code == KEYCODE_LEFT || key.isChar('a');
}

bool keyIsRight(const KeyEvent& key) {
    return key.code == KEYCODE_RIGHT || key.isChar('d');
}

KeyDecoder::KeyDecoder() : state_(STATE_IDLE), last_was_cr_(false) {}

void KeyDecoder::reset() {
    state_ = STATE_IDLE;
    last_was_cr_ = false;
}

DecodeResult KeyDecoder::feed(uint8_t byte, KeyEvent& out) {
    bool after_cr = last_was_cr_;
    last_was_cr_ = false;

    if (state_ == STATE_ESC) {
        if (byte == '[' || byte == 'O') {
            state_ = STATE_SEQUENCE;
            return DECODE_PENDING;
        }
        // Unrecognized sequence: ESC plus one byte, reported as ESC
        state_ = STATE_IDLE;
        out = makeKey(KEYCODE_ESC);
        return DECODE_KEY;
    }

    if (state_ == STATE_SEQUENCE) {
        state_ = STATE_IDLE;
        switch (byte) {
            case 'A': out = makeKey(KEYCODE_UP); break;
            case 'B': out = makeKey(KEYCODE_DOWN); break;
            case 'C': out = makeKey(KEYCODE_RIGHT); break;
            case 'D': out = makeKey(KEYCODE_LEFT); break;
            default:  out = makeKey(KEYCODE_ESC); break;
        }
        return DECODE_KEY;
    }

    switch (byte) {
        case BYTE_CTRL_C:
            return DECODE_INTERRUPT;
        case BYTE_ESC:
            state_ = STATE_ESC;
            return DECODE_PENDING;
        case BYTE_CR:
            last_was_cr_ = true;
            out = makeKey(KEYCODE_ENTER);
            return DECODE_KEY;
        case BYTE_LF:
            if (after_cr) {
                return DECODE_PENDING;  // CR LF is one ENTER
            }
            out = makeKey(KEYCODE_ENTER);
            return DECODE_KEY;
        case BYTE_DEL:
        case BYTE_BS:
            out = makeKey(KEYCODE_BACKSPACE);
            return DECODE_KEY;
        default:
            break;
    }

    if (byte >= 0x20 && byte < 0x7F) {
        out = makeCharKey(static_cast<char>(byte));
        return DECODE_KEY;
    }

    DEBUG_PRINTF(g_debug_input, "Input: Ignoring control byte 0x%02X\n", byte);
    return DECODE_PENDING;
}

bool KeyDecoder::flushPending(KeyEvent& out) {
    if (state_ == STATE_IDLE) {
        return false;
    }
    // Lone ESC, or ESC [ cut short: both degrade to ESC
    state_ = STATE_IDLE;
    out = makeKey(KEYCODE_ESC);
    return true;
}
