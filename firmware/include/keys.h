/**
 * InkDeck - Key Events
 * Key event type, escape-sequence decoder and the key source interface
 */

#ifndef KEYS_H
#define KEYS_H

#include <stdint.h>

// Decoded key kinds
enum KeyCode {
    KEYCODE_NONE,
    KEYCODE_CHAR,        // Printable character in KeyEvent::ch
    KEYCODE_ENTER,
    KEYCODE_ESC,
    KEYCODE_BACKSPACE,
    KEYCODE_UP,
    KEYCODE_DOWN,
    KEYCODE_LEFT,
    KEYCODE_RIGHT,
};

struct KeyEvent {
    KeyCode code;
    char ch;             // Valid when code == KEYCODE_CHAR

    bool isChar() const { return code == KEYCODE_CHAR; }
    bool isChar(char c) const { return code == KEYCODE_CHAR && ch == c; }
    bool isDigit() const { return code == KEYCODE_CHAR && ch >= '0' && ch <= '9'; }
    int digit() const { return ch - '0'; }
};

KeyEvent makeKey(KeyCode code);
KeyEvent makeCharKey(char ch);

// Name for logs ("ENTER", "UP", "'a'")
const char* keyName(const KeyEvent& key, char* buffer, int size);

// Menu navigation accepts arrows and the w/a/s/d cluster
bool keyIsUp(const KeyEvent& key);
bool keyIsDown(const KeyEvent& key);
bool keyIsLeft(const KeyEvent& key);
bool keyIsRight(const KeyEvent& key);

// Result of feeding one byte to the decoder
enum DecodeResult {
    DECODE_PENDING,      // Byte consumed, nothing to emit yet
    DECODE_KEY,          // Key written to the output
    DECODE_INTERRUPT,    // Ctrl-C
};

/**
 * Byte-at-a-time terminal decoder.
 *
 * CR or LF -> ENTER (LF directly after CR is dropped), DEL/BS -> BACKSPACE,
 * ESC [ or ESC O followed by A-D -> arrows, any other ESC sequence -> ESC.
 * A lone ESC is released by flushPending() once the line has been idle for
 * KEY_ESC_TIMEOUT_MS. Other control bytes are ignored.
 */
class KeyDecoder {
public:
    KeyDecoder();

    DecodeResult feed(uint8_t byte, KeyEvent& out);

    // Release a dangling ESC after the idle timeout; returns true if emitted
    bool flushPending(KeyEvent& out);

    bool hasPending() const { return state_ != STATE_IDLE; }
    void reset();

private:
    enum State {
        STATE_IDLE,
        STATE_ESC,           // Got ESC
        STATE_SEQUENCE,      // Got ESC [ or ESC O
    };

    State state_;
    bool last_was_cr_;
};

// Source of decoded key events, polled by the UI loop
class KeySource {
public:
    virtual ~KeySource() {}

    // Pop the next key, waiting at most timeout_ms; false if none arrived
    virtual bool pollKey(KeyEvent& out, uint32_t timeout_ms) = 0;

    // Ctrl-C seen on the console
    virtual bool interruptRequested() const = 0;

    // Stop reading and restore the terminal; safe to call more than once
    virtual void stop() = 0;
};

#endif // KEYS_H
