/**
 * InkDeck - Serial Keyboard Input
 * Implementation
 */

#include "keyboard_input.h"
#include "config.h"

// DEC private modes sent to the host terminal
static const char* TERM_CURSOR_HIDE = "\x1b[?25l";
static const char* TERM_CURSOR_SHOW = "\x1b[?25h";
static const char* TERM_CURSOR_KEYS_NORMAL = "\x1b[?1l";   // Arrows as ESC [ A..D

#define STOP_WAIT_STEP_MS   10
#define STOP_WAIT_MAX_MS    500

KeyboardInput::KeyboardInput(Stream& stream)
    : stream_(stream),
      queue_(nullptr),
      task_(nullptr),
      running_(false),
      task_exited_(true),
      interrupt_requested_(false) {}

KeyboardInput::~KeyboardInput() {
    stop();
    if (queue_ != nullptr) {
        vQueueDelete(queue_);
        queue_ = nullptr;
    }
}

bool KeyboardInput::begin() {
    if (running_) {
        return true;
    }

    if (queue_ == nullptr) {
        queue_ = xQueueCreate(KEY_QUEUE_LENGTH, sizeof(KeyEvent));
        if (queue_ == nullptr) {
            LOG_PRINTLN("Input: Failed to create key queue");
            return false;
        }
    }

    decoder_.reset();
    enterKeyMode();

    running_ = true;
    task_exited_ = false;
    BaseType_t created = xTaskCreatePinnedToCore(readTask, "keyboard", KEYBOARD_TASK_STACK,
                                                 this, KEYBOARD_TASK_PRIORITY, &task_,
                                                 KEYBOARD_TASK_CORE);
    if (created != pdPASS) {
        LOG_PRINTLN("Input: Failed to start keyboard task");
        running_ = false;
        task_exited_ = true;
        task_ = nullptr;
        restoreTerminal();
        return false;
    }

    DEBUG_PRINTLN(g_debug_input, "Input: Keyboard reader started");
    return true;
}

bool KeyboardInput::pollKey(KeyEvent& out, uint32_t timeout_ms) {
    if (queue_ == nullptr) {
        delay(timeout_ms);
        return false;
    }
    return xQueueReceive(queue_, &out, pdMS_TO_TICKS(timeout_ms)) == pdTRUE;
}

void KeyboardInput::stop() {
    if (running_) {
        running_ = false;

        // The task notices running_ within one read poll and parks itself.
        // Only stop() deletes it, so task_ stays valid until here.
        uint32_t waited = 0;
        while (!task_exited_ && waited < STOP_WAIT_MAX_MS) {
            delay(STOP_WAIT_STEP_MS);
            waited += STOP_WAIT_STEP_MS;
        }
        if (!task_exited_) {
            LOG_PRINTLN("Input: Keyboard task did not exit, deleting it");
        }
        if (task_ != nullptr) {
            vTaskDelete(task_);
            task_ = nullptr;
        }
        DEBUG_PRINTLN(g_debug_input, "Input: Keyboard reader stopped");
    }

    // Always hand the terminal back, even after a failed start
    restoreTerminal();
}

void KeyboardInput::readTask(void* arg) {
    KeyboardInput* self = static_cast<KeyboardInput*>(arg);
    self->readLoop();
    self->task_exited_ = true;

    // Wait for stop() to delete this task
    for (;;) {
        vTaskSuspend(nullptr);
    }
}

void KeyboardInput::readLoop() {
    uint32_t last_byte_ms = millis();
    KeyEvent key;

    while (running_) {
        if (stream_.available() > 0) {
            int value = stream_.read();
            if (value < 0) {
                continue;
            }
            last_byte_ms = millis();

            DecodeResult result = decoder_.feed(static_cast<uint8_t>(value), key);
            if (result == DECODE_KEY) {
                enqueue(key);
            } else if (result == DECODE_INTERRUPT) {
                LOG_PRINTLN("Input: Interrupt received");
                interrupt_requested_ = true;
            }
            continue;
        }

        // Silence after ESC: it was the ESC key, not the start of a sequence
        if (decoder_.hasPending() && millis() - last_byte_ms >= KEY_ESC_TIMEOUT_MS) {
            if (decoder_.flushPending(key)) {
                enqueue(key);
            }
        }

        vTaskDelay(pdMS_TO_TICKS(5));
    }
}

void KeyboardInput::enqueue(const KeyEvent& key) {
    char name[8];
    DEBUG_PRINTF(g_debug_input, "Input: Key %s\n", keyName(key, name, sizeof(name)));

    if (xQueueSend(queue_, &key, 0) != pdTRUE) {
        LOG_PRINTF("Input: Key queue full, dropped %s\n", keyName(key, name, sizeof(name)));
    }
}

void KeyboardInput::enterKeyMode() {
    stream_.print(TERM_CURSOR_KEYS_NORMAL);
    stream_.print(TERM_CURSOR_HIDE);
}

void KeyboardInput::restoreTerminal() {
    stream_.print(TERM_CURSOR_SHOW);
    stream_.flush();
}
