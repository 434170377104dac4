/**
 * InkDeck - Serial Keyboard Input
 * Background FreeRTOS task decoding console bytes into a bounded key queue
 *
 * The host terminal must be in raw mode (e.g. `picocom -b 115200`) so single
 * keystrokes arrive without line buffering.
 */

#ifndef KEYBOARD_INPUT_H
#define KEYBOARD_INPUT_H

#include <Arduino.h>
#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"
#include "freertos/task.h"
#include "keys.h"

class KeyboardInput : public KeySource {
public:
    explicit KeyboardInput(Stream& stream);
    ~KeyboardInput();

    // Create the queue, switch the terminal into key mode and start the task
    bool begin();

    bool pollKey(KeyEvent& out, uint32_t timeout_ms);
    bool interruptRequested() const { return interrupt_requested_; }
    void stop();

private:
    static void readTask(void* arg);
    void readLoop();
    void enqueue(const KeyEvent& key);
    void enterKeyMode();
    void restoreTerminal();

    Stream& stream_;
    KeyDecoder decoder_;
    QueueHandle_t queue_;
    TaskHandle_t task_;
    volatile bool running_;
    volatile bool task_exited_;
    volatile bool interrupt_requested_;
};

#endif // KEYBOARD_INPUT_H
