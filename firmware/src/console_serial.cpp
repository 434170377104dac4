// console_serial.cpp
// Console log sink on the USB serial port
//
// The host terminal runs without output post-processing while the keyboard
// reader owns it, so bare LF is expanded to CR LF here.

#include <Arduino.h>
#include <stdarg.h>
#include "console.h"

#define CONSOLE_LINE_MAX 256

void consolePrintf(const char* format, ...) {
    char line[CONSOLE_LINE_MAX];
    va_list args;
    va_start(args, format);
    vsnprintf(line, sizeof(line), format, args);
    va_end(args);

    for (const char* p = line; *p != '\0'; ++p) {
        if (*p == '\n') {
            Serial.write('\r');
        }
        Serial.write(*p);
    }
}

void consolePrintln(const char* text) {
    Serial.println(text);
}
