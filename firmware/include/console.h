// console.h
// Log sink shared by every module (Serial on the device, stderr on the host)

#ifndef CONSOLE_H
#define CONSOLE_H

// printf-style write to the console (no implicit newline)
void consolePrintf(const char* format, ...) __attribute__((format(printf, 1, 2)));

// Write text followed by a newline
void consolePrintln(const char* text);

#endif // CONSOLE_H
