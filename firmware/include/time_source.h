/**
 * InkDeck - Time Source
 * Wall clock and monotonic milliseconds, plus the display formats
 */

#ifndef TIME_SOURCE_H
#define TIME_SOURCE_H

#include <stdint.h>
#include <time.h>

class TimeSource {
public:
    virtual ~TimeSource() {}

    // Monotonic milliseconds since boot
    virtual uint32_t millis() = 0;

    // Current local time; false if the clock was never set
    virtual bool localTime(struct tm& out) = 0;

    // Yield to other tasks for ms milliseconds
    virtual void delayMs(uint32_t ms) = 0;
};

// Clock face time: "HH:MM" or "HH:MM:SS". In 12h format the leading zero of
// the hour is blanked and ampm receives "AM"/"PM" (empty in 24h format).
void formatClockTime(const struct tm& now, int clock_format, bool show_seconds,
                     char* buffer, int size, char* ampm, int ampm_size);

// Date line: "long" (Mon, Jan 05, 2026), "short" (01/05/26), "iso" (2026-01-05)
void formatDate(const struct tm& now, const char* date_format, char* buffer, int size);

// Note creation stamp: "YYYY-MM-DD HH:MM:SS"
void formatTimestamp(const struct tm& now, char* buffer, int size);

#endif // TIME_SOURCE_H
