/**
 * InkDeck - Wall Clock
 * ESP32 system time, seeded from a DS3231 when fitted and kept by NTP
 */

#ifndef RTC_CLOCK_H
#define RTC_CLOCK_H

#include <Arduino.h>
#include <RTClib.h>
#include "time_source.h"

class RtcClock : public TimeSource {
public:
    RtcClock();

    // Apply the time zone and seed system time from the DS3231 if present.
    // Wire must already be started.
    void begin();

    uint32_t millis();
    bool localTime(struct tm& out);
    void delayMs(uint32_t ms);

    // NTP sync (needs Wi-Fi); writes the result back to the DS3231
    bool syncFromNtp();

    bool ds3231Present() const { return ds3231_present_; }

private:
    bool systemTimeValid() const;

    RTC_DS3231 rtc_;
    bool ds3231_present_;
};

#endif // RTC_CLOCK_H
