/**
 * InkDeck - Wall Clock
 * Implementation
 */

#include "rtc_clock.h"
#include "config.h"
#include <sys/time.h>
#include <time.h>

// Anything before 2024-01-01 means the clock was never set
#define MIN_VALID_EPOCH     1704067200UL

RtcClock::RtcClock() : ds3231_present_(false) {}

void RtcClock::begin() {
    setenv("TZ", TIMEZONE_POSIX, 1);
    tzset();

    if (!rtc_.begin()) {
        LOG_PRINTLN("DS3231: not detected (using ESP32 RTC)");
        ds3231_present_ = false;
        return;
    }
    ds3231_present_ = true;

    if (rtc_.lostPower()) {
        LOG_PRINTLN("DS3231: WARNING - lost power, time invalid until NTP sync");
        return;
    }

    // Sync ESP32 RTC from DS3231 on every boot
    DateTime now = rtc_.now();
    struct timeval tv = {
        .tv_sec = static_cast<time_t>(now.unixtime()),
        .tv_usec = 0
    };
    settimeofday(&tv, NULL);

    LOG_PRINTF("DS3231: OK (synced %04d-%02d-%02d %02d:%02d:%02d UTC)\n",
               now.year(), now.month(), now.day(),
               now.hour(), now.minute(), now.second());
}

uint32_t RtcClock::millis() {
    return ::millis();
}

bool RtcClock::systemTimeValid() const {
    return static_cast<unsigned long>(time(nullptr)) >= MIN_VALID_EPOCH;
}

bool RtcClock::localTime(struct tm& out) {
    if (!systemTimeValid()) {
        return false;
    }
    time_t now = time(nullptr);
    return localtime_r(&now, &out) != nullptr;
}

void RtcClock::delayMs(uint32_t ms) {
    delay(ms);
}

bool RtcClock::syncFromNtp() {
    DEBUG_PRINTLN(g_debug_weather, "Time: Starting NTP sync");
    configTzTime(TIMEZONE_POSIX, NTP_SERVER_PRIMARY, NTP_SERVER_SECONDARY);

    uint32_t start = ::millis();
    while (!systemTimeValid()) {
        if (::millis() - start > NTP_SYNC_TIMEOUT_MS) {
            LOG_PRINTLN("Time: NTP sync timed out");
            return false;
        }
        delay(100);
    }

    time_t now = time(nullptr);
    if (ds3231_present_) {
        rtc_.adjust(DateTime(static_cast<uint32_t>(now)));
        DEBUG_PRINTLN(g_debug_weather, "Time: DS3231 updated from NTP");
    }

    struct tm local;
    localtime_r(&now, &local);
    LOG_PRINTF("Time: NTP sync OK (%04d-%02d-%02d %02d:%02d:%02d)\n",
               local.tm_year + 1900, local.tm_mon + 1, local.tm_mday,
               local.tm_hour, local.tm_min, local.tm_sec);
    return true;
}
