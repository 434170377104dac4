/**
 * InkDeck - Time Formatting
 * Clock face, date line and note timestamps
 */

#include "time_source.h"
#include <stdio.h>
#include <string.h>

void formatClockTime(const struct tm& now, int clock_format, bool show_seconds,
                     char* buffer, int size, char* ampm, int ampm_size) {
    const char* pattern;
    if (clock_format == 24) {
        pattern = show_seconds ? "%H:%M:%S" : "%H:%M";
    } else {
        pattern = show_seconds ? "%I:%M:%S" : "%I:%M";
    }

    if (strftime(buffer, size, pattern, &now) == 0) {
        buffer[0] = '\0';
    }

    if (clock_format == 24) {
        if (ampm_size > 0) ampm[0] = '\0';
        return;
    }

    // Remove leading zero from hour
    if (buffer[0] == '0') {
        buffer[0] = ' ';
    }
    if (strftime(ampm, ampm_size, "%p", &now) == 0 && ampm_size > 0) {
        ampm[0] = '\0';
    }
}

void formatDate(const struct tm& now, const char* date_format, char* buffer, int size) {
    const char* pattern = "%a, %b %d, %Y";
    if (strcmp(date_format, "short") == 0) {
        pattern = "%m/%d/%y";
    } else if (strcmp(date_format, "iso") == 0) {
        pattern = "%Y-%m-%d";
    }

    if (strftime(buffer, size, pattern, &now) == 0 && size > 0) {
        buffer[0] = '\0';
    }
}

void formatTimestamp(const struct tm& now, char* buffer, int size) {
    if (strftime(buffer, size, "%Y-%m-%d %H:%M:%S", &now) == 0 && size > 0) {
        buffer[0] = '\0';
    }
}
