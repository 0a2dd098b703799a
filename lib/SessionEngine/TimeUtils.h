/*
 * =================================================================================
 * Project:   PulsePanel - Timed Effect Session Manager
 * File:      lib/SessionEngine/TimeUtils.h
 *
 * Description:
 * Static utility class for time manipulation and string formatting.
 * - Converts raw seconds into human-readable durations (e.g., "1h 10min 5s").
 * - Parses and formats "HH:MM[:SS]" time-of-day strings for the Scheduler.
 * =================================================================================
 */
#pragma once
#include <stddef.h>
#include <stdint.h>
#include <stdio.h>

class TimeUtils {
public:
    /**
     * Formats seconds into a human-readable string (e.g., "1d 5h 6min 7s").
     * Units with 0 values are omitted unless the total time is 0s.
     * @param totalSeconds The duration in seconds.
     * @param buffer       The destination buffer.
     * @param size         The size of the buffer.
     */
    static void formatSeconds(unsigned long totalSeconds, char *buffer, size_t size) {
        if (size == 0) return;
        if (totalSeconds == 0) {
            snprintf(buffer, size, "0s");
            return;
        }

        const unsigned long SECS_MIN  = 60;
        const unsigned long SECS_HOUR = 3600;
        const unsigned long SECS_DAY  = 86400;

        unsigned long rem = totalSeconds;

        unsigned long d = rem / SECS_DAY;
        rem %= SECS_DAY;

        unsigned long h = rem / SECS_HOUR;
        rem %= SECS_HOUR;

        unsigned long m = rem / SECS_MIN;
        unsigned long s = rem % SECS_MIN;

        buffer[0] = '\0';
        size_t offset = 0;

        auto append = [&](unsigned long val, const char* suffix) {
            if (val > 0 && offset < size) {
                int n = snprintf(buffer + offset, size - offset, "%lu%s ", val, suffix);
                if (n > 0) offset += (size_t)n;
            }
        };

        append(d, "d");
        append(h, "h");
        append(m, "min");

        if (offset >= size) {
            buffer[size - 1] = '\0';
            return;
        }

        if (s > 0 || offset == 0) {
            snprintf(buffer + offset, size - offset, "%lus", s);
        } else if (offset > 0 && buffer[offset - 1] == ' ') {
            // Trim trailing space
            buffer[offset - 1] = '\0';
        }
    }

    /**
     * Parses "HH:MM" or "HH:MM:SS" into seconds since midnight.
     * @return false (outSeconds untouched) on anything else, including
     *         out-of-range fields ("24:00", "12:60") and trailing garbage.
     */
    static bool parseTimeOfDay(const char *text, uint32_t &outSeconds) {
        if (text == nullptr) return false;

        unsigned int h = 0, m = 0, s = 0;
        char tail = '\0';
        int fields = sscanf(text, "%2u:%2u:%2u%c", &h, &m, &s, &tail);

        if (fields == 2) {
            // Reject "12:3x" style input that sscanf would accept
            if (sscanf(text, "%2u:%2u%c", &h, &m, &tail) == 3) return false;
            s = 0;
        } else if (fields != 3) {
            return false;
        }

        if (h > 23 || m > 59 || s > 59) return false;

        outSeconds = h * 3600u + m * 60u + s;
        return true;
    }

    /**
     * Formats seconds since midnight as "HH:MM".
     */
    static void formatTimeOfDay(uint32_t secondsOfDay, char *buffer, size_t size) {
        secondsOfDay %= 86400u;
        snprintf(buffer, size, "%02u:%02u", (unsigned)(secondsOfDay / 3600u), (unsigned)((secondsOfDay % 3600u) / 60u));
    }
};
