/*
 * =================================================================================
 * Project:   PulsePanel - Timed Effect Session Manager
 * File:      Logger.h / Logger.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Thread-safe logging system. Manages a ring buffer of recent lines (for the
 * 'status' command) and a queue drained to stdout from the main loop.
 * =================================================================================
 */
#ifndef LOGGER_H
#define LOGGER_H

#include <string>
#include <vector>

// =================================================================================
// SECTION: LOGGING CONSTANTS & MACROS
// =================================================================================
#define LOG_SEP_MAJOR "=========================================================================="
#define LOG_SEP_MINOR "--------------------------------------------------------------------------"

// =================================================================================
// SECTION: CORE LOGGING FUNCTIONS
// =================================================================================
void logMessage(const char *message);
void processLogQueue();

// Copies the ring buffer, oldest first. maxLines == 0 means all.
std::vector<std::string> getRecentLogs(size_t maxLines);

// =================================================================================
// SECTION: BUFFER EXTERNS
// =================================================================================
extern const int LOG_BUFFER_SIZE;
extern const int MAX_LOG_ENTRY_LENGTH;

#endif
