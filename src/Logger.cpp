#include "Logger.h"
#include <stdio.h>
#include <string.h>
#include <mutex>

// --- Logging System ---
// Ring buffer for storing logs in memory.
const int LOG_BUFFER_SIZE = 150;
const int MAX_LOG_ENTRY_LENGTH = 150;
static char logBuffer[LOG_BUFFER_SIZE][MAX_LOG_ENTRY_LENGTH];
static int logBufferIndex = 0;
static bool logBufferFull = false;

// Stdout Log Queue (printing never happens under the lock)
static const int STDOUT_QUEUE_SIZE = 256;
static char stdoutLogQueue[STDOUT_QUEUE_SIZE][MAX_LOG_ENTRY_LENGTH];
static int stdoutQueueHead = 0;
static int stdoutQueueTail = 0;
static unsigned long droppedLines = 0;

static std::mutex logMutex;

/**
 * Thread-safe logging. NO STDOUT IO IN THIS FUNCTION.
 * Adds a message to the in-memory log buffer and pushes to the stdout queue.
 */
void logMessage(const char *message) {
  std::lock_guard<std::mutex> lock(logMutex);

  snprintf(logBuffer[logBufferIndex], MAX_LOG_ENTRY_LENGTH, "%s", message);
  logBufferIndex++;
  if (logBufferIndex >= LOG_BUFFER_SIZE) {
    logBufferIndex = 0;
    logBufferFull = true;
  }

  int nextHead = (stdoutQueueHead + 1) % STDOUT_QUEUE_SIZE;
  if (nextHead != stdoutQueueTail) {
    snprintf(stdoutLogQueue[stdoutQueueHead], MAX_LOG_ENTRY_LENGTH, "%s", message);
    stdoutQueueHead = nextHead;
  } else {
    // Queue full; the ring buffer still has the line
    droppedLines++;
  }
}

/**
 * Called in main loop to drain the log queue to stdout.
 * Drains up to 32 messages per call.
 */
void processLogQueue() {
  int maxLinesToProcess = 32;

  while (maxLinesToProcess > 0) {
    char msgCopy[MAX_LOG_ENTRY_LENGTH];
    bool hasMessage = false;
    unsigned long dropped = 0;

    // 1. Quick lock to pop a message
    {
      std::lock_guard<std::mutex> lock(logMutex);
      if (stdoutQueueHead != stdoutQueueTail) {
        strncpy(msgCopy, stdoutLogQueue[stdoutQueueTail], MAX_LOG_ENTRY_LENGTH);
        msgCopy[MAX_LOG_ENTRY_LENGTH - 1] = '\0';
        stdoutQueueTail = (stdoutQueueTail + 1) % STDOUT_QUEUE_SIZE;
        hasMessage = true;
      }
      dropped = droppedLines;
      droppedLines = 0;
    }

    if (dropped > 0) {
      printf("[log] %lu lines dropped\n", dropped);
    }

    // 2. Print OUTSIDE the lock
    if (!hasMessage) break;
    printf("%s\n", msgCopy);
    maxLinesToProcess--;
  }
  fflush(stdout);
}

std::vector<std::string> getRecentLogs(size_t maxLines) {
  std::lock_guard<std::mutex> lock(logMutex);

  std::vector<std::string> lines;
  int count = logBufferFull ? LOG_BUFFER_SIZE : logBufferIndex;
  int start = logBufferFull ? logBufferIndex : 0;

  int skip = 0;
  if (maxLines > 0 && (size_t)count > maxLines) skip = count - (int)maxLines;

  for (int i = skip; i < count; i++) {
    lines.push_back(logBuffer[(start + i) % LOG_BUFFER_SIZE]);
  }
  return lines;
}
