#pragma once

#include "concurrency/Lock.h"
#include <stdarg.h>
#include <stdio.h>

/**
 * A log sink that can be switched to squirt its bytes to a different destination.
 * This class is mostly useful to allow debug printing to be redirected away from stdout
 * (e.g. into a memory stream while testing, or nowhere at all).
 */
class RedirectablePrint
{
    FILE *dest;

    /// Lowest level rank that still gets printed, see levelRank()
    int threshold = 0;

    bool color = true;

    /// Seconds since epoch when this sink was created, used for the uptime column
    double startTime;

    concurrency::Lock printLock;

    /// Formatting scratch space, guarded by printLock
    char printBuf[512];

  public:
    explicit RedirectablePrint(FILE *_dest);

    /**
     * Set a new destination, nullptr mutes the sink
     */
    void setDestination(FILE *dest);

    /// Only messages at or above this rank are printed (0 = TRACE ... 5 = CRIT)
    void setLogLevel(int rank) { threshold = rank; }

    void setColor(bool enable) { color = enable; }

    /**
     * Debug logging print message
     *
     * A trailing newline is added to every message, callers should not supply one.
     */
    void log(const char *logLevel, const char *format, ...) __attribute__((format(printf, 3, 4)));

    /// Map one of the BLETRANSFER_LOG_LEVEL_* strings to its rank
    static int levelRank(const char *logLevel);

  protected:
    /** like printf but va_list based */
    size_t vprintf(const char *logLevel, const char *format, va_list arg);

  private:
    void log_to_serial(const char *logLevel, const char *format, va_list arg);
};
