#include "RedirectablePrint.h"
#include "DebugConfiguration.h"
#include "concurrency/LockGuard.h"
#include "timing.h"
#include <cctype>
#include <cstring>
#include <time.h>

#define SEC_PER_DAY 86400
#define SEC_PER_HOUR 3600
#define SEC_PER_MIN 60

RedirectablePrint::RedirectablePrint(FILE *_dest) : dest(_dest), startTime(timing::now()) {}

void RedirectablePrint::setDestination(FILE *_dest)
{
    concurrency::LockGuard g(&printLock);
    dest = _dest;
}

int RedirectablePrint::levelRank(const char *logLevel)
{
    switch (logLevel[0]) {
    case 'T':
        return 0;
    case 'D':
        return 1;
    case 'I':
        return 2;
    case 'W':
        return 3;
    case 'E':
        return 4;
    case 'C':
        return 5;
    default:
        return 2;
    }
}

size_t RedirectablePrint::vprintf(const char *logLevel, const char *format, va_list arg)
{
    va_list copy;

    va_copy(copy, arg);
    size_t len = vsnprintf(printBuf, sizeof(printBuf), format, copy);
    va_end(copy);

    // If the resulting string is longer than sizeof(printBuf)-1 characters, the remaining characters are still counted for the
    // return value
    if (len > sizeof(printBuf) - 1) {
        len = sizeof(printBuf) - 1;
    }
    for (size_t f = 0; f < len; f++) {
        if (!std::isprint(static_cast<unsigned char>(printBuf[f])) && printBuf[f] != '\n')
            printBuf[f] = '#';
    }
    if (color && logLevel != nullptr) {
        if (strcmp(logLevel, BLETRANSFER_LOG_LEVEL_DEBUG) == 0)
            fputs("\u001b[34m", dest);
        if (strcmp(logLevel, BLETRANSFER_LOG_LEVEL_INFO) == 0)
            fputs("\u001b[32m", dest);
        if (strcmp(logLevel, BLETRANSFER_LOG_LEVEL_WARN) == 0)
            fputs("\u001b[33m", dest);
        if (strcmp(logLevel, BLETRANSFER_LOG_LEVEL_ERROR) == 0)
            fputs("\u001b[31m", dest);
    }
    len = fwrite(printBuf, 1, len, dest);
    if (color && logLevel != nullptr) {
        fputs("\u001b[0m", dest);
    }
    return len;
}

void RedirectablePrint::log_to_serial(const char *logLevel, const char *format, va_list arg)
{
    // include the header
    if (color) {
        if (strcmp(logLevel, BLETRANSFER_LOG_LEVEL_DEBUG) == 0)
            fputs("\u001b[34m", dest);
        if (strcmp(logLevel, BLETRANSFER_LOG_LEVEL_INFO) == 0)
            fputs("\u001b[32m", dest);
        if (strcmp(logLevel, BLETRANSFER_LOG_LEVEL_WARN) == 0)
            fputs("\u001b[33m", dest);
        if (strcmp(logLevel, BLETRANSFER_LOG_LEVEL_ERROR) == 0)
            fputs("\u001b[31m", dest);
        if (strcmp(logLevel, BLETRANSFER_LOG_LEVEL_TRACE) == 0)
            fputs("\u001b[35m", dest);
    }

    double now = timing::now();
    long hms = static_cast<long>(now) % SEC_PER_DAY;
    int hour = hms / SEC_PER_HOUR;
    int min = (hms % SEC_PER_HOUR) / SEC_PER_MIN;
    int sec = (hms % SEC_PER_HOUR) % SEC_PER_MIN;

    fprintf(dest, "%s ", logLevel);
    if (color) {
        fputs("\u001b[0m", dest);
    }
    fprintf(dest, "| %02d:%02d:%02d %u ", hour, min, sec, static_cast<unsigned>(now - startTime));

    vprintf(logLevel, format, arg);
    fputc('\n', dest);
    fflush(dest);
}

void RedirectablePrint::log(const char *logLevel, const char *format, ...)
{
    concurrency::LockGuard g(&printLock);

    if (dest == nullptr || levelRank(logLevel) < threshold)
        return;

    va_list arg;
    va_start(arg, format);
    log_to_serial(logLevel, format, arg);
    va_end(arg);
}
