#pragma once

// -----------------------------------------------------------------------------
// DEBUG
// -----------------------------------------------------------------------------

#define BLETRANSFER_LOG_LEVEL_DEBUG "DEBUG"
#define BLETRANSFER_LOG_LEVEL_INFO "INFO "
#define BLETRANSFER_LOG_LEVEL_WARN "WARN "
#define BLETRANSFER_LOG_LEVEL_ERROR "ERROR"
#define BLETRANSFER_LOG_LEVEL_CRIT "CRIT "
#define BLETRANSFER_LOG_LEVEL_TRACE "TRACE"

#include "RedirectablePrint.h"

// Each component carries the log sink it was constructed with as a member called console,
// so DEBUG_PORT resolves to the injected sink rather than a global one.
#define DEBUG_PORT (*console)

#ifndef DEBUG_MUTE
#define LOG_DEBUG(...) DEBUG_PORT.log(BLETRANSFER_LOG_LEVEL_DEBUG, __VA_ARGS__)
#define LOG_INFO(...) DEBUG_PORT.log(BLETRANSFER_LOG_LEVEL_INFO, __VA_ARGS__)
#define LOG_WARN(...) DEBUG_PORT.log(BLETRANSFER_LOG_LEVEL_WARN, __VA_ARGS__)
#define LOG_ERROR(...) DEBUG_PORT.log(BLETRANSFER_LOG_LEVEL_ERROR, __VA_ARGS__)
#define LOG_CRIT(...) DEBUG_PORT.log(BLETRANSFER_LOG_LEVEL_CRIT, __VA_ARGS__)
#define LOG_TRACE(...) DEBUG_PORT.log(BLETRANSFER_LOG_LEVEL_TRACE, __VA_ARGS__)
#else
#define LOG_DEBUG(...)
#define LOG_INFO(...)
#define LOG_WARN(...)
#define LOG_ERROR(...)
#define LOG_CRIT(...)
#define LOG_TRACE(...)
#endif
