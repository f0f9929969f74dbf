#pragma once

#include <stddef.h>
#include <stdint.h>

// -----------------------------------------------------------------------------
// Version
// -----------------------------------------------------------------------------

// If app version is not specified we assume we are not being invoked by the build script
#ifndef APP_VERSION
#define APP_VERSION "0.0.0"
#endif

// -----------------------------------------------------------------------------
// Link level framing
// -----------------------------------------------------------------------------

/// Wire overhead of the non payload fields of a Frame, fixed per protocol version
#define FRAME_HEADER_SIZE 22

/// Largest MTU we can frame for, must match MAX_MTU - FRAME_HEADER_SIZE in transfer.options
#define MAX_MTU 512

#ifndef DEFAULT_MTU
#define DEFAULT_MTU 185
#endif

/// sequence_index of the frame returned once a frame stream is exhausted
#define FRAME_SEQUENCE_NONE (-1)

// -----------------------------------------------------------------------------
// High level transfer
// -----------------------------------------------------------------------------

#ifndef DEFAULT_SUPER_CHUNK_SIZE
#define DEFAULT_SUPER_CHUNK_SIZE (100 * 1024)
#endif

/// MD5
#define DIGEST_SIZE 16
#define TRUNCATED_HASH_SIZE 2

/// Bumped when the persisted TransferConfig layout or defaults change
#define TRANSFERCONFIG_MIN_VER 1
#define TRANSFERCONFIG_CUR_VER 1

// Directories and files below the transfer root
#define DOWNLOAD_DIR "download"
#define UPLOAD_DIR "upload"
#define PREFS_DIR "prefs"
#define CONFIG_FILE "config.proto"

#include "DebugConfiguration.h"
