#pragma once

#include "RedirectablePrint.h"
#include <stdint.h>

/// Reasons a transfer (or one super-chunk of it) was aborted
enum class TransferError : uint8_t {
    NONE = 0,
    /// A frame's position is inconsistent with the frames already consumed
    FRAME_SEQUENCE,
    /// Truncated hash of a frame does not match its data
    FRAME_INTEGRITY,
    /// Digest over all super-chunks does not match the requested file hash
    FILE_INTEGRITY,
    /// Requested upload file is absent
    FILE_NOT_FOUND,
    /// Zero declared super-chunks, an index beyond the declared total or an unusable file name
    MALFORMED_HANDSHAKE,
    /// Resume marker could not be decoded at startup
    CORRUPT_RESUME_STATE,
    /// Artifact, marker or output file could not be read or written
    STORAGE_FAILURE
};

/// A macro that includes filename and line, logs to the console in scope
#define RECORD_TRANSFERERROR(code) recordTransferError(console, code, __LINE__, __FILE__)

/// Human readable name of an error code
const char *transferErrorName(TransferError code);

/// Log an error and hand the code back so the caller can keep it as its last error
TransferError recordTransferError(RedirectablePrint *console, TransferError code, uint32_t address = 0,
                                  const char *filename = NULL);
