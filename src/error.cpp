#include "error.h"
#include "DebugConfiguration.h"

const char *transferErrorName(TransferError code)
{
    switch (code) {
    case TransferError::NONE:
        return "none";
    case TransferError::FRAME_SEQUENCE:
        return "wrong frame sequence";
    case TransferError::FRAME_INTEGRITY:
        return "wrong frame hash";
    case TransferError::FILE_INTEGRITY:
        return "wrong file hash";
    case TransferError::FILE_NOT_FOUND:
        return "file not found";
    case TransferError::MALFORMED_HANDSHAKE:
        return "malformed handshake";
    case TransferError::CORRUPT_RESUME_STATE:
        return "corrupt resume state";
    case TransferError::STORAGE_FAILURE:
        return "storage failure";
    }
    return "unknown";
}

TransferError recordTransferError(RedirectablePrint *console, TransferError code, uint32_t address, const char *filename)
{
    if (filename) {
        LOG_ERROR("Record transfer error %d (%s) at %s:%lu", static_cast<int>(code), transferErrorName(code), filename,
                  static_cast<unsigned long>(address));
    } else {
        LOG_ERROR("Record transfer error %d (%s)", static_cast<int>(code), transferErrorName(code));
    }
    return code;
}
