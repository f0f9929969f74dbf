#pragma once

#include "FrameSplitter.h"
#include "RedirectablePrint.h"
#include "SuperChunkReader.h"
#include "concurrency/Lock.h"
#include "error.h"
#include "transfer-pb-constants.h"
#include <string>
#include <vector>

/**
 * High level send side: device to controller file transfer.
 *
 * A request with an empty file_hash starts an upload of upload/<filename>.  Each response() while no super-chunk is
 * outstanding reads the next one, hands it to the FrameSplitter and reports its truncated hash.  The controller echoes that
 * hash in its next request to acknowledge the super-chunk, which advances next_super_chunk_index.
 */
class UploadSession
{
  public:
    UploadSession(RedirectablePrint *console, const char *rootDir, FrameSplitter *splitter,
                  uint32_t superChunkSize = DEFAULT_SUPER_CHUNK_SIZE);

    /// Start an upload (empty file_hash) or acknowledge the outstanding super-chunk
    void accept(const bletransfer_TransferRequest &request);

    /// Current progress snapshot, sending the next super-chunk if the last one was acknowledged
    bletransfer_TransferResponse response();

    /// Stop the current upload, nothing is kept
    void abandon();

    /// Takes effect with the next upload
    void setSuperChunkSize(uint32_t size);

    bool isInProgress();
    double getTransferDuration();
    TransferError getLastError();

    std::string getUploadDir() const { return uploadDir; }

  private:
    void startUpload(const bletransfer_TransferRequest &request);
    void acknowledge(const bletransfer_TransferRequest &request);
    void sendNext();

    RedirectablePrint *console;
    std::string uploadDir;
    FrameSplitter *splitter;
    uint32_t superChunkSize;

    concurrency::Lock lock;

    SuperChunkReader reader;
    std::vector<uint8_t> chunk;

    bletransfer_TransferResponse resp = bletransfer_TransferResponse_init_zero;

    /// A super-chunk went out and has not been acknowledged yet
    bool outstanding = false;

    double startTime = 0;
    TransferError lastError = TransferError::NONE;
};
