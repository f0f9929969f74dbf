#pragma once

#include "Observer.h"
#include "RedirectablePrint.h"
#include "concurrency/Lock.h"
#include "error.h"
#include "transfer-pb-constants.h"
#include <functional>
#include <string>
#include <vector>

class Digest;
class SafeFile;

/// Called once per finished download, path is NULL (and target UNKNOWN) if the file failed verification
typedef std::function<void(const char *path, bletransfer_Target target)> TransferCompleteCallback;

/**
 * High level receive side: controller to device file transfer.
 *
 * Every super-chunk the FrameAssembler completes is persisted as download/chunk<N>.bin.  The accepted request is kept in
 * download/request.proto for as long as the transfer runs; its presence is what lets a restarted process pick the transfer up
 * again (see loadFromDisk).  Once the last super-chunk arrives the artifacts are hashed in order and, if the digest matches the
 * request, joined into download/<filename>.
 */
class DownloadSession : public Observer<const std::vector<uint8_t> *>
{
  public:
    DownloadSession(RedirectablePrint *console, const char *rootDir, TransferCompleteCallback onComplete = nullptr);

    /**
     * Rebuild the transfer state from the resume marker, or clean up orphaned artifacts if there is none.
     * Called by the constructor.
     */
    void loadFromDisk();

    /// Start a new transfer, or treat a repeat of the running one as a no-op
    void accept(const bletransfer_TransferRequest &request);

    /// Persist one reassembled super-chunk, finalizing the transfer after the last one
    int handleSuperChunk(const uint8_t *data, size_t len);

    /// Current progress snapshot, forced to ERROR if the handshake can't describe a valid transfer (also before any request)
    bletransfer_TransferResponse response();

    /// Drop in-memory progress, files on disk stay for a later resume
    void abandon();

    bool isInProgress();
    double getTransferDuration();
    uint64_t getTransferredBytes();
    TransferError getLastError();

    std::string getDownloadDir() const { return downloadDir; }
    std::string getMarkerPath() const { return markerPath; }
    std::string getArtifactPath(uint32_t index) const;

  protected:
    virtual int onNotify(const std::vector<uint8_t> *superChunk) override;

  private:
    struct Completion {
        bool pending = false;
        bool success = false;
        std::string path;
        bletransfer_Target target = bletransfer_Target_UNKNOWN;
    };

    bool restoreFromMarker(Completion &done);
    void finalize(Completion &done);
    bool appendArtifact(uint32_t index, Digest &digest, SafeFile &out);
    uint32_t countArtifacts();
    void removeArtifacts();
    void fireCompletion(const Completion &done);
    void startFresh(const bletransfer_TransferRequest &request);

    RedirectablePrint *console;
    std::string downloadDir;
    std::string markerPath;
    TransferCompleteCallback onComplete;

    concurrency::Lock lock;

    bletransfer_TransferRequest request = bletransfer_TransferRequest_init_zero;
    bletransfer_TransferResponse resp = bletransfer_TransferResponse_init_zero;

    double startTime = 0;
    TransferError lastError = TransferError::NONE;
};
