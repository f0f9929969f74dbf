#pragma once

#include "DownloadSession.h"
#include "FrameAssembler.h"
#include "FrameSplitter.h"
#include "Observer.h"
#include "RedirectablePrint.h"
#include "UploadSession.h"
#include "concurrency/Lock.h"
#include "configuration.h"
#include <string>

/**
 * Single request/response surface over one download and one upload session.
 *
 * The direction of the last accepted request picks the session that answers getResponse().  Only one direction is active at a
 * time: switching while the other session is in progress abandons its in-memory progress (a download can still be resumed from
 * disk).
 *
 * Every public operation runs under one lock, frame layers included.  What leaves the coordinator (the framesReady
 * notification and the download completion callback) is handed out after that lock is released, so both may call straight
 * back in.
 */
class TransferCoordinator
{
  public:
    /// Fired with the frame count each time a new outbound frame stream is queued
    Observable<uint32_t> framesReady;

    TransferCoordinator(RedirectablePrint *console, const char *rootDir, uint32_t mtu = DEFAULT_MTU,
                        uint32_t superChunkSize = DEFAULT_SUPER_CHUNK_SIZE, TransferCompleteCallback onComplete = nullptr);

    /// Apply MTU and super-chunk size from a loaded configuration
    void configure(const bletransfer_TransferConfig &config);

    void setRequest(const bletransfer_TransferRequest &request);
    bletransfer_TransferResponse getResponse();

    /**
     * Inbound frame from the transport
     *
     * @return frames still owed for the current super-chunk, -1 if the frame was rejected
     */
    int handleFrame(const bletransfer_Frame &frame);

    /// Next outbound frame, the end of stream frame if there is nothing to send
    bletransfer_Frame getFrame();

    /// true while outbound frames are waiting
    bool hasFrames();

    bletransfer_TransferRequest_Direction getDirection();

    FrameAssembler &getAssembler() { return assembler; }
    FrameSplitter &getSplitter() { return splitter; }
    DownloadSession &getDownload() { return download; }
    UploadSession &getUpload() { return upload; }

  private:
    /// A finished download waiting to be reported
    struct Completion {
        bool pending = false;
        std::string path;
        bool success = false;
        bletransfer_Target target = bletransfer_Target_UNKNOWN;
    };

    /// Called by the download session, possibly from its constructor, with our lock held
    void stashCompletion(const char *path, bletransfer_Target target);

    /// Report what piled up during an operation, call without holding the lock
    void deliver(Completion &done, uint32_t newFrames);

    RedirectablePrint *console;
    TransferCompleteCallback onComplete;

    concurrency::Lock lock;
    Completion completion;

    FrameAssembler assembler;
    FrameSplitter splitter;
    DownloadSession download;
    UploadSession upload;

    bletransfer_TransferRequest_Direction direction = bletransfer_TransferRequest_Direction_CONTROLLER_TO_DEVICE;
};
