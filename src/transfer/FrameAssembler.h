#pragma once

#include "Observer.h"
#include "RedirectablePrint.h"
#include "error.h"
#include "transfer-pb-constants.h"
#include <string>
#include <vector>

/**
 * Link level receive side: rebuilds one super-chunk from its frames.
 *
 * A frame with sequence_index 0 always starts over, which is how the sender resynchronizes after restarting a chunk.  Every
 * later frame must satisfy remaining + sequence_index == total_frames, where remaining counts the frames still owed before
 * this one, and must carry the truncated hash of its data.  Any violation drops the partial buffer.
 *
 * When the last frame arrives the buffer is handed to the one registered consumer through superChunkReady.  Only one
 * super-chunk is ever buffered.
 */
class FrameAssembler
{
  public:
    enum State { STATE_IDLE, STATE_RECEIVING, STATE_COMPLETE, STATE_FAILED };

    enum Failure { FAILURE_NONE, FAILURE_WRONG_HASH, FAILURE_WRONG_SEQUENCE };

    /// The argument is only valid during the notification, copy what you need
    Observable<const std::vector<uint8_t> *> superChunkReady;

    explicit FrameAssembler(RedirectablePrint *console);

    /**
     * Consume one frame
     *
     * @return frames still owed for the current super-chunk (0 once it is complete), or -1 if the frame was rejected
     */
    int handleFrame(const bletransfer_Frame &frame);

    /// Forget any partial super-chunk and go back to idle
    void reset();

    State getState() const { return state; }
    Failure getFailure() const { return failure; }
    TransferError getLastError() const { return lastError; }

    /// Frames still owed, 0 unless receiving
    int remaining() const { return state == STATE_RECEIVING ? static_cast<int>(remainingFrames) : 0; }

    /// true from completion until the assembled buffer is read with getData()
    bool hasNewData() const { return newData; }
    const std::vector<uint8_t> &getData();

    /// Seconds the last completed super-chunk took, 0 in any other state
    double getTransferDuration() const;

    std::string toString() const;

  private:
    int fail(Failure why);

    RedirectablePrint *console;

    State state = STATE_IDLE;
    Failure failure = FAILURE_NONE;
    TransferError lastError = TransferError::NONE;

    std::vector<uint8_t> buffer;
    uint32_t totalFrames = 0;
    uint32_t remainingFrames = 0;
    bool newData = false;

    double startTime = 0;
    double duration = 0;
};
