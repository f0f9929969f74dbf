#pragma once

#include "RedirectablePrint.h"
#include "configuration.h"
#include "transfer-pb-constants.h"
#include <vector>

/**
 * Link level send side: cuts one buffer (a super-chunk) into frames that fit the negotiated MTU.
 *
 * Frames are produced lazily by nextFrame().  Once the buffer is used up every further pull returns an end of stream frame
 * (sequence_index == FRAME_SEQUENCE_NONE, no data) until send() starts a new stream.
 *
 * send() runs under the caller's locks, so it only records that a stream was queued.  The owner collects that with
 * takeNewStream() once its locks are released and tells the transport.
 */
class FrameSplitter
{
  public:
    explicit FrameSplitter(RedirectablePrint *console, uint32_t mtu = DEFAULT_MTU);

    /// Change the MTU used by the next send(), false (and MTU unchanged) if it can't carry a frame
    bool setMtu(uint32_t mtu);
    uint32_t getMtu() const { return mtu; }

    /// Data bytes per frame at the current MTU
    uint32_t getPayloadSize() const { return mtu - FRAME_HEADER_SIZE; }

    static bool isValidMtu(uint32_t mtu) { return mtu > FRAME_HEADER_SIZE && mtu <= MAX_MTU; }

    /**
     * Start a new frame stream over a copy of payload, dropping whatever was left of the previous one
     *
     * @return false if the current MTU is unusable
     */
    bool send(const uint8_t *payload, size_t len);

    /// Drop the rest of the current stream
    void clear();

    /// Produce the next frame, or the end of stream frame
    bletransfer_Frame nextFrame();

    /// true while nextFrame() still has real frames to hand out
    bool available() const { return nextIndex < totalFrames; }

    uint32_t getTotalFrames() const { return totalFrames; }

    /// Frame count of a stream queued since the last call, 0 if none
    uint32_t takeNewStream();

  private:
    RedirectablePrint *console;
    uint32_t mtu;

    std::vector<uint8_t> buffer;
    uint32_t payloadSize = 0;
    uint32_t totalFrames = 0;
    uint32_t nextIndex = 0;
    uint32_t unannounced = 0;
};
