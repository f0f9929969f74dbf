#pragma once

#include "Observer.h"
#include "RedirectablePrint.h"
#include "TransferCoordinator.h"
#include "transfer-pb-constants.h"

/**
 * Provides our protobuf based API which a controller can use to move files to and from the device
 * over BLE (or any other transport with small messages).
 *
 * A transport binds one characteristic (or message type) to each of the four calls: requests in, responses out, frames in,
 * frames out.  Subclass to get told when new outbound frames are waiting.
 */
class TransferAPI : public Observer<uint32_t>
{
    RedirectablePrint *console;
    TransferCoordinator *coordinator;

    /**
     * Each frame handed to the transport has an incrementing count
     */
    uint32_t fromDeviceNum = 0;

    // scratch objects for decoding, any data must be copied elsewhere before returning
    bletransfer_TransferRequest requestScratch = bletransfer_TransferRequest_init_zero;
    bletransfer_Frame frameScratch = bletransfer_Frame_init_zero;

  public:
    TransferAPI(RedirectablePrint *console, TransferCoordinator *coordinator);

    virtual ~TransferAPI() {}

    /**
     * Handle an encoded TransferRequest
     * @return false if the bytes could not be decoded
     */
    virtual bool handleRequest(const uint8_t *buf, size_t len);

    /**
     * Encode the current TransferResponse into buf
     * @return number of bytes written, 0 on failure
     */
    size_t getResponse(uint8_t *buf, size_t bufSize);

    /**
     * Handle an encoded Frame
     * @return false if the bytes could not be decoded or the frame was rejected
     */
    virtual bool handleFrame(const uint8_t *buf, size_t len);

    /**
     * Encode the next outbound frame into buf
     * @return number of bytes written, or 0 if no frame is waiting
     */
    size_t getFrame(uint8_t *buf, size_t bufSize);

    /**
     * Return true if we have frames waiting to go out
     */
    bool available();

    uint32_t getFromDeviceNum() const { return fromDeviceNum; }

  protected:
    /**
     * Subclasses can use this as a hook to provide custom notifications for their transport (i.e. bluetooth notifies).
     * No lock is held while it runs, so it may call any of the methods above.
     */
    virtual void onNowHasData(uint32_t fromDeviceNum) {}

    /// A new frame stream was queued
    virtual int onNotify(uint32_t numFrames) override;
};
