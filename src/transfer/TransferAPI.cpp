#include "TransferAPI.h"
#include "configuration.h"
#include <string.h>

TransferAPI::TransferAPI(RedirectablePrint *_console, TransferCoordinator *_coordinator)
    : console(_console), coordinator(_coordinator)
{
    observe(&coordinator->framesReady);
}

bool TransferAPI::handleRequest(const uint8_t *buf, size_t len)
{
    memset(&requestScratch, 0, sizeof(requestScratch));
    if (!pb_decode_from_bytes(console, buf, len, &bletransfer_TransferRequest_msg, &requestScratch)) {
        LOG_ERROR("Error: ignore malformed TransferRequest");
        return false;
    }

    LOG_INFO("Request for %s, direction %d, %u super-chunks", requestScratch.filename, requestScratch.direction,
             requestScratch.total_super_chunks);
    coordinator->setRequest(requestScratch);
    return true;
}

size_t TransferAPI::getResponse(uint8_t *buf, size_t bufSize)
{
    bletransfer_TransferResponse resp = coordinator->getResponse();
    return pb_encode_to_bytes(console, buf, bufSize, &bletransfer_TransferResponse_msg, &resp);
}

bool TransferAPI::handleFrame(const uint8_t *buf, size_t len)
{
    memset(&frameScratch, 0, sizeof(frameScratch));
    if (!pb_decode_from_bytes(console, buf, len, &bletransfer_Frame_msg, &frameScratch)) {
        LOG_ERROR("Error: ignore malformed Frame");
        return false;
    }

    return coordinator->handleFrame(frameScratch) >= 0;
}

bool TransferAPI::available()
{
    return coordinator->hasFrames();
}

size_t TransferAPI::getFrame(uint8_t *buf, size_t bufSize)
{
    bletransfer_Frame frame = coordinator->getFrame();
    if (frame.sequence_index == FRAME_SEQUENCE_NONE)
        return 0;

    size_t numbytes = pb_encode_to_bytes(console, buf, bufSize, &bletransfer_Frame_msg, &frame);
    if (numbytes)
        fromDeviceNum++;
    return numbytes;
}

int TransferAPI::onNotify(uint32_t numFrames)
{
    LOG_DEBUG("Tell transport we have %u new frames", numFrames);
    onNowHasData(fromDeviceNum);
    return 0;
}
