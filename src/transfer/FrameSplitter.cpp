#include "FrameSplitter.h"
#include "Digest.h"
#include <string.h>

FrameSplitter::FrameSplitter(RedirectablePrint *_console, uint32_t _mtu) : console(_console), mtu(DEFAULT_MTU)
{
    setMtu(_mtu);
}

bool FrameSplitter::setMtu(uint32_t newMtu)
{
    if (!isValidMtu(newMtu)) {
        LOG_ERROR("Invalid MTU %u, must be in (%d, %d], keeping %u", newMtu, FRAME_HEADER_SIZE, MAX_MTU, mtu);
        return false;
    }

    if (newMtu != mtu)
        LOG_INFO("MTU changed from %u to %u", mtu, newMtu);
    mtu = newMtu;
    return true;
}

bool FrameSplitter::send(const uint8_t *payload, size_t len)
{
    if (!isValidMtu(mtu)) {
        LOG_ERROR("Can't frame with MTU %u", mtu);
        return false;
    }

    if (available())
        LOG_WARN("Dropping %u unsent frames", totalFrames - nextIndex);

    buffer.assign(payload, payload + len);
    payloadSize = getPayloadSize();
    totalFrames = static_cast<uint32_t>((len + payloadSize - 1) / payloadSize);
    nextIndex = 0;

    LOG_DEBUG("Split %u bytes into %u frames of up to %u bytes", static_cast<unsigned>(len), totalFrames, payloadSize);

    unannounced = totalFrames;
    return true;
}

void FrameSplitter::clear()
{
    if (available())
        LOG_DEBUG("Dropping %u unsent frames", totalFrames - nextIndex);

    buffer.clear();
    totalFrames = 0;
    nextIndex = 0;
    unannounced = 0;
}

uint32_t FrameSplitter::takeNewStream()
{
    uint32_t numFrames = unannounced;
    unannounced = 0;
    return numFrames;
}

bletransfer_Frame FrameSplitter::nextFrame()
{
    bletransfer_Frame frame = bletransfer_Frame_init_zero;

    if (!available()) {
        frame.sequence_index = FRAME_SEQUENCE_NONE;
        return frame;
    }

    size_t start = static_cast<size_t>(nextIndex) * payloadSize;
    size_t end = start + payloadSize;
    if (end > buffer.size())
        end = buffer.size();

    frame.sequence_index = static_cast<int32_t>(nextIndex);
    frame.total_frames = totalFrames;
    frame.data.size = static_cast<pb_size_t>(end - start);
    memcpy(frame.data.bytes, buffer.data() + start, frame.data.size);
    frame.truncated_hash.size = TRUNCATED_HASH_SIZE;
    if (!Digest::truncatedHash(frame.data.bytes, frame.data.size, frame.truncated_hash.bytes))
        LOG_ERROR("Can't hash frame %u", nextIndex);

    LOG_TRACE("Frame %d/%u, %u bytes", frame.sequence_index, totalFrames, static_cast<unsigned>(frame.data.size));

    nextIndex++;
    if (nextIndex == totalFrames) {
        // The stream is spent, free the copy
        buffer.clear();
        buffer.shrink_to_fit();
    }
    return frame;
}
