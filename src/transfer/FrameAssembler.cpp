#include "FrameAssembler.h"
#include "Digest.h"
#include "configuration.h"
#include "timing.h"
#include <stdio.h>
#include <string.h>

FrameAssembler::FrameAssembler(RedirectablePrint *_console) : console(_console) {}

void FrameAssembler::reset()
{
    state = STATE_IDLE;
    failure = FAILURE_NONE;
    buffer.clear();
    totalFrames = 0;
    remainingFrames = 0;
    newData = false;
    duration = 0;
}

int FrameAssembler::fail(Failure why)
{
    state = STATE_FAILED;
    failure = why;
    buffer.clear();
    remainingFrames = 0;
    newData = false;
    lastError = RECORD_TRANSFERERROR(why == FAILURE_WRONG_HASH ? TransferError::FRAME_INTEGRITY : TransferError::FRAME_SEQUENCE);
    return -1;
}

int FrameAssembler::handleFrame(const bletransfer_Frame &frame)
{
    if (frame.sequence_index < 0) {
        LOG_WARN("Frame with sequence index %d", frame.sequence_index);
        return fail(FAILURE_WRONG_SEQUENCE);
    }

    if (frame.sequence_index == 0) {
        if (state == STATE_RECEIVING)
            LOG_INFO("Frame 0 again, restart super-chunk (%u frames were still owed)", remainingFrames);
        if (frame.total_frames == 0) {
            LOG_WARN("Frame 0 declares an empty super-chunk");
            return fail(FAILURE_WRONG_SEQUENCE);
        }

        state = STATE_RECEIVING;
        failure = FAILURE_NONE;
        buffer.clear();
        newData = false;
        duration = 0;
        totalFrames = frame.total_frames;
        remainingFrames = totalFrames;
        startTime = timing::now();
    } else if (state != STATE_RECEIVING) {
        LOG_WARN("Frame %d arrived while not receiving", frame.sequence_index);
        return fail(FAILURE_WRONG_SEQUENCE);
    } else if (frame.total_frames != totalFrames ||
               remainingFrames + static_cast<uint32_t>(frame.sequence_index) != totalFrames) {
        LOG_WARN("Frame %d/%u out of sequence, %u of %u frames owed", frame.sequence_index, frame.total_frames,
                 remainingFrames, totalFrames);
        return fail(FAILURE_WRONG_SEQUENCE);
    }

    uint8_t hash[TRUNCATED_HASH_SIZE];
    if (frame.truncated_hash.size != TRUNCATED_HASH_SIZE || !Digest::truncatedHash(frame.data.bytes, frame.data.size, hash) ||
        memcmp(hash, frame.truncated_hash.bytes, TRUNCATED_HASH_SIZE) != 0) {
        LOG_WARN("Frame %d hash mismatch", frame.sequence_index);
        return fail(FAILURE_WRONG_HASH);
    }

    buffer.insert(buffer.end(), frame.data.bytes, frame.data.bytes + frame.data.size);
    remainingFrames--;
    LOG_TRACE("Frame %d ok, %u to go", frame.sequence_index, remainingFrames);

    if (remainingFrames == 0) {
        state = STATE_COMPLETE;
        duration = timing::now() - startTime;
        newData = true;
        LOG_DEBUG("Super-chunk complete, %u bytes in %u frames", static_cast<unsigned>(buffer.size()), totalFrames);

        if (superChunkReady.notifyObservers(&buffer) != 0)
            LOG_WARN("Consumer did not accept the super-chunk");
    }
    return static_cast<int>(remainingFrames);
}

const std::vector<uint8_t> &FrameAssembler::getData()
{
    newData = false;
    return buffer;
}

double FrameAssembler::getTransferDuration() const
{
    return state == STATE_COMPLETE ? duration : 0;
}

std::string FrameAssembler::toString() const
{
    char buf[96];
    switch (state) {
    case STATE_IDLE:
        return "idle";
    case STATE_RECEIVING:
        snprintf(buf, sizeof(buf), "transfer in progress (%u)", remainingFrames);
        return buf;
    case STATE_COMPLETE:
        snprintf(buf, sizeof(buf), "finished: %u bytes received in %.3f s = %.0f bytes/s", static_cast<unsigned>(buffer.size()),
                 duration, duration > 0 ? buffer.size() / duration : 0.0);
        return buf;
    case STATE_FAILED:
        return failure == FAILURE_WRONG_HASH ? "last error: wrong hash" : "last error: wrong sequence";
    }
    return "unknown";
}
