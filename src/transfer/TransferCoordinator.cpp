#include "TransferCoordinator.h"
#include "concurrency/LockGuard.h"
#include <utility>

TransferCoordinator::TransferCoordinator(RedirectablePrint *_console, const char *rootDir, uint32_t mtu, uint32_t superChunkSize,
                                         TransferCompleteCallback _onComplete)
    : console(_console), onComplete(_onComplete), assembler(_console), splitter(_console, mtu),
      download(_console, rootDir, [this](const char *path, bletransfer_Target target) { stashCompletion(path, target); }),
      upload(_console, rootDir, &splitter, superChunkSize)
{
    download.observe(&assembler.superChunkReady);

    // A download found complete on disk finalized while we were still being built, report it now
    Completion done;
    std::swap(done, completion);
    deliver(done, 0);
}

void TransferCoordinator::stashCompletion(const char *path, bletransfer_Target target)
{
    completion.pending = true;
    completion.success = path != NULL;
    completion.path = path ? path : "";
    completion.target = target;
}

void TransferCoordinator::deliver(Completion &done, uint32_t newFrames)
{
    if (newFrames)
        framesReady.notifyObservers(newFrames);

    if (done.pending && onComplete)
        onComplete(done.success ? done.path.c_str() : NULL, done.target);
}

void TransferCoordinator::configure(const bletransfer_TransferConfig &config)
{
    concurrency::LockGuard g(&lock);
    splitter.setMtu(config.mtu);
    upload.setSuperChunkSize(config.super_chunk_size);
}

bletransfer_TransferRequest_Direction TransferCoordinator::getDirection()
{
    concurrency::LockGuard g(&lock);
    return direction;
}

void TransferCoordinator::setRequest(const bletransfer_TransferRequest &request)
{
    Completion done;
    uint32_t newFrames;
    {
        concurrency::LockGuard g(&lock);

        bool toDevice = request.direction == bletransfer_TransferRequest_Direction_CONTROLLER_TO_DEVICE;

        if (direction != request.direction) {
            if (toDevice && upload.isInProgress()) {
                LOG_WARN("Download requested while an upload is running");
                upload.abandon();
            } else if (!toDevice && download.isInProgress()) {
                LOG_WARN("Upload requested while a download is running");
                download.abandon();
            }

            // Frames of the other direction are meaningless now
            assembler.reset();
            splitter.clear();
            direction = request.direction;
        }

        if (toDevice)
            download.accept(request);
        else
            upload.accept(request);

        std::swap(done, completion);
        newFrames = splitter.takeNewStream();
    }
    deliver(done, newFrames);
}

bletransfer_TransferResponse TransferCoordinator::getResponse()
{
    bletransfer_TransferResponse resp;
    uint32_t newFrames;
    {
        concurrency::LockGuard g(&lock);
        if (direction == bletransfer_TransferRequest_Direction_CONTROLLER_TO_DEVICE)
            resp = download.response();
        else
            resp = upload.response();
        newFrames = splitter.takeNewStream();
    }
    Completion none;
    deliver(none, newFrames);
    return resp;
}

int TransferCoordinator::handleFrame(const bletransfer_Frame &frame)
{
    Completion done;
    int result;
    {
        concurrency::LockGuard g(&lock);
        if (direction != bletransfer_TransferRequest_Direction_CONTROLLER_TO_DEVICE) {
            LOG_WARN("Frame %d received during an upload, ignored", frame.sequence_index);
            return -1;
        }
        result = assembler.handleFrame(frame);
        std::swap(done, completion);
    }
    deliver(done, 0);
    return result;
}

bletransfer_Frame TransferCoordinator::getFrame()
{
    concurrency::LockGuard g(&lock);
    return splitter.nextFrame();
}

bool TransferCoordinator::hasFrames()
{
    concurrency::LockGuard g(&lock);
    return splitter.available();
}
