#include "UploadSession.h"
#include "Digest.h"
#include "FSCommon.h"
#include "concurrency/LockGuard.h"
#include "configuration.h"
#include "timing.h"
#include <string.h>

UploadSession::UploadSession(RedirectablePrint *_console, const char *rootDir, FrameSplitter *_splitter,
                             uint32_t _superChunkSize)
    : console(_console), uploadDir(buildPath(rootDir, UPLOAD_DIR)), splitter(_splitter), superChunkSize(_superChunkSize),
      reader(_console)
{
    if (!fsMkdirs(console, uploadDir.c_str()))
        LOG_ERROR("Upload directory %s is not usable", uploadDir.c_str());
}

void UploadSession::setSuperChunkSize(uint32_t size)
{
    concurrency::LockGuard g(&lock);
    if (size == 0) {
        LOG_ERROR("Super-chunk size must not be 0, keeping %u", superChunkSize);
        return;
    }
    superChunkSize = size;
}

void UploadSession::accept(const bletransfer_TransferRequest &request)
{
    concurrency::LockGuard g(&lock);

    if (request.file_hash.size == 0)
        startUpload(request);
    else
        acknowledge(request);
}

void UploadSession::startUpload(const bletransfer_TransferRequest &request)
{
    if (resp.status == bletransfer_TransferResponse_Status_IN_PROGRESS)
        LOG_WARN("Restarting upload, dropping %s at %u/%u", resp.filename, resp.next_super_chunk_index, resp.total_super_chunks);

    reader.close();
    chunk.clear();
    outstanding = false;
    lastError = TransferError::NONE;

    resp = bletransfer_TransferResponse_init_zero;
    strncpy(resp.filename, request.filename, sizeof(resp.filename) - 1);

    std::string path = buildPath(uploadDir, request.filename);
    if (!isPlainFilename(request.filename) || fsFileSize(path.c_str()) < 0) {
        LOG_WARN("Upload of '%s' requested, file not found", request.filename);
        lastError = RECORD_TRANSFERERROR(TransferError::FILE_NOT_FOUND);
        resp.status = bletransfer_TransferResponse_Status_FILE_NOT_FOUND;
        return;
    }

    if (!reader.open(path.c_str(), superChunkSize)) {
        lastError = RECORD_TRANSFERERROR(TransferError::STORAGE_FAILURE);
        resp.status = bletransfer_TransferResponse_Status_ERROR;
        return;
    }

    resp.total_super_chunks = reader.getChunkCount();
    resp.status = bletransfer_TransferResponse_Status_IN_PROGRESS;
    startTime = timing::now();
    LOG_INFO("New upload of %s, %lu bytes in %u super-chunks", request.filename, static_cast<unsigned long>(reader.getSize()),
             resp.total_super_chunks);
}

void UploadSession::acknowledge(const bletransfer_TransferRequest &request)
{
    if (resp.status != bletransfer_TransferResponse_Status_IN_PROGRESS) {
        LOG_WARN("Acknowledge for %s with no upload in progress, ignored", request.filename);
        return;
    }

    if (resp.next_super_chunk_index >= resp.total_super_chunks) {
        LOG_ERROR("Acknowledge beyond the last of %u super-chunks", resp.total_super_chunks);
        lastError = RECORD_TRANSFERERROR(TransferError::MALFORMED_HANDSHAKE);
        resp.status = bletransfer_TransferResponse_Status_ERROR;
        reader.close();
        outstanding = false;
        return;
    }

    if (!outstanding) {
        LOG_WARN("Acknowledge for super-chunk %u which was never sent, ignored", resp.next_super_chunk_index);
        return;
    }

    if (request.file_hash.size != resp.last_chunk_hash.size ||
        memcmp(request.file_hash.bytes, resp.last_chunk_hash.bytes, resp.last_chunk_hash.size) != 0) {
        LOG_WARN("Acknowledge token does not match super-chunk %u, ignored", resp.next_super_chunk_index);
        return;
    }

    outstanding = false;
    resp.next_super_chunk_index++;
    LOG_DEBUG("Super-chunk %u/%u of %s acknowledged", resp.next_super_chunk_index, resp.total_super_chunks, resp.filename);
}

/// Pull the next super-chunk off the file, or finish if there is none
void UploadSession::sendNext()
{
    if (!reader.next(chunk)) {
        if (reader.hasFailed() || resp.next_super_chunk_index != resp.total_super_chunks) {
            lastError = RECORD_TRANSFERERROR(TransferError::STORAGE_FAILURE);
            resp.status = bletransfer_TransferResponse_Status_ERROR;
            return;
        }

        resp.status = bletransfer_TransferResponse_Status_FINISHED;
        resp.last_chunk_hash.size = 0;
        resp.elapsed_seconds = timing::now() - startTime;
        LOG_INFO("Upload of %s finished, %lu bytes in %.1f s", resp.filename, static_cast<unsigned long>(resp.bytes_transferred),
                 resp.elapsed_seconds);
        return;
    }

    resp.last_chunk_hash.size = TRUNCATED_HASH_SIZE;
    if (!Digest::truncatedHash(chunk.data(), chunk.size(), resp.last_chunk_hash.bytes))
        LOG_ERROR("Can't hash super-chunk %u", resp.next_super_chunk_index);
    resp.bytes_transferred += chunk.size();
    outstanding = true;

    LOG_DEBUG("Sending super-chunk %u/%u (%u bytes)", resp.next_super_chunk_index, resp.total_super_chunks,
              static_cast<unsigned>(chunk.size()));
    if (!splitter->send(chunk.data(), chunk.size())) {
        lastError = RECORD_TRANSFERERROR(TransferError::MALFORMED_HANDSHAKE);
        resp.status = bletransfer_TransferResponse_Status_ERROR;
    }
}

bletransfer_TransferResponse UploadSession::response()
{
    concurrency::LockGuard g(&lock);

    if (resp.status == bletransfer_TransferResponse_Status_IN_PROGRESS) {
        if (!outstanding)
            sendNext();
        if (resp.status == bletransfer_TransferResponse_Status_IN_PROGRESS)
            resp.elapsed_seconds = timing::now() - startTime;
    }

    return resp;
}

void UploadSession::abandon()
{
    concurrency::LockGuard g(&lock);

    if (resp.status == bletransfer_TransferResponse_Status_IN_PROGRESS)
        LOG_WARN("Abandon upload of %s at %u/%u", resp.filename, resp.next_super_chunk_index, resp.total_super_chunks);

    reader.close();
    chunk.clear();
    outstanding = false;
    resp = bletransfer_TransferResponse_init_zero;
}

bool UploadSession::isInProgress()
{
    concurrency::LockGuard g(&lock);
    return resp.status == bletransfer_TransferResponse_Status_IN_PROGRESS;
}

double UploadSession::getTransferDuration()
{
    concurrency::LockGuard g(&lock);
    if (resp.status == bletransfer_TransferResponse_Status_IN_PROGRESS)
        return timing::now() - startTime;
    if (resp.status == bletransfer_TransferResponse_Status_FINISHED)
        return resp.elapsed_seconds;
    return 0;
}

TransferError UploadSession::getLastError()
{
    concurrency::LockGuard g(&lock);
    return lastError;
}
