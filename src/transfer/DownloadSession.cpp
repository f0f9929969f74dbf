#include "DownloadSession.h"
#include "Digest.h"
#include "FSCommon.h"
#include "SafeFile.h"
#include "concurrency/LockGuard.h"
#include "configuration.h"
#include "timing.h"
#include <stdio.h>
#include <string.h>

#define MARKER_FILE "request.proto"
#define ARTIFACT_PREFIX "chunk"
#define ARTIFACT_SUFFIX ".bin"

static bool sameHash(const bletransfer_TransferRequest &a, const bletransfer_TransferRequest &b)
{
    return a.file_hash.size == b.file_hash.size && memcmp(a.file_hash.bytes, b.file_hash.bytes, a.file_hash.size) == 0;
}

/// Names we use for our own bookkeeping can't be the target of a download
static bool isReservedName(const char *name)
{
    size_t len = strlen(name);
    return strcmp(name, MARKER_FILE) == 0 || (len > 4 && strcmp(name + len - 4, ".tmp") == 0) ||
           (strncmp(name, ARTIFACT_PREFIX, strlen(ARTIFACT_PREFIX)) == 0 && len > strlen(ARTIFACT_PREFIX ARTIFACT_SUFFIX) &&
            strcmp(name + len - strlen(ARTIFACT_SUFFIX), ARTIFACT_SUFFIX) == 0);
}

DownloadSession::DownloadSession(RedirectablePrint *_console, const char *rootDir, TransferCompleteCallback _onComplete)
    : console(_console), downloadDir(buildPath(rootDir, DOWNLOAD_DIR)), markerPath(buildPath(downloadDir, MARKER_FILE)),
      onComplete(_onComplete)
{
    loadFromDisk();
}

std::string DownloadSession::getArtifactPath(uint32_t index) const
{
    char name[32];
    snprintf(name, sizeof(name), ARTIFACT_PREFIX "%u" ARTIFACT_SUFFIX, index);
    return buildPath(downloadDir, name);
}

uint32_t DownloadSession::countArtifacts()
{
    uint32_t count = 0;
    while (fsExists(getArtifactPath(count).c_str()))
        count++;
    return count;
}

void DownloadSession::removeArtifacts()
{
    std::vector<std::string> names = listFiles(downloadDir.c_str(), ARTIFACT_PREFIX, ARTIFACT_SUFFIX);
    for (size_t i = 0; i < names.size(); i++) {
        const std::string &name = names[i];
        std::string digits = name.substr(strlen(ARTIFACT_PREFIX), name.size() - strlen(ARTIFACT_PREFIX ARTIFACT_SUFFIX));
        if (digits.empty() || digits.find_first_not_of("0123456789") != std::string::npos)
            continue;

        LOG_DEBUG("Delete %s", name.c_str());
        fsRemove(console, buildPath(downloadDir, name).c_str());
    }
}

void DownloadSession::loadFromDisk()
{
    Completion done;
    {
        concurrency::LockGuard g(&lock);

        request = bletransfer_TransferRequest_init_zero;
        resp = bletransfer_TransferResponse_init_zero;

        if (!fsMkdirs(console, downloadDir.c_str())) {
            lastError = RECORD_TRANSFERERROR(TransferError::STORAGE_FAILURE);
            return;
        }

        // Leftovers of writes that never got committed
        std::vector<std::string> temps = listFiles(downloadDir.c_str(), "", ".tmp");
        for (size_t i = 0; i < temps.size(); i++)
            fsRemove(console, buildPath(downloadDir, temps[i]).c_str());

        if (!fsExists(markerPath.c_str())) {
            LOG_DEBUG("No download to resume");
            removeArtifacts();
            return;
        }

        if (!restoreFromMarker(done)) {
            lastError = RECORD_TRANSFERERROR(TransferError::CORRUPT_RESUME_STATE);
            LOG_WARN("Discarding unusable resume state");
            fsRemove(console, markerPath.c_str());
            removeArtifacts();
            request = bletransfer_TransferRequest_init_zero;
            resp = bletransfer_TransferResponse_init_zero;
        }
    }
    fireCompletion(done);
}

/**
 * Load the marker and rebuild the response from the artifacts next to it.
 *
 * @return false if the marker does not describe a transfer we can continue
 */
bool DownloadSession::restoreFromMarker(Completion &done)
{
    bletransfer_TransferRequest saved = bletransfer_TransferRequest_init_zero;
    if (loadProto(console, markerPath.c_str(), bletransfer_TransferRequest_size, sizeof(saved), &bletransfer_TransferRequest_msg,
                  &saved) != LoadFileResult::LOAD_SUCCESS) {
        return false;
    }

    if (saved.total_super_chunks == 0 || saved.file_hash.size != DIGEST_SIZE || !isPlainFilename(saved.filename)) {
        LOG_ERROR("Resume marker holds an invalid request");
        return false;
    }

    uint32_t received = countArtifacts();
    if (received > saved.total_super_chunks) {
        LOG_ERROR("%u artifacts for a transfer of %u super-chunks", received, saved.total_super_chunks);
        return false;
    }

    request = saved;
    resp = bletransfer_TransferResponse_init_zero;
    strncpy(resp.filename, request.filename, sizeof(resp.filename) - 1);
    resp.total_super_chunks = request.total_super_chunks;
    resp.next_super_chunk_index = received;
    resp.status = bletransfer_TransferResponse_Status_IN_PROGRESS;

    if (received > 0) {
        long firstSize = fsFileSize(getArtifactPath(0).c_str());
        std::vector<uint8_t> last;
        if (firstSize < 0 || !readFile(console, getArtifactPath(received - 1).c_str(), last))
            return false;

        // Every super-chunk but the final one has the same size
        resp.bytes_transferred = static_cast<uint64_t>(firstSize) * received;
        resp.last_chunk_hash.size = DIGEST_SIZE;
        if (!Digest::hash(last.data(), last.size(), resp.last_chunk_hash.bytes))
            return false;
    }

    if (!fsModifiedTime(markerPath.c_str(), &startTime))
        startTime = timing::now();
    resp.elapsed_seconds = timing::now() - startTime;

    LOG_INFO("Resume download of %s at super-chunk %u/%u", request.filename, received, request.total_super_chunks);

    // Killed between writing the last super-chunk and joining them
    if (received == request.total_super_chunks)
        finalize(done);
    return true;
}

void DownloadSession::startFresh(const bletransfer_TransferRequest &r)
{
    request = r;
    resp = bletransfer_TransferResponse_init_zero;
    strncpy(resp.filename, request.filename, sizeof(resp.filename) - 1);
    resp.total_super_chunks = request.total_super_chunks;
    resp.status = bletransfer_TransferResponse_Status_IN_PROGRESS;
    startTime = timing::now();

    removeArtifacts();

    if (!fsMkdirs(console, downloadDir.c_str()) ||
        !saveProto(console, markerPath.c_str(), bletransfer_TransferRequest_size, &bletransfer_TransferRequest_msg, &request)) {
        lastError = RECORD_TRANSFERERROR(TransferError::STORAGE_FAILURE);
        resp.status = bletransfer_TransferResponse_Status_ERROR;
        return;
    }

    LOG_INFO("New download of %s, %u super-chunks", request.filename, request.total_super_chunks);
}

void DownloadSession::accept(const bletransfer_TransferRequest &r)
{
    Completion done;
    {
        concurrency::LockGuard g(&lock);

        if (!isPlainFilename(r.filename) || isReservedName(r.filename) || r.total_super_chunks == 0 ||
            r.file_hash.size != DIGEST_SIZE) {
            LOG_WARN("Rejecting download request for '%s' (%u super-chunks, %u byte hash)", r.filename, r.total_super_chunks,
                     static_cast<unsigned>(r.file_hash.size));
            request = r;
            resp = bletransfer_TransferResponse_init_zero;
            strncpy(resp.filename, r.filename, sizeof(resp.filename) - 1);
            resp.total_super_chunks = r.total_super_chunks;
            resp.status = bletransfer_TransferResponse_Status_ERROR;
            lastError = RECORD_TRANSFERERROR(TransferError::MALFORMED_HANDSHAKE);
            return;
        }

        if (resp.status == bletransfer_TransferResponse_Status_IN_PROGRESS && sameHash(r, request) &&
            strcmp(r.filename, request.filename) == 0) {
            LOG_DEBUG("Download of %s already in progress at %u/%u", r.filename, resp.next_super_chunk_index,
                      resp.total_super_chunks);
            return;
        }

        // A transfer abandoned earlier in this run may still have its marker on disk
        bletransfer_TransferRequest saved = bletransfer_TransferRequest_init_zero;
        if (fsExists(markerPath.c_str()) &&
            loadProto(console, markerPath.c_str(), bletransfer_TransferRequest_size, sizeof(saved),
                      &bletransfer_TransferRequest_msg, &saved) == LoadFileResult::LOAD_SUCCESS &&
            sameHash(r, saved) && strcmp(r.filename, saved.filename) == 0 && r.total_super_chunks == saved.total_super_chunks) {
            if (restoreFromMarker(done)) {
                lastError = TransferError::NONE;
            } else {
                startFresh(r);
            }
        } else {
            lastError = TransferError::NONE;
            startFresh(r);
        }
    }
    fireCompletion(done);
}

int DownloadSession::onNotify(const std::vector<uint8_t> *superChunk)
{
    return handleSuperChunk(superChunk->data(), superChunk->size()) < 0 ? 1 : 0;
}

int DownloadSession::handleSuperChunk(const uint8_t *data, size_t len)
{
    Completion done;
    int result;
    {
        concurrency::LockGuard g(&lock);

        if (resp.status != bletransfer_TransferResponse_Status_IN_PROGRESS) {
            LOG_WARN("Super-chunk of %u bytes arrived with no download in progress", static_cast<unsigned>(len));
            return -1;
        }

        if (resp.next_super_chunk_index >= resp.total_super_chunks) {
            LOG_ERROR("Super-chunk %u is beyond the declared %u", resp.next_super_chunk_index, resp.total_super_chunks);
            lastError = RECORD_TRANSFERERROR(TransferError::MALFORMED_HANDSHAKE);
            resp.status = bletransfer_TransferResponse_Status_ERROR;
            return -1;
        }

        uint32_t index = resp.next_super_chunk_index;
        if (!writeFile(console, getArtifactPath(index).c_str(), data, len)) {
            // Artifacts written so far and the marker stay for a later attempt
            lastError = RECORD_TRANSFERERROR(TransferError::STORAGE_FAILURE);
            resp.status = bletransfer_TransferResponse_Status_ERROR;
            return -1;
        }

        resp.last_chunk_hash.size = DIGEST_SIZE;
        if (!Digest::hash(data, len, resp.last_chunk_hash.bytes))
            LOG_ERROR("Can't hash super-chunk %u", index);

        resp.next_super_chunk_index++;
        resp.bytes_transferred += len;
        resp.elapsed_seconds = timing::now() - startTime;
        LOG_INFO("Stored super-chunk %u/%u of %s (%u bytes)", resp.next_super_chunk_index, resp.total_super_chunks,
                 request.filename, static_cast<unsigned>(len));

        if (resp.next_super_chunk_index == resp.total_super_chunks)
            finalize(done);

        result = static_cast<int>(resp.total_super_chunks - resp.next_super_chunk_index);
    }
    fireCompletion(done);
    return result;
}

/// Stream one artifact into the digest and the output file
bool DownloadSession::appendArtifact(uint32_t index, Digest &digest, SafeFile &out)
{
    std::string path = getArtifactPath(index);
    FILE *f = fopen(path.c_str(), "rb");
    if (!f) {
        LOG_ERROR("Could not open / read %s", path.c_str());
        return false;
    }

    uint8_t buf[4096];
    size_t n;
    bool okay = true;
    while (okay && (n = fread(buf, 1, sizeof(buf), f)) > 0)
        okay = digest.update(buf, n) && out.write(buf, n) == n;
    if (ferror(f))
        okay = false;
    fclose(f);

    if (!okay)
        LOG_ERROR("Error joining %s", path.c_str());
    return okay;
}

/**
 * Join all artifacts and compare against the declared file hash.
 *
 * On a match the output is committed and the artifacts go away.  On a mismatch nothing is written under the final name and the
 * artifacts stay for inspection.  The marker is removed either way, only a storage failure keeps it.
 */
void DownloadSession::finalize(Completion &done)
{
    std::string finalPath = buildPath(downloadDir, request.filename);
    LOG_INFO("All %u super-chunks received, verifying %s", request.total_super_chunks, finalPath.c_str());

    Digest digest;
    SafeFile out(console, finalPath.c_str());
    bool okay = out.isOpen();
    for (uint32_t i = 0; okay && i < request.total_super_chunks; i++)
        okay = appendArtifact(i, digest, out);

    uint8_t fileHash[DIGEST_SIZE];
    if (!okay || !digest.finalize(fileHash)) {
        out.discard();
        lastError = RECORD_TRANSFERERROR(TransferError::STORAGE_FAILURE);
        resp.status = bletransfer_TransferResponse_Status_ERROR;
        return;
    }

    resp.elapsed_seconds = timing::now() - startTime;
    done.pending = true;

    if (memcmp(fileHash, request.file_hash.bytes, DIGEST_SIZE) != 0) {
        out.discard();
        LOG_ERROR("File hash mismatch for %s, keeping super-chunks", request.filename);
        lastError = RECORD_TRANSFERERROR(TransferError::FILE_INTEGRITY);
        resp.status = bletransfer_TransferResponse_Status_ERROR;
        fsRemove(console, markerPath.c_str());
        done.success = false;
        done.target = bletransfer_Target_UNKNOWN;
        return;
    }

    if (!out.close()) {
        done.pending = false;
        lastError = RECORD_TRANSFERERROR(TransferError::STORAGE_FAILURE);
        resp.status = bletransfer_TransferResponse_Status_ERROR;
        return;
    }

    resp.status = bletransfer_TransferResponse_Status_FINISHED;
    removeArtifacts();
    fsRemove(console, markerPath.c_str());
    LOG_INFO("Download of %s finished, %lu bytes in %.1f s", request.filename,
             static_cast<unsigned long>(resp.bytes_transferred), resp.elapsed_seconds);

    done.success = true;
    done.path = finalPath;
    done.target = request.target;
}

void DownloadSession::fireCompletion(const Completion &done)
{
    if (!done.pending || !onComplete)
        return;

    onComplete(done.success ? done.path.c_str() : NULL, done.target);
}

bletransfer_TransferResponse DownloadSession::response()
{
    concurrency::LockGuard g(&lock);

    if (resp.status == bletransfer_TransferResponse_Status_IN_PROGRESS)
        resp.elapsed_seconds = timing::now() - startTime;

    if (resp.status == bletransfer_TransferResponse_Status_IDLE) {
        // No request accepted, so zero super-chunks: there is no transfer the controller could be asking about
        LOG_DEBUG("Number of super-chunks is zero, no download accepted");
        bletransfer_TransferResponse snapshot = resp;
        snapshot.status = bletransfer_TransferResponse_Status_ERROR;
        return snapshot;
    }

    if (resp.status != bletransfer_TransferResponse_Status_ERROR &&
        (resp.total_super_chunks == 0 || resp.next_super_chunk_index > resp.total_super_chunks)) {
        LOG_ERROR("Response at %u of %u super-chunks is malformed", resp.next_super_chunk_index, resp.total_super_chunks);
        lastError = RECORD_TRANSFERERROR(TransferError::MALFORMED_HANDSHAKE);
        resp.status = bletransfer_TransferResponse_Status_ERROR;
    }

    return resp;
}

void DownloadSession::abandon()
{
    concurrency::LockGuard g(&lock);

    if (resp.status == bletransfer_TransferResponse_Status_IN_PROGRESS)
        LOG_WARN("Abandon download of %s at %u/%u, resume state stays on disk", request.filename, resp.next_super_chunk_index,
                 resp.total_super_chunks);

    request = bletransfer_TransferRequest_init_zero;
    resp = bletransfer_TransferResponse_init_zero;
}

bool DownloadSession::isInProgress()
{
    concurrency::LockGuard g(&lock);
    return resp.status == bletransfer_TransferResponse_Status_IN_PROGRESS;
}

double DownloadSession::getTransferDuration()
{
    concurrency::LockGuard g(&lock);
    if (resp.status == bletransfer_TransferResponse_Status_IN_PROGRESS)
        return timing::now() - startTime;
    if (resp.status == bletransfer_TransferResponse_Status_FINISHED)
        return resp.elapsed_seconds;
    return 0;
}

uint64_t DownloadSession::getTransferredBytes()
{
    concurrency::LockGuard g(&lock);
    return resp.bytes_transferred;
}

TransferError DownloadSession::getLastError()
{
    concurrency::LockGuard g(&lock);
    return lastError;
}
