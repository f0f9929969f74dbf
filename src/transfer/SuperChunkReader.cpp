#include "SuperChunkReader.h"
#include "FSCommon.h"
#include "configuration.h"

SuperChunkReader::SuperChunkReader(RedirectablePrint *_console) : console(_console) {}

SuperChunkReader::~SuperChunkReader()
{
    close();
}

bool SuperChunkReader::open(const char *_path, uint32_t _chunkSize)
{
    close();
    path = _path;
    chunkSize = _chunkSize;
    offset = 0;
    failed = false;

    long fileSize = fsFileSize(_path);
    if (fileSize < 0 || chunkSize == 0) {
        size = 0;
        return false;
    }

    f = fopen(_path, "rb");
    if (!f) {
        LOG_ERROR("Could not open / read %s", _path);
        size = 0;
        return false;
    }

    size = static_cast<uint64_t>(fileSize);
    LOG_DEBUG("Reading %s, %lu bytes in %u super-chunks", _path, static_cast<unsigned long>(size), getChunkCount());
    return true;
}

void SuperChunkReader::close()
{
    if (f) {
        fclose(f);
        f = NULL;
    }
}

bool SuperChunkReader::next(std::vector<uint8_t> &out)
{
    out.clear();
    if (isExhausted())
        return false;

    uint64_t left = size - offset;
    size_t want = left < chunkSize ? static_cast<size_t>(left) : chunkSize;
    out.resize(want);

    size_t got = fread(out.data(), 1, want, f);
    out.resize(got);
    offset += got;

    if (got < want) {
        // The file shrank or the read failed, either way there is nothing more to hand out
        LOG_ERROR("Short read on %s at offset %lu (%u of %u bytes)", path.c_str(), static_cast<unsigned long>(offset),
                  static_cast<unsigned>(got), static_cast<unsigned>(want));
        failed = true;
        close();
        return false;
    }

    if (offset >= size)
        close();
    return true;
}
