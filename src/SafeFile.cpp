#include "SafeFile.h"
#include "FSCommon.h"
#include "configuration.h"

SafeFile::SafeFile(RedirectablePrint *_console, const char *_filename)
    : console(_console), filename(_filename), filenameTmp(std::string(_filename) + ".tmp")
{
    LOG_DEBUG("Opening %s", filenameTmp.c_str());
    f = fopen(filenameTmp.c_str(), "wb");
    if (!f)
        LOG_ERROR("Can't create %s", filenameTmp.c_str());
}

SafeFile::~SafeFile()
{
    if (f) {
        LOG_WARN("%s was never closed, discarding it", filename.c_str());
        discard();
    }
}

size_t SafeFile::write(uint8_t ch)
{
    return write(&ch, 1);
}

size_t SafeFile::write(const uint8_t *buffer, size_t size)
{
    if (!f)
        return 0;

    for (size_t i = 0; i < size; i++) {
        hash ^= buffer[i];
    }
    size_t written = fwrite(buffer, 1, size, f);
    if (written != size)
        writeFailed = true;
    return written;
}

bool SafeFile::close()
{
    if (!f)
        return false;

    bool flushed = (fclose(f) == 0);
    f = NULL;

    if (!flushed || writeFailed) {
        LOG_ERROR("Error writing %s", filenameTmp.c_str());
        fsRemove(console, filenameTmp.c_str());
        return false;
    }

    if (!testReadback()) {
        fsRemove(console, filenameTmp.c_str());
        return false;
    }

    // rename() replaces the old version in one step
    if (!renameFile(console, filenameTmp.c_str(), filename.c_str())) {
        LOG_ERROR("Error: can't rename %s", filenameTmp.c_str());
        return false;
    }

    return true;
}

void SafeFile::discard()
{
    if (f) {
        fclose(f);
        f = NULL;
    }
    fsRemove(console, filenameTmp.c_str());
}

bool SafeFile::testReadback()
{
    FILE *f2 = fopen(filenameTmp.c_str(), "rb");
    if (!f2) {
        LOG_ERROR("Can't open tmp file for readback");
        return false;
    }

    int c = 0;
    uint8_t test_hash = 0;
    while ((c = fgetc(f2)) != EOF) {
        test_hash ^= (uint8_t)c;
    }
    fclose(f2);

    if (test_hash != hash) {
        LOG_ERROR("Readback failed hash mismatch");
        return false;
    }

    return true;
}
