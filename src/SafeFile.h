#pragma once

#include "RedirectablePrint.h"
#include <stdint.h>
#include <stdio.h>
#include <string>

/**
 * This class provides 'safe'/paranoid file writing.
 *
 * A transfer root may live on flaky storage and a process may be killed at any moment, so we never write a canonical file
 * in place.  This class provides a restricted (append only) writing API.
 *
 * Notably:
 * - everything goes to <filename>.tmp first
 * - we keep a simple xor hash of all bytes that were written
 * - We do not allow seeking (because we want to maintain our hash)
 * - close() rereads the temp file to confirm the hash matches and then atomically replaces any old version of the file
 * - discard() (or destroying a file that was never closed) throws the temp file away and leaves the old version alone
 */
class SafeFile
{
  public:
    SafeFile(RedirectablePrint *console, const char *filepath);
    ~SafeFile();

    SafeFile(const SafeFile &) = delete;
    SafeFile &operator=(const SafeFile &) = delete;

    /// false if the temp file could not be created
    bool isOpen() const { return f != NULL; }

    size_t write(uint8_t ch);
    size_t write(const uint8_t *buffer, size_t size);

    /**
     * Atomically close the file (deleting any old versions) and readback the contents to confirm the hash matches
     *
     * @return false for failure
     */
    bool close();

    /// Drop everything written so far
    void discard();

  private:
    /// Read our (closed) tempfile back in and compare the hash
    bool testReadback();

    RedirectablePrint *console;
    std::string filename;
    std::string filenameTmp;
    FILE *f;
    uint8_t hash = 0;
    bool writeFailed = false;
};
