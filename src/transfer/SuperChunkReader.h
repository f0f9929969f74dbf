#pragma once

#include "RedirectablePrint.h"
#include <stdint.h>
#include <stdio.h>
#include <string>
#include <vector>

/**
 * Cursor over a file that hands it out one super-chunk at a time.
 *
 * The file size is sampled by open(), so a file of S bytes always yields ceil(S / chunkSize) chunks even if it grows while
 * we read.  The last chunk may be short.
 */
class SuperChunkReader
{
  public:
    explicit SuperChunkReader(RedirectablePrint *console);
    ~SuperChunkReader();

    SuperChunkReader(const SuperChunkReader &) = delete;
    SuperChunkReader &operator=(const SuperChunkReader &) = delete;

    bool open(const char *path, uint32_t chunkSize);
    void close();

    /**
     * Read the next super-chunk into out
     *
     * @return false once the file is used up (or on a read error, see hasFailed)
     */
    bool next(std::vector<uint8_t> &out);

    bool isExhausted() const { return f == NULL || offset >= size; }
    bool hasFailed() const { return failed; }

    uint64_t getSize() const { return size; }
    uint32_t getChunkCount() const { return chunkSize ? static_cast<uint32_t>((size + chunkSize - 1) / chunkSize) : 0; }

  private:
    RedirectablePrint *console;
    std::string path;
    FILE *f = NULL;
    uint32_t chunkSize = 0;
    uint64_t size = 0;
    uint64_t offset = 0;
    bool failed = false;
};
