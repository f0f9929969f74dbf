#pragma once

#include "RedirectablePrint.h"
#include "configuration.h"
#include <pb.h>
#include <string>
#include <vector>

enum LoadFileResult {
    // Successfully opened the file
    LOAD_SUCCESS = 1,
    // File does not exist
    NOT_FOUND = 2,
    // File exists, but could not decode protobufs
    DECODE_FAILED = 4,
    // File exists, but open failed for some reason
    OTHER_FAILURE = 5
};

// Host filesystem API.  Helpers that can fail log through the supplied console.

/// parent + "/" + child, without doubling the separator
std::string buildPath(const std::string &parent, const std::string &child);

/// A bare file name: not empty, no directory separator, not "." or ".."
bool isPlainFilename(const char *name);

/// Create a directory and any missing parents, true if it exists afterwards
bool fsMkdirs(RedirectablePrint *console, const char *dirname);
bool fsExists(const char *path);
/// Remove a file, true if it is gone afterwards (also when it never existed)
bool fsRemove(RedirectablePrint *console, const char *path);
bool copyFile(RedirectablePrint *console, const char *from, const char *to);
bool renameFile(RedirectablePrint *console, const char *pathFrom, const char *pathTo);

/// Size in bytes, or -1 if the file can't be stat'ed
long fsFileSize(const char *path);

/// Last modification time in seconds since the epoch, false if the file can't be stat'ed
bool fsModifiedTime(const char *path, double *mtime);

bool readFile(RedirectablePrint *console, const char *path, std::vector<uint8_t> &out);

/// Write a whole file through SafeFile
bool writeFile(RedirectablePrint *console, const char *path, const uint8_t *data, size_t len);

/// Names (not paths) of the regular files in dirname that start with prefix and end with suffix, sorted
std::vector<std::string> listFiles(const char *dirname, const char *prefix = "", const char *suffix = "");

/// Delete dirname and everything below it
void rmDir(RedirectablePrint *console, const char *dirname);

LoadFileResult loadProto(RedirectablePrint *console, const char *filename, size_t protoSize, size_t objSize,
                         const pb_msgdesc_t *fields, void *dest_struct);

bool saveProto(RedirectablePrint *console, const char *filename, size_t protoSize, const pb_msgdesc_t *fields,
               const void *dest_struct);
