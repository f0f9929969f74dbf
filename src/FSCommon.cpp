/**
 * @file FSCommon.cpp
 * @brief Common filesystem operations such as copying, renaming, listing and deleting files and directories, plus loading
 * and saving protobufs.
 *
 * Everything below the transfer root goes through these helpers, so the session code never talks to the OS directly.
 */
#include "FSCommon.h"
#include "SafeFile.h"
#include "transfer-pb-constants.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <dirent.h>
#include <pb_decode.h>
#include <pb_encode.h>
#include <stdio.h>
#include <sys/stat.h>
#include <unistd.h>

std::string buildPath(const std::string &parent, const std::string &child)
{
    if (parent.empty())
        return child;
    if (parent[parent.size() - 1] == '/')
        return parent + child;
    return parent + "/" + child;
}

bool isPlainFilename(const char *name)
{
    return name[0] != '\0' && strchr(name, '/') == NULL && strcmp(name, ".") != 0 && strcmp(name, "..") != 0;
}

bool fsMkdirs(RedirectablePrint *console, const char *dirname)
{
    std::string path(dirname);
    for (size_t pos = 1; pos <= path.size(); pos++) {
        if (pos != path.size() && path[pos] != '/')
            continue;

        std::string partial = path.substr(0, pos);
        if (mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
            LOG_ERROR("Can't create directory %s: %s", partial.c_str(), strerror(errno));
            return false;
        }
    }

    struct stat st;
    return stat(dirname, &st) == 0 && S_ISDIR(st.st_mode);
}

bool fsExists(const char *path)
{
    struct stat st;
    return stat(path, &st) == 0;
}

bool fsRemove(RedirectablePrint *console, const char *path)
{
    if (unlink(path) == 0 || errno == ENOENT)
        return true;

    LOG_ERROR("Can't remove %s: %s", path, strerror(errno));
    return false;
}

/**
 * @brief Copies a file from one location to another.
 *
 * @param from The path of the source file.
 * @param to The path of the destination file.
 * @return true if the file was successfully copied, false otherwise.
 */
bool copyFile(RedirectablePrint *console, const char *from, const char *to)
{
    unsigned char cbuffer[512];

    FILE *f1 = fopen(from, "rb");
    if (!f1) {
        LOG_ERROR("Failed to open source file %s", from);
        return false;
    }

    FILE *f2 = fopen(to, "wb");
    if (!f2) {
        LOG_ERROR("Failed to open destination file %s", to);
        fclose(f1);
        return false;
    }

    bool okay = true;
    size_t i;
    while ((i = fread(cbuffer, 1, sizeof(cbuffer), f1)) > 0) {
        if (fwrite(cbuffer, 1, i, f2) != i) {
            okay = false;
            break;
        }
    }
    if (ferror(f1))
        okay = false;

    fclose(f1);
    if (fclose(f2) != 0)
        okay = false;

    if (!okay)
        LOG_ERROR("Failed to copy %s to %s", from, to);
    return okay;
}

/**
 * Renames a file from pathFrom to pathTo, replacing pathTo if it exists.
 *
 * Falls back to copy and delete when the two paths are on different filesystems.
 */
bool renameFile(RedirectablePrint *console, const char *pathFrom, const char *pathTo)
{
    if (rename(pathFrom, pathTo) == 0)
        return true;

    if (errno == EXDEV) {
        // copyFile logs its own failures
        return copyFile(console, pathFrom, pathTo) && fsRemove(console, pathFrom);
    }

    LOG_ERROR("Can't rename %s to %s: %s", pathFrom, pathTo, strerror(errno));
    return false;
}

long fsFileSize(const char *path)
{
    struct stat st;
    if (stat(path, &st) != 0 || !S_ISREG(st.st_mode))
        return -1;
    return static_cast<long>(st.st_size);
}

bool fsModifiedTime(const char *path, double *mtime)
{
    struct stat st;
    if (stat(path, &st) != 0)
        return false;
    *mtime = static_cast<double>(st.st_mtim.tv_sec) + st.st_mtim.tv_nsec / 1e9;
    return true;
}

bool readFile(RedirectablePrint *console, const char *path, std::vector<uint8_t> &out)
{
    out.clear();

    FILE *f = fopen(path, "rb");
    if (!f) {
        LOG_ERROR("Could not open / read %s", path);
        return false;
    }

    uint8_t buf[4096];
    size_t n;
    while ((n = fread(buf, 1, sizeof(buf), f)) > 0)
        out.insert(out.end(), buf, buf + n);

    bool okay = !ferror(f);
    fclose(f);
    if (!okay)
        LOG_ERROR("Error reading %s", path);
    return okay;
}

bool writeFile(RedirectablePrint *console, const char *path, const uint8_t *data, size_t len)
{
    SafeFile f(console, path);
    if (!f.isOpen())
        return false;

    if (f.write(data, len) != len) {
        LOG_ERROR("Short write on %s", path);
        f.discard();
        return false;
    }
    return f.close();
}

static bool endsWith(const std::string &s, const char *suffix)
{
    size_t n = strlen(suffix);
    return s.size() >= n && s.compare(s.size() - n, n, suffix) == 0;
}

std::vector<std::string> listFiles(const char *dirname, const char *prefix, const char *suffix)
{
    std::vector<std::string> filenames = {};

    DIR *root = opendir(dirname);
    if (!root)
        return filenames;

    size_t prefixLen = strlen(prefix);
    struct dirent *entry;
    while ((entry = readdir(root)) != NULL) {
        std::string name(entry->d_name);
        if (name.compare(0, prefixLen, prefix) != 0 || !endsWith(name, suffix))
            continue;

        struct stat st;
        if (stat(buildPath(dirname, name).c_str(), &st) == 0 && S_ISREG(st.st_mode))
            filenames.push_back(name);
    }
    closedir(root);

    std::sort(filenames.begin(), filenames.end());
    return filenames;
}

void rmDir(RedirectablePrint *console, const char *dirname)
{
    DIR *root = opendir(dirname);
    if (!root)
        return;

    struct dirent *entry;
    while ((entry = readdir(root)) != NULL) {
        if (strcmp(entry->d_name, ".") == 0 || strcmp(entry->d_name, "..") == 0)
            continue;

        std::string path = buildPath(dirname, entry->d_name);
        struct stat st;
        if (lstat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
            rmDir(console, path.c_str());
        } else {
            LOG_DEBUG("Delete %s", path.c_str());
            fsRemove(console, path.c_str());
        }
    }
    closedir(root);

    LOG_DEBUG("Remove %s", dirname);
    if (rmdir(dirname) != 0)
        LOG_ERROR("Can't remove directory %s: %s", dirname, strerror(errno));
}

LoadFileResult loadProto(RedirectablePrint *console, const char *filename, size_t protoSize, size_t objSize,
                         const pb_msgdesc_t *fields, void *dest_struct)
{
    LoadFileResult state = LoadFileResult::OTHER_FAILURE;

    long fileSize = fsFileSize(filename);
    if (fileSize < 0) {
        LOG_INFO("%s not found", filename);
        return LoadFileResult::NOT_FOUND;
    }

    FILE *f = fopen(filename, "rb");
    if (f) {
        LOG_INFO("Load %s", filename);
        pb_istream_t stream = {&readcb, f, std::min(static_cast<size_t>(fileSize), protoSize)};

        memset(dest_struct, 0, objSize);
        if (static_cast<size_t>(fileSize) > protoSize) {
            LOG_ERROR("Error: %s is larger than any valid encoding", filename);
            state = LoadFileResult::DECODE_FAILED;
        } else if (!pb_decode(&stream, fields, dest_struct)) {
            LOG_ERROR("Error: can't decode protobuf %s", PB_GET_ERROR(&stream));
            state = LoadFileResult::DECODE_FAILED;
        } else {
            LOG_INFO("Loaded %s successfully", filename);
            state = LoadFileResult::LOAD_SUCCESS;
        }
        fclose(f);
    } else {
        LOG_ERROR("Could not open / read %s", filename);
    }
    return state;
}

bool saveProto(RedirectablePrint *console, const char *filename, size_t protoSize, const pb_msgdesc_t *fields,
               const void *dest_struct)
{
    bool okay = false;
    SafeFile f(console, filename);

    LOG_INFO("Save %s", filename);
    pb_ostream_t stream = {&writecb, &f, protoSize, 0};

    if (!pb_encode(&stream, fields, dest_struct)) {
        LOG_ERROR("Error: can't encode protobuf %s", PB_GET_ERROR(&stream));
        f.discard();
    } else {
        okay = f.close();
    }

    if (!okay) {
        LOG_ERROR("Can't write %s!", filename);
    }
    return okay;
}
