#include "FSCommon.h"
#include "SafeFile.h"
#include "TestUtil.h"
#include "configuration.h"
#include "transfer-pb-constants.h"

#include <string.h>
#include <unity.h>

static std::string root;

void setUp(void)
{
    root = makeTempRoot();
}

void tearDown(void)
{
    removeTree(root);
}

void test_build_path(void)
{
    TEST_ASSERT_EQUAL_STRING("a/b", buildPath("a", "b").c_str());
    TEST_ASSERT_EQUAL_STRING("a/b", buildPath("a/", "b").c_str());
    TEST_ASSERT_EQUAL_STRING("b", buildPath("", "b").c_str());
}

void test_plain_filename(void)
{
    TEST_ASSERT_TRUE(isPlainFilename("firmware.bin"));
    TEST_ASSERT_TRUE(isPlainFilename(".hidden"));
    TEST_ASSERT_FALSE(isPlainFilename(""));
    TEST_ASSERT_FALSE(isPlainFilename("."));
    TEST_ASSERT_FALSE(isPlainFilename(".."));
    TEST_ASSERT_FALSE(isPlainFilename("../etc/passwd"));
    TEST_ASSERT_FALSE(isPlainFilename("sub/file"));
}

void test_mkdirs_and_rmdir(void)
{
    std::string deep = buildPath(root, "a/b/c");
    TEST_ASSERT_TRUE(fsMkdirs(console, deep.c_str()));
    TEST_ASSERT_TRUE(fsMkdirs(console, deep.c_str()));
    TEST_ASSERT_TRUE(writeTestFile(buildPath(deep, "x.bin"), makePayload(10)));

    std::string top = buildPath(root, "a");
    rmDir(console, top.c_str());
    TEST_ASSERT_FALSE(fsExists(top.c_str()));
}

void test_remove_missing_file_succeeds(void)
{
    std::string path = buildPath(root, "gone.bin");
    TEST_ASSERT_TRUE(fsRemove(console, path.c_str()));

    TEST_ASSERT_TRUE(writeTestFile(path, makePayload(5)));
    TEST_ASSERT_TRUE(fsRemove(console, path.c_str()));
    TEST_ASSERT_FALSE(fsExists(path.c_str()));
}

void test_file_size_and_mtime(void)
{
    std::string path = buildPath(root, "sized.bin");
    TEST_ASSERT_EQUAL(-1, fsFileSize(path.c_str()));

    double mtime = 0;
    TEST_ASSERT_FALSE(fsModifiedTime(path.c_str(), &mtime));

    TEST_ASSERT_TRUE(writeTestFile(path, makePayload(123)));
    TEST_ASSERT_EQUAL(123, fsFileSize(path.c_str()));
    TEST_ASSERT_TRUE(fsModifiedTime(path.c_str(), &mtime));
    TEST_ASSERT_TRUE(mtime > 0);

    // directories are not files
    TEST_ASSERT_EQUAL(-1, fsFileSize(root.c_str()));
}

void test_list_files_filters_and_sorts(void)
{
    const char *names[] = {"chunk2.bin", "chunk0.bin", "chunk1.bin.tmp", "request.proto", "chunk10.bin"};
    for (const char *name : names)
        TEST_ASSERT_TRUE(writeTestFile(buildPath(root, name), makePayload(4)));
    TEST_ASSERT_TRUE(fsMkdirs(console, buildPath(root, "chunkdir.bin").c_str()));

    std::vector<std::string> all = listFiles(root.c_str());
    TEST_ASSERT_EQUAL(5, all.size());

    std::vector<std::string> chunks = listFiles(root.c_str(), "chunk", ".bin");
    TEST_ASSERT_EQUAL(3, chunks.size());
    TEST_ASSERT_EQUAL_STRING("chunk0.bin", chunks[0].c_str());
    TEST_ASSERT_EQUAL_STRING("chunk10.bin", chunks[1].c_str());
    TEST_ASSERT_EQUAL_STRING("chunk2.bin", chunks[2].c_str());

    std::vector<std::string> temps = listFiles(root.c_str(), "", ".tmp");
    TEST_ASSERT_EQUAL(1, temps.size());

    TEST_ASSERT_EQUAL(0, listFiles(buildPath(root, "missing").c_str()).size());
}

void test_safefile_commit(void)
{
    std::string path = buildPath(root, "safe.bin");
    std::vector<uint8_t> data = makePayload(700);

    SafeFile f(console, path.c_str());
    TEST_ASSERT_TRUE(f.isOpen());
    TEST_ASSERT_EQUAL(699, f.write(data.data(), 699));
    TEST_ASSERT_EQUAL(1, f.write(data[699]));

    // Nothing visible under the real name before close
    TEST_ASSERT_FALSE(fsExists(path.c_str()));
    TEST_ASSERT_TRUE(f.close());

    TEST_ASSERT_FALSE(fsExists((path + ".tmp").c_str()));
    std::vector<uint8_t> back = readTestFile(path);
    TEST_ASSERT_EQUAL(700, back.size());
    TEST_ASSERT_EQUAL_MEMORY(data.data(), back.data(), data.size());
}

void test_safefile_discard_keeps_old_version(void)
{
    std::string path = buildPath(root, "keep.bin");
    std::vector<uint8_t> old = makePayload(50, 1);
    TEST_ASSERT_TRUE(writeTestFile(path, old));

    {
        SafeFile f(console, path.c_str());
        std::vector<uint8_t> replacement = makePayload(80, 2);
        f.write(replacement.data(), replacement.size());
        f.discard();
        TEST_ASSERT_FALSE(f.close());
    }
    {
        // never closed, the destructor throws it away
        SafeFile f(console, path.c_str());
        f.write(0x42);
    }

    TEST_ASSERT_FALSE(fsExists((path + ".tmp").c_str()));
    std::vector<uint8_t> back = readTestFile(path);
    TEST_ASSERT_EQUAL(old.size(), back.size());
    TEST_ASSERT_EQUAL_MEMORY(old.data(), back.data(), old.size());
}

void test_safefile_in_missing_directory(void)
{
    std::string path = buildPath(root, "nodir/file.bin");
    SafeFile f(console, path.c_str());
    TEST_ASSERT_FALSE(f.isOpen());
    TEST_ASSERT_EQUAL(0, f.write(0x01));
    TEST_ASSERT_FALSE(f.close());
    TEST_ASSERT_FALSE(writeFile(console, path.c_str(), (const uint8_t *)"x", 1));
}

void test_read_and_write_file(void)
{
    std::string path = buildPath(root, "plain.bin");
    std::vector<uint8_t> data = makePayload(2000, 5);
    TEST_ASSERT_TRUE(writeFile(console, path.c_str(), data.data(), data.size()));

    std::vector<uint8_t> back;
    TEST_ASSERT_TRUE(readFile(console, path.c_str(), back));
    TEST_ASSERT_EQUAL(data.size(), back.size());
    TEST_ASSERT_EQUAL_MEMORY(data.data(), back.data(), data.size());

    TEST_ASSERT_FALSE(readFile(console, buildPath(root, "none.bin").c_str(), back));
}

void test_rename_replaces_target(void)
{
    std::string from = buildPath(root, "from.bin");
    std::string to = buildPath(root, "to.bin");
    TEST_ASSERT_TRUE(writeTestFile(from, makePayload(30, 1)));
    TEST_ASSERT_TRUE(writeTestFile(to, makePayload(60, 2)));

    TEST_ASSERT_TRUE(renameFile(console, from.c_str(), to.c_str()));
    TEST_ASSERT_FALSE(fsExists(from.c_str()));
    TEST_ASSERT_EQUAL(30, fsFileSize(to.c_str()));

    std::string copy = buildPath(root, "copy.bin");
    TEST_ASSERT_TRUE(copyFile(console, to.c_str(), copy.c_str()));
    TEST_ASSERT_EQUAL(30, fsFileSize(copy.c_str()));
}

void test_proto_save_and_load(void)
{
    std::string path = buildPath(root, "request.proto");

    bletransfer_TransferRequest saved = bletransfer_TransferRequest_init_zero;
    strcpy(saved.filename, "image.bin");
    saved.total_super_chunks = 12;
    saved.file_hash.size = DIGEST_SIZE;
    memset(saved.file_hash.bytes, 0xab, DIGEST_SIZE);
    saved.target = bletransfer_Target_FIRMWARE;
    TEST_ASSERT_TRUE(
        saveProto(console, path.c_str(), bletransfer_TransferRequest_size, &bletransfer_TransferRequest_msg, &saved));

    bletransfer_TransferRequest loaded = bletransfer_TransferRequest_init_zero;
    TEST_ASSERT_EQUAL(LoadFileResult::LOAD_SUCCESS, loadProto(console, path.c_str(), bletransfer_TransferRequest_size,
                                                              sizeof(loaded), &bletransfer_TransferRequest_msg, &loaded));
    TEST_ASSERT_EQUAL_STRING("image.bin", loaded.filename);
    TEST_ASSERT_EQUAL_UINT32(12, loaded.total_super_chunks);
    TEST_ASSERT_EQUAL(DIGEST_SIZE, loaded.file_hash.size);
    TEST_ASSERT_EQUAL(bletransfer_Target_FIRMWARE, loaded.target);
}

void test_proto_load_failures(void)
{
    bletransfer_TransferRequest loaded = bletransfer_TransferRequest_init_zero;
    std::string path = buildPath(root, "request.proto");

    TEST_ASSERT_EQUAL(LoadFileResult::NOT_FOUND, loadProto(console, path.c_str(), bletransfer_TransferRequest_size,
                                                           sizeof(loaded), &bletransfer_TransferRequest_msg, &loaded));

    // truncated length delimited field
    const uint8_t garbage[] = {0x0a, 0x30, 'i', 'm', 'g'};
    TEST_ASSERT_TRUE(writeTestFile(path, std::vector<uint8_t>(garbage, garbage + sizeof(garbage))));
    TEST_ASSERT_EQUAL(LoadFileResult::DECODE_FAILED, loadProto(console, path.c_str(), bletransfer_TransferRequest_size,
                                                               sizeof(loaded), &bletransfer_TransferRequest_msg, &loaded));

    // larger than any valid encoding
    TEST_ASSERT_TRUE(writeTestFile(path, makePayload(bletransfer_TransferRequest_size + 1)));
    TEST_ASSERT_EQUAL(LoadFileResult::DECODE_FAILED, loadProto(console, path.c_str(), bletransfer_TransferRequest_size,
                                                               sizeof(loaded), &bletransfer_TransferRequest_msg, &loaded));
}

int main(int argc, char **argv)
{
    initializeTestEnvironment();

    UNITY_BEGIN();
    RUN_TEST(test_build_path);
    RUN_TEST(test_plain_filename);
    RUN_TEST(test_mkdirs_and_rmdir);
    RUN_TEST(test_remove_missing_file_succeeds);
    RUN_TEST(test_file_size_and_mtime);
    RUN_TEST(test_list_files_filters_and_sorts);
    RUN_TEST(test_safefile_commit);
    RUN_TEST(test_safefile_discard_keeps_old_version);
    RUN_TEST(test_safefile_in_missing_directory);
    RUN_TEST(test_read_and_write_file);
    RUN_TEST(test_rename_replaces_target);
    RUN_TEST(test_proto_save_and_load);
    RUN_TEST(test_proto_load_failures);
    return UNITY_END();
}
