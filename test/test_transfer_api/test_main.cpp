#include "FSCommon.h"
#include "TestUtil.h"
#include "configuration.h"
#include "transfer/TransferAPI.h"

#include <string.h>
#include <unity.h>

/// Stands in for a BLE transport, counts the notifies it would send
class NotifyingAPI : public TransferAPI
{
  public:
    int notifies = 0;
    uint32_t lastFromDeviceNum = 0;

    NotifyingAPI(RedirectablePrint *console, TransferCoordinator *coordinator) : TransferAPI(console, coordinator) {}

  protected:
    virtual void onNowHasData(uint32_t fromDeviceNum) override
    {
        notifies++;
        lastFromDeviceNum = fromDeviceNum;
    }
};

/// A transport that answers every notify by polling the API right away, the way a BLE stack reacting to its own
/// notify would
class PollingAPI : public TransferAPI
{
  public:
    int notifies = 0;
    bletransfer_TransferResponse seen = bletransfer_TransferResponse_init_zero;
    bool seenDecoded = false;
    size_t firstFrameLen = 0;

    PollingAPI(RedirectablePrint *console, TransferCoordinator *coordinator) : TransferAPI(console, coordinator) {}

  protected:
    virtual void onNowHasData(uint32_t fromDeviceNum) override
    {
        notifies++;

        uint8_t respBuf[256];
        size_t len = getResponse(respBuf, sizeof(respBuf));
        seen = bletransfer_TransferResponse_init_zero;
        seenDecoded = len > 0 && pb_decode_from_bytes(console, respBuf, len, &bletransfer_TransferResponse_msg, &seen);

        uint8_t frameBuf[1024];
        firstFrameLen = available() ? getFrame(frameBuf, sizeof(frameBuf)) : 0;
    }
};

static std::string root;
static TransferCoordinator *coordinator;
static NotifyingAPI *api;
static uint8_t buf[1024];

static size_t encodeRequest(const char *filename, bletransfer_TransferRequest_Direction direction, uint32_t total,
                            const std::vector<uint8_t> &hash)
{
    bletransfer_TransferRequest r = bletransfer_TransferRequest_init_zero;
    strncpy(r.filename, filename, sizeof(r.filename) - 1);
    r.direction = direction;
    r.total_super_chunks = total;
    r.file_hash.size = hash.size();
    if (!hash.empty())
        memcpy(r.file_hash.bytes, hash.data(), hash.size());
    return pb_encode_to_bytes(console, buf, sizeof(buf), &bletransfer_TransferRequest_msg, &r);
}

static bletransfer_TransferResponse decodeResponse()
{
    bletransfer_TransferResponse resp = bletransfer_TransferResponse_init_zero;
    size_t len = api->getResponse(buf, sizeof(buf));
    TEST_ASSERT_TRUE(len > 0);
    TEST_ASSERT_TRUE(pb_decode_from_bytes(console, buf, len, &bletransfer_TransferResponse_msg, &resp));
    return resp;
}

void setUp(void)
{
    root = makeTempRoot();
    coordinator = new TransferCoordinator(console, root.c_str());
    api = new NotifyingAPI(console, coordinator);
}

void tearDown(void)
{
    delete api;
    delete coordinator;
    removeTree(root);
}

void test_response_before_any_request_is_error(void)
{
    bletransfer_TransferResponse resp = decodeResponse();
    TEST_ASSERT_EQUAL(bletransfer_TransferResponse_Status_ERROR, resp.status);
    TEST_ASSERT_EQUAL_UINT32(0, resp.total_super_chunks);
    TEST_ASSERT_FALSE(api->available());
    TEST_ASSERT_EQUAL(0, api->getFrame(buf, sizeof(buf)));
}

void test_malformed_request_is_rejected(void)
{
    // field 1, length 80, but only one byte follows
    const uint8_t garbage[] = {0x0a, 0x50, 'a'};
    TEST_ASSERT_FALSE(api->handleRequest(garbage, sizeof(garbage)));
    TEST_ASSERT_FALSE(api->handleFrame(garbage, sizeof(garbage)));
    TEST_ASSERT_EQUAL(bletransfer_TransferResponse_Status_ERROR, decodeResponse().status);
    TEST_ASSERT_FALSE(coordinator->getDownload().isInProgress());
}

void test_response_too_large_for_buffer(void)
{
    size_t len = encodeRequest("a-rather-long-file-name.bin", bletransfer_TransferRequest_Direction_CONTROLLER_TO_DEVICE, 4,
                               makePayload(DIGEST_SIZE));
    TEST_ASSERT_TRUE(api->handleRequest(buf, len));

    uint8_t tiny[4];
    TEST_ASSERT_EQUAL(0, api->getResponse(tiny, sizeof(tiny)));
}

void test_download_over_encoded_messages(void)
{
    std::vector<uint8_t> file = makeAsciiPayload(3000);
    size_t len = encodeRequest("readme.txt", bletransfer_TransferRequest_Direction_CONTROLLER_TO_DEVICE, 1, md5Of(file));
    TEST_ASSERT_TRUE(api->handleRequest(buf, len));
    TEST_ASSERT_EQUAL(bletransfer_TransferResponse_Status_IN_PROGRESS, decodeResponse().status);

    FrameSplitter controller(console);
    controller.send(file.data(), file.size());
    while (controller.available()) {
        bletransfer_Frame f = controller.nextFrame();
        len = pb_encode_to_bytes(console, buf, sizeof(buf), &bletransfer_Frame_msg, &f);
        TEST_ASSERT_TRUE(len > 0);
        TEST_ASSERT_TRUE(len <= DEFAULT_MTU);
        TEST_ASSERT_TRUE(api->handleFrame(buf, len));
    }

    bletransfer_TransferResponse resp = decodeResponse();
    TEST_ASSERT_EQUAL(bletransfer_TransferResponse_Status_FINISHED, resp.status);
    TEST_ASSERT_EQUAL_STRING("readme.txt", resp.filename);
    TEST_ASSERT_EQUAL_UINT64(3000, resp.bytes_transferred);

    std::vector<uint8_t> written = readTestFile(buildPath(coordinator->getDownload().getDownloadDir(), "readme.txt"));
    TEST_ASSERT_EQUAL(file.size(), written.size());
    TEST_ASSERT_EQUAL_MEMORY(file.data(), written.data(), file.size());

    // Nothing was sent our way
    TEST_ASSERT_EQUAL(0, api->notifies);
    TEST_ASSERT_EQUAL_UINT32(0, api->getFromDeviceNum());
}

void test_upload_over_encoded_messages(void)
{
    std::vector<uint8_t> file = makePayload(1500, 3);
    TEST_ASSERT_TRUE(writeTestFile(buildPath(coordinator->getUpload().getUploadDir(), "dump.bin"), file));

    size_t len = encodeRequest("dump.bin", bletransfer_TransferRequest_Direction_DEVICE_TO_CONTROLLER, 0, std::vector<uint8_t>());
    TEST_ASSERT_TRUE(api->handleRequest(buf, len));

    bletransfer_TransferResponse resp = decodeResponse();
    TEST_ASSERT_EQUAL(bletransfer_TransferResponse_Status_IN_PROGRESS, resp.status);
    TEST_ASSERT_EQUAL_UINT32(1, resp.total_super_chunks);
    TEST_ASSERT_EQUAL(TRUNCATED_HASH_SIZE, resp.last_chunk_hash.size);
    TEST_ASSERT_EQUAL(1, api->notifies);
    TEST_ASSERT_EQUAL_UINT32(0, api->lastFromDeviceNum);
    TEST_ASSERT_TRUE(api->available());

    FrameAssembler receiver(console);
    uint32_t expectedFrames = coordinator->getSplitter().getTotalFrames();
    while ((len = api->getFrame(buf, sizeof(buf))) > 0) {
        bletransfer_Frame f = bletransfer_Frame_init_zero;
        TEST_ASSERT_TRUE(pb_decode_from_bytes(console, buf, len, &bletransfer_Frame_msg, &f));
        TEST_ASSERT_TRUE(receiver.handleFrame(f) >= 0);
    }
    TEST_ASSERT_EQUAL_UINT32(expectedFrames, api->getFromDeviceNum());
    TEST_ASSERT_TRUE(receiver.hasNewData());
    const std::vector<uint8_t> &received = receiver.getData();
    TEST_ASSERT_EQUAL(file.size(), received.size());
    TEST_ASSERT_EQUAL_MEMORY(file.data(), received.data(), file.size());

    // Frames are not accepted while the device is sending
    FrameSplitter controller(console);
    controller.send(file.data(), 10);
    bletransfer_Frame f = controller.nextFrame();
    len = pb_encode_to_bytes(console, buf, sizeof(buf), &bletransfer_Frame_msg, &f);
    TEST_ASSERT_FALSE(api->handleFrame(buf, len));

    std::vector<uint8_t> token(resp.last_chunk_hash.bytes, resp.last_chunk_hash.bytes + resp.last_chunk_hash.size);
    len = encodeRequest("dump.bin", bletransfer_TransferRequest_Direction_DEVICE_TO_CONTROLLER, 0, token);
    TEST_ASSERT_TRUE(api->handleRequest(buf, len));

    resp = decodeResponse();
    TEST_ASSERT_EQUAL(bletransfer_TransferResponse_Status_FINISHED, resp.status);
    TEST_ASSERT_EQUAL_UINT32(1, resp.next_super_chunk_index);
    TEST_ASSERT_EQUAL(1, api->notifies);
}

void test_upload_of_missing_file(void)
{
    size_t len = encodeRequest("nothere.bin", bletransfer_TransferRequest_Direction_DEVICE_TO_CONTROLLER, 0, std::vector<uint8_t>());
    TEST_ASSERT_TRUE(api->handleRequest(buf, len));
    TEST_ASSERT_EQUAL(bletransfer_TransferResponse_Status_FILE_NOT_FOUND, decodeResponse().status);
    TEST_ASSERT_EQUAL(0, api->notifies);
}

void test_transport_may_call_back_from_notify(void)
{
    std::vector<uint8_t> file = makePayload(2500, 4);
    TransferCoordinator local(console, root.c_str(), DEFAULT_MTU, 1000);
    PollingAPI transport(console, &local);
    TEST_ASSERT_TRUE(writeTestFile(buildPath(local.getUpload().getUploadDir(), "poll.bin"), file));

    size_t len = encodeRequest("poll.bin", bletransfer_TransferRequest_Direction_DEVICE_TO_CONTROLLER, 0, std::vector<uint8_t>());
    TEST_ASSERT_TRUE(transport.handleRequest(buf, len));

    // Queues the first super-chunk, the notify polls again from inside
    len = transport.getResponse(buf, sizeof(buf));
    TEST_ASSERT_TRUE(len > 0);
    bletransfer_TransferResponse resp = bletransfer_TransferResponse_init_zero;
    TEST_ASSERT_TRUE(pb_decode_from_bytes(console, buf, len, &bletransfer_TransferResponse_msg, &resp));

    TEST_ASSERT_EQUAL(1, transport.notifies);
    TEST_ASSERT_TRUE(transport.seenDecoded);
    TEST_ASSERT_EQUAL(bletransfer_TransferResponse_Status_IN_PROGRESS, transport.seen.status);
    TEST_ASSERT_EQUAL_UINT32(0, transport.seen.next_super_chunk_index);
    TEST_ASSERT_EQUAL_UINT32(3, transport.seen.total_super_chunks);
    TEST_ASSERT_EQUAL_MEMORY(resp.last_chunk_hash.bytes, transport.seen.last_chunk_hash.bytes, TRUNCATED_HASH_SIZE);
    TEST_ASSERT_TRUE(transport.firstFrameLen > 0);
    TEST_ASSERT_EQUAL_UINT32(1, transport.getFromDeviceNum());

    // Acknowledge, the next super-chunk goes out through the same path
    std::vector<uint8_t> token(resp.last_chunk_hash.bytes, resp.last_chunk_hash.bytes + resp.last_chunk_hash.size);
    len = encodeRequest("poll.bin", bletransfer_TransferRequest_Direction_DEVICE_TO_CONTROLLER, 0, token);
    TEST_ASSERT_TRUE(transport.handleRequest(buf, len));
    TEST_ASSERT_TRUE(transport.getResponse(buf, sizeof(buf)) > 0);
    TEST_ASSERT_EQUAL(2, transport.notifies);
    TEST_ASSERT_EQUAL_UINT32(1, transport.seen.next_super_chunk_index);
}

int main(int argc, char **argv)
{
    initializeTestEnvironment();

    UNITY_BEGIN();
    RUN_TEST(test_response_before_any_request_is_error);
    RUN_TEST(test_malformed_request_is_rejected);
    RUN_TEST(test_response_too_large_for_buffer);
    RUN_TEST(test_download_over_encoded_messages);
    RUN_TEST(test_upload_over_encoded_messages);
    RUN_TEST(test_upload_of_missing_file);
    RUN_TEST(test_transport_may_call_back_from_notify);
    return UNITY_END();
}
