#include "FSCommon.h"
#include "RedirectablePrint.h"
#include "configuration.h"
#include "transfer/TransferCoordinator.h"
#include "transfer/TransferSettings.h"
#include <stdio.h>

static const char *statusName(bletransfer_TransferResponse_Status status)
{
    switch (status) {
    case bletransfer_TransferResponse_Status_IDLE:
        return "idle";
    case bletransfer_TransferResponse_Status_IN_PROGRESS:
        return "in progress";
    case bletransfer_TransferResponse_Status_FINISHED:
        return "finished";
    case bletransfer_TransferResponse_Status_ERROR:
        return "error";
    case bletransfer_TransferResponse_Status_FILE_NOT_FOUND:
        return "file not found";
    default:
        return "unknown";
    }
}

/**
 * Bring up the transfer service on a transfer root the way a device does at boot, and report what it found: the effective
 * configuration and any download that would be resumed.
 *
 * usage: bletransfer-status [transfer root]
 */
int main(int argc, char **argv)
{
    RedirectablePrint serialConsole(stderr);
    RedirectablePrint *console = &serialConsole;

    const char *root = argc > 1 ? argv[1] : ".";
    LOG_INFO("bletransfer %s, transfer root %s", APP_VERSION, root);

    if (!fsMkdirs(console, root)) {
        LOG_CRIT("Transfer root %s is not usable", root);
        return 1;
    }

    TransferSettings settings(console, root);
    settings.loadFromDisk();
    settings.applyLogSettings(console);

    TransferCoordinator coordinator(console, root, settings.config.mtu, settings.config.super_chunk_size,
                                    [console](const char *path, bletransfer_Target target) {
                                        if (path)
                                            LOG_INFO("Completed %s (target %d)", path, target);
                                        else
                                            LOG_WARN("Pending download failed verification");
                                    });

    bletransfer_TransferResponse resp = coordinator.getResponse();
    printf("mtu %u, super-chunk size %u\n", settings.config.mtu, settings.config.super_chunk_size);
    if (resp.total_super_chunks == 0) {
        printf("no download to resume\n");
        return 0;
    }

    printf("download %s: %s, %u/%u super-chunks, %lu bytes, %.0f s\n", resp.filename, statusName(resp.status),
           resp.next_super_chunk_index, resp.total_super_chunks, static_cast<unsigned long>(resp.bytes_transferred),
           resp.elapsed_seconds);
    return resp.status == bletransfer_TransferResponse_Status_ERROR ? 1 : 0;
}
