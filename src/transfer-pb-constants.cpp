#include "transfer-pb-constants.h"
#include "SafeFile.h"
#include "configuration.h"
#include <pb_decode.h>
#include <pb_encode.h>
#include <stdio.h>

size_t pb_encode_to_bytes(RedirectablePrint *console, uint8_t *destbuf, size_t destbufsize, const pb_msgdesc_t *fields,
                          const void *src_struct)
{
    pb_ostream_t stream = pb_ostream_from_buffer(destbuf, destbufsize);
    if (!pb_encode(&stream, fields, src_struct)) {
        LOG_ERROR("Error: can't encode protobuf %s", PB_GET_ERROR(&stream));
        return 0;
    } else {
        return stream.bytes_written;
    }
}

bool pb_decode_from_bytes(RedirectablePrint *console, const uint8_t *srcbuf, size_t srcbufsize, const pb_msgdesc_t *fields,
                          void *dest_struct)
{
    pb_istream_t stream = pb_istream_from_buffer(srcbuf, srcbufsize);
    if (!pb_decode(&stream, fields, dest_struct)) {
        LOG_ERROR("Error: can't decode protobuf %s", PB_GET_ERROR(&stream));
        return false;
    } else {
        return true;
    }
}

bool readcb(pb_istream_t *stream, uint8_t *buf, size_t count)
{
    FILE *file = (FILE *)stream->state;

    if (buf == NULL) {
        while (count && fgetc(file) != EOF)
            count--;
        return count == 0;
    }

    bool status = (fread(buf, 1, count, file) == count);

    if (feof(file))
        stream->bytes_left = 0;

    return status;
}

bool writecb(pb_ostream_t *stream, const uint8_t *buf, size_t count)
{
    SafeFile *file = (SafeFile *)stream->state;
    return file->write(buf, count) == count;
}
