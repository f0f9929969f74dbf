#pragma once

#include "RedirectablePrint.h"
#include "bletransfer/transfer.pb.h"

// this file defines constants which come from transfer.options

// Tricky macro to let you find the sizeof a type member
#define member_size(type, member) sizeof(((type *)0)->member)

/// max number of payload bytes a single frame can carry - note, this value comes from transfer.options
#define MAX_FRAME_PAYLOAD (member_size(bletransfer_Frame, data.bytes))

/// helper function for encoding a record as a protobuf, failures are logged
/// returns the encoded packet size, or 0 if encoding failed
size_t pb_encode_to_bytes(RedirectablePrint *console, uint8_t *destbuf, size_t destbufsize, const pb_msgdesc_t *fields,
                          const void *src_struct);

/// helper function for decoding a record as a protobuf, we will return false if the decoding failed
bool pb_decode_from_bytes(RedirectablePrint *console, const uint8_t *srcbuf, size_t srcbufsize, const pb_msgdesc_t *fields,
                          void *dest_struct);

/// Read from a stdio FILE
bool readcb(pb_istream_t *stream, uint8_t *buf, size_t count);

/// Write to a SafeFile
bool writecb(pb_ostream_t *stream, const uint8_t *buf, size_t count);
