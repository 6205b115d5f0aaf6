#pragma once

// protocol.hpp -- Wire protocol definitions for blobstream

#include "platform.hpp"
#include <cstring>

// Magic: "BLS1"
static constexpr u8  BLOBSTREAM_MAGIC[4] = {'B', 'L', 'S', '1'};
static constexpr u8  BLOBSTREAM_VERSION  = 1;

static constexpr u32 MAX_PAYLOAD_LEN    = 16u * 1024u * 1024u;
static constexpr u32 DEFAULT_CHUNK_SIZE = 32u * 1024u;
// Leaves room for the chunk-delivery header, stream id and error text
static constexpr u32 MAX_CHUNK_SIZE     = 8u * 1024u * 1024u;
static constexpr u16 MAX_STREAM_ID_LEN  = 1024;

// ---- Message Types ----
enum class MsgType : u16 {
    MT_HELLO       = 0x0001,
    MT_HELLO_ACK   = 0x0002,
    MT_HELLO_NACK  = 0x0003,

    MT_STREAM_BEGIN = 0x0010,  // out-of-band announcement of a stream's byte length

    MT_CHUNK_SEND    = 0x0020,  // chunk-delivery, no response
    MT_CHUNK_INVOKE  = 0x0021,  // chunk-delivery, answered by MT_INVOKE_RESULT
    MT_INVOKE_RESULT = 0x0022,

    MT_ERROR_MSG    = 0x00FF,
};

// ---- Frame flags ----
enum FrameFlags : u16 {
    FLAG_COMPRESSED = 0x0001,  // chunk data is zstd-compressed
};

// ---- Frame Header (8 bytes, big-endian on wire) ----
struct FrameHeader {
    u16 msg_type;
    u16 flags;
    u32 payload_len;
};
static_assert(sizeof(FrameHeader) == 8, "FrameHeader must be 8 bytes");

// ---- Capabilities bits ----
enum Capabilities : u16 {
    CAP_COMPRESS = 0x0001,
};

// ---- Invoke status ----
enum class InvokeStatus : u8 {
    OK     = 0,
    FAILED = 1,  // receiver raised while handling; message carries the text
};

// ============================================================
// Packed structures (wire format, big-endian)
// ============================================================
#pragma pack(push, 1)

// HelloMsg: 8 bytes
struct HelloMsg {
    u8  magic[4];
    u8  version;
    u8  pad;
    u16 capabilities;
};
static_assert(sizeof(HelloMsg) == 8, "HelloMsg size mismatch");

// HelloAck: 4 bytes
struct HelloAck {
    u16 capabilities;  // agreed set
    u8  pad[2];
};
static_assert(sizeof(HelloAck) == 4, "HelloAck size mismatch");

// StreamBeginHdr: 16 bytes fixed + stream id
struct StreamBeginHdr {
    u64 byte_length;
    u16 stream_id_len;
    u8  pad[6];
};
static_assert(sizeof(StreamBeginHdr) == 16, "StreamBeginHdr size mismatch");

// ChunkDeliveryHdr: 32 bytes fixed + stream id + error text + data
struct ChunkDeliveryHdr {
    u64 invocation_id;  // 0 for MT_CHUNK_SEND
    i64 chunk_id;       // -1 = error sentinel
    u32 raw_len;        // uncompressed data length
    u32 data_len;       // bytes of data on the wire
    u16 stream_id_len;
    u16 error_len;
    u8  has_data;       // 0 = null data
    u8  has_error;      // 0 = null error
    u8  pad[2];
};
static_assert(sizeof(ChunkDeliveryHdr) == 32, "ChunkDeliveryHdr size mismatch");

// InvokeResultHdr: 16 bytes fixed + message
struct InvokeResultHdr {
    u64 invocation_id;
    u8  alive;
    u8  status;        // InvokeStatus
    u16 message_len;
    u8  pad[4];
};
static_assert(sizeof(InvokeResultHdr) == 16, "InvokeResultHdr size mismatch");

#pragma pack(pop)

// ---- Helpers ----

inline void hello_init(HelloMsg& h, u16 caps) {
    std::memcpy(h.magic, BLOBSTREAM_MAGIC, 4);
    h.version      = BLOBSTREAM_VERSION;
    h.pad          = 0;
    h.capabilities = caps;
}

inline bool hello_valid(const HelloMsg& h) {
    return std::memcmp(h.magic, BLOBSTREAM_MAGIC, 4) == 0 &&
           h.version == BLOBSTREAM_VERSION;
}
