#ifndef _META_SERIALIZER_HH_
#define _META_SERIALIZER_HH_

#include "../inc/include.hh"
#include "ChunkMeta.hh"

class MetaSerializer {
public:
    static const char* KEY_NAME;
    static const char* KEY_NUM_CHUNKS;
    static const char* KEY_SIZE;
    static const char* KEY_CHUNK_SIZE;
    static const char* KEY_DIGEST;
    static const size_t SHA256_HEX_LEN = 64;
public:
    static void encode(const ChunkMeta* meta, string* text);
    // digestLen is the hex length the digest must have, 0 accepts any length
    static int decode(const string& text, ChunkMeta* meta, size_t digestLen = SHA256_HEX_LEN);
};

#endif
