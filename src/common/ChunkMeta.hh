#ifndef _CHUNK_META_HH_
#define _CHUNK_META_HH_

#include "../inc/include.hh"

using namespace std;

#define META_SUFFIX ".meta"
#define PART_INFIX ".part"
#define CHUNKS_DIR_SUFFIX "_chunks"
#define PART_INDEX_WIDTH 3

/**
 * description of one chunk set, stored as <original_name>.meta
*/
class ChunkMeta {
public:
    string _originalName;
    uint64_t _numChunks;
    uint64_t _originalSize;
    uint64_t _chunkSize;
    string _digest;

    ChunkMeta() {
        _numChunks = 0;
        _originalSize = 0;
        _chunkSize = 0;
    }

    static uint64_t expectedChunks(uint64_t size, uint64_t chunkSize) {
        if (chunkSize == 0)
            return 0;
        return size / chunkSize + (size % chunkSize ? 1 : 0);
    }

    // indices below 1000 are zero-padded to 3 digits, larger ones are written in full
    static string partName(string base, uint64_t index) {
        stringstream ss;
        ss << base << PART_INFIX << setw(PART_INDEX_WIDTH) << setfill('0') << index;
        return ss.str();
    }

    static string metaName(string base) {
        return base + META_SUFFIX;
    }

    uint64_t chunkLength(uint64_t index) const {
        if (index + 1 < _numChunks)
            return _chunkSize;
        return _originalSize - _chunkSize * (_numChunks - 1);
    }
};

#endif
