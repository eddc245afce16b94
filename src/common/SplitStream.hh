#ifndef _SPLIT_STREAM_HH_
#define _SPLIT_STREAM_HH_

#include "../inc/include.hh"
#include "Config.hh"
#include "ChunkMeta.hh"
#include "MetaSerializer.hh"
#include "../storage/BaseFS.hh"
#include "../hashing/HashingHandler.hh"

/**
 * cuts a source file into <base>.partNNN files of chunkSize bytes plus
 * <base>.meta, all inside <outParent>/<base>_chunks
*/
class SplitStream {
private:
    Config* _conf;
    BaseFS* _fs;
    HashingHandler* _hasher;

    int writeChunk(BaseFile* src, string chunkPath, uint64_t chunkSize,
                   vector<char>& buf, uint64_t* written);
    int writeMeta(string metaPath, const ChunkMeta* meta);

public:
    SplitStream(Config* conf, BaseFS* fs);
    ~SplitStream();
    int split(string filepath, uint64_t chunkSize, string outParent,
              ChunkMeta* meta, string* folder);
};

#endif
