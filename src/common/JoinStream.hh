#ifndef _JOIN_STREAM_HH_
#define _JOIN_STREAM_HH_

#include "../inc/include.hh"
#include "Config.hh"
#include "ChunkMeta.hh"
#include "MetaSerializer.hh"
#include "../storage/BaseFS.hh"
#include "../hashing/HashingHandler.hh"

#define MAX_REPORTED_MISSING 1000

/**
 * what a join produced
 * _status is only meaningful when join() returned SUCCESS
*/
class JoinReport {
public:
    string _outputPath;
    VerifyStatus _status;
    uint64_t _expectedSize;
    uint64_t _rebuiltSize;
    string _expectedDigest;
    string _rebuiltDigest;
    // first MAX_REPORTED_MISSING missing chunk paths, in index order
    vector<string> _missing;
    uint64_t _missingCount;

    JoinReport() {
        _status = VerifyStatus::Verified;
        _expectedSize = 0;
        _rebuiltSize = 0;
        _missingCount = 0;
    }
};

class JoinStream {
private:
    Config* _conf;
    BaseFS* _fs;
    HashingHandler* _hasher;

    int findMeta(string folder, const vector<string>& names, string* metaPath);
    int readMeta(string metaPath, ChunkMeta* meta);
    int checkChunks(string folder, const vector<string>& names, const ChunkMeta& meta,
                    JoinReport* report);
    int appendChunk(BaseFile* out, string chunkPath, vector<char>& buf, uint64_t* copied);

public:
    JoinStream(Config* conf, BaseFS* fs);
    ~JoinStream();
    int join(string folder, string outDir, JoinReport* report);
};

#endif
