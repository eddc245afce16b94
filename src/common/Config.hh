#ifndef _CONFIG_HH_
#define _CONFIG_HH_

#include "../inc/include.hh"

using namespace std;

class Config {
public:
    Config();
    ~Config();

    string _sys_conf_path;

    uint64_t _chunkSizeMB = DEFAULT_CHUNK_SIZE_MB;
    int _pktSize = DEFAULT_PKT_BASE;
    string _hashAlg = "sha256";
    bool _verbose = true;

    int parseConf(string path);
};

#endif
