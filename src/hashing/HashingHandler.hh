#ifndef _HASHING_HANDLER_HH_
#define _HASHING_HANDLER_HH_

#include "../inc/include.hh"
#include "../common/Config.hh"
#include "../storage/BaseFS.hh"

class HashingHandler {
public:
    Config* _conf;
    const EVP_MD* _md;

    HashingHandler(Config* conf, BaseFS* fs);
    ~HashingHandler();

    int init();
    int update(const char* data, int64_t size);
    int finish(string* hex);

    int digestFile(string path, string* hex);
    size_t hexLength();

    static string toHex(const unsigned char* digest, unsigned int len);

private:
    BaseFS* _fs;
    EVP_MD_CTX* _ctx;

    HashingHandler(const HashingHandler&);
    HashingHandler& operator=(const HashingHandler&);
};

#endif
