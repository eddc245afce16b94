#include "HashingHandler.hh"

HashingHandler::HashingHandler(Config* conf, BaseFS* fs): _conf(conf), _fs(fs) {
    _md = nullptr;
    if (conf->_hashAlg == "sha256") {
        _md = EVP_sha256();
    }
    else if (conf->_hashAlg == "sha1") {
        _md = EVP_sha1();
    }
    else if (conf->_hashAlg == "sha512") {
        _md = EVP_sha512();
    }
    else {
        cerr << "[ERROR] unrecognized hashing algorithm: " << _conf->_hashAlg << endl;
    }
    _ctx = EVP_MD_CTX_new();
}

HashingHandler::~HashingHandler() {
    if (_ctx)
        EVP_MD_CTX_free(_ctx);
}

int HashingHandler::init() {
    if (!_md)
        return ERR_HASH_ALG;
    if (!_ctx || EVP_DigestInit_ex(_ctx, _md, nullptr) != 1) {
        cerr << "[ERROR] failed to initialize " << _conf->_hashAlg << " context" << endl;
        return ERR_HASH_ALG;
    }
    return SUCCESS;
}

int HashingHandler::update(const char* data, int64_t size) {
    if (EVP_DigestUpdate(_ctx, data, size) != 1) {
        cerr << "[ERROR] digest update failed" << endl;
        return ERR_IO;
    }
    return SUCCESS;
}

int HashingHandler::finish(string* hex) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(_ctx, digest, &len) != 1) {
        cerr << "[ERROR] digest finalize failed" << endl;
        return ERR_IO;
    }
    *hex = toHex(digest, len);
    return SUCCESS;
}

/**
 * stream a file through the digest in packet_size blocks
 * hex is only written when the whole file was read
*/
int HashingHandler::digestFile(string path, string* hex) {
    if (!_fs->isFile(path)) {
        cerr << "[ERROR] cannot hash " << path << ": no such file" << endl;
        return ERR_NOT_FOUND;
    }
    int ret = init();
    if (ret != SUCCESS)
        return ret;

    unique_ptr<BaseFile> file(_fs->openFile(path, "read"));
    if (!file)
        return ERR_IO;

    vector<char> buf(_conf->_pktSize);
    while (true) {
        int64_t n = _fs->readFile(file.get(), buf.data(), buf.size());
        if (n < 0)
            return ERR_IO;
        if (n == 0)
            break;
        ret = update(buf.data(), n);
        if (ret != SUCCESS)
            return ret;
    }
    return finish(hex);
}

// 0 when no algorithm is configured
size_t HashingHandler::hexLength() {
    if (!_md)
        return 0;
    return EVP_MD_size(_md) * 2;
}

string HashingHandler::toHex(const unsigned char* digest, unsigned int len) {
    static const char* digits = "0123456789abcdef";
    string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; i++) {
        out.push_back(digits[digest[i] >> 4]);
        out.push_back(digits[digest[i] & 0x0f]);
    }
    return out;
}
