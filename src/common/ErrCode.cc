#include "../inc/include.hh"

const char* errString(int code) {
    switch (code) {
        case SUCCESS: return "success";
        case ERR_NOT_FOUND: return "not found";
        case ERR_MISSING_CHUNKS: return "missing chunk files";
        case ERR_FORMAT: return "malformed metadata";
        case ERR_IO: return "I/O error";
        case ERR_CONFIG_FILE: return "bad config file";
        case ERR_INVALID_ARG: return "invalid argument";
        case ERR_HASH_ALG: return "unsupported hash algorithm";
        default: return "unknown error";
    }
}
