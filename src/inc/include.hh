#ifndef _COMMON_HH_
#define _COMMON_HH_

#include <iostream>
#include <string>
#include <vector>
#include <set>
#include <chrono>
#include <fstream>
#include <memory>
#include <algorithm>
#include <sstream>
#include <iomanip>
#include <utility>

#include <cstring>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cctype>

#include <openssl/evp.h>

#include <sys/stat.h>
#include <sys/types.h>
#include <dirent.h>
#include <unistd.h>

#define DEFAULT_PKT_BASE 4194304
#define DEFAULT_CHUNK_SIZE_MB 50
#define BYTES_PER_MB (1024 * 1024)
// largest chunk size in MB whose byte count fits in 64 bits
#define MAX_CHUNK_SIZE_MB (UINT64_MAX / BYTES_PER_MB)

enum {
    SUCCESS = 0, ERR_NOT_FOUND, ERR_MISSING_CHUNKS, ERR_FORMAT, ERR_IO,
    ERR_CONFIG_FILE, ERR_INVALID_ARG, ERR_HASH_ALG
};

enum class VerifyStatus {
    Verified,
    SizeMismatch,
    HashMismatch
};

const char* errString(int code);

#endif
