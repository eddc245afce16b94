#include "MetaSerializer.hh"

const char* MetaSerializer::KEY_NAME = "original_name";
const char* MetaSerializer::KEY_NUM_CHUNKS = "num_chunks";
const char* MetaSerializer::KEY_SIZE = "original_size";
const char* MetaSerializer::KEY_CHUNK_SIZE = "chunk_size";
// the digest key keeps its name whatever algorithm produced the value
const char* MetaSerializer::KEY_DIGEST = "sha256";
const size_t MetaSerializer::SHA256_HEX_LEN;

static bool parseCount(const string& value, uint64_t* out) {
    if (value.empty())
        return false;
    uint64_t v = 0;
    for (size_t i = 0; i < value.size(); i++) {
        char c = value[i];
        if (c < '0' || c > '9')
            return false;
        uint64_t d = c - '0';
        if (v > (UINT64_MAX - d) / 10)
            return false;
        v = v * 10 + d;
    }
    *out = v;
    return true;
}

static bool isLowerHex(const string& value) {
    if (value.empty())
        return false;
    for (size_t i = 0; i < value.size(); i++) {
        char c = value[i];
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')))
            return false;
    }
    return true;
}

void MetaSerializer::encode(const ChunkMeta* meta, string* text) {
    stringstream ss;
    ss << KEY_NAME << "=" << meta->_originalName << "\n";
    ss << KEY_NUM_CHUNKS << "=" << meta->_numChunks << "\n";
    ss << KEY_SIZE << "=" << meta->_originalSize << "\n";
    ss << KEY_CHUNK_SIZE << "=" << meta->_chunkSize << "\n";
    ss << KEY_DIGEST << "=" << meta->_digest << "\n";
    *text = ss.str();
}

/**
 * parse key=value lines into meta
 * meta is left untouched unless the whole record is valid
*/
int MetaSerializer::decode(const string& text, ChunkMeta* meta, size_t digestLen) {
    const char* keys[] = {KEY_NAME, KEY_NUM_CHUNKS, KEY_SIZE, KEY_CHUNK_SIZE, KEY_DIGEST};
    const int nkeys = 5;
    string values[nkeys];
    bool seen[nkeys] = {false, false, false, false, false};

    stringstream ss(text);
    string line;
    int lineno = 0;
    while (getline(ss, line)) {
        lineno++;
        if (!line.empty() && line[line.size()-1] == '\r')
            line.erase(line.size()-1);
        if (line.empty())
            continue;
        size_t pos = line.find('=');
        if (pos == string::npos) {
            cerr << "[ERROR] metadata line " << lineno << " has no '=': " << line << endl;
            return ERR_FORMAT;
        }
        string key = line.substr(0, pos);
        string value = line.substr(pos+1);
        for (int i = 0; i < nkeys; i++) {
            if (key != keys[i])
                continue;
            if (seen[i]) {
                cerr << "[ERROR] metadata key " << key << " appears twice" << endl;
                return ERR_FORMAT;
            }
            seen[i] = true;
            values[i] = value;
        }
    }
    for (int i = 0; i < nkeys; i++) {
        if (!seen[i]) {
            cerr << "[ERROR] metadata key " << keys[i] << " is missing" << endl;
            return ERR_FORMAT;
        }
    }

    ChunkMeta tmp;
    tmp._originalName = values[0];
    if (tmp._originalName.empty() || tmp._originalName.find('/') != string::npos
            || tmp._originalName == "." || tmp._originalName == "..") {
        cerr << "[ERROR] metadata original_name is not a plain file name: " << tmp._originalName << endl;
        return ERR_FORMAT;
    }
    uint64_t* nums[] = {&tmp._numChunks, &tmp._originalSize, &tmp._chunkSize};
    for (int i = 0; i < 3; i++) {
        if (!parseCount(values[i+1], nums[i])) {
            cerr << "[ERROR] metadata " << keys[i+1] << " is not a non-negative integer: "
                 << values[i+1] << endl;
            return ERR_FORMAT;
        }
    }
    tmp._digest = values[4];
    if (!isLowerHex(tmp._digest)) {
        cerr << "[ERROR] metadata digest is not lowercase hex: " << tmp._digest << endl;
        return ERR_FORMAT;
    }
    if (digestLen != 0 && tmp._digest.size() != digestLen) {
        cerr << "[ERROR] metadata digest has " << tmp._digest.size() << " hex digits, expected "
             << digestLen << endl;
        return ERR_FORMAT;
    }
    if (tmp._chunkSize == 0) {
        cerr << "[ERROR] metadata chunk_size is zero" << endl;
        return ERR_FORMAT;
    }
    uint64_t expected = ChunkMeta::expectedChunks(tmp._originalSize, tmp._chunkSize);
    if (tmp._numChunks != expected) {
        cerr << "[ERROR] metadata num_chunks=" << tmp._numChunks << " but original_size="
             << tmp._originalSize << " and chunk_size=" << tmp._chunkSize
             << " need " << expected << " chunks" << endl;
        return ERR_FORMAT;
    }
    *meta = tmp;
    return SUCCESS;
}
