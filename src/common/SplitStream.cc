#include "SplitStream.hh"
#include "../storage/FSUtil.hh"

SplitStream::SplitStream(Config* conf, BaseFS* fs) {
    _conf = conf;
    _fs = fs;
    _hasher = new HashingHandler(conf, fs);
}

SplitStream::~SplitStream() {
    if (_hasher)
        delete _hasher;
}

/**
 * copy up to chunkSize bytes of src into chunkPath in packet sized blocks
 * the chunk file is only created once there is data for it
*/
int SplitStream::writeChunk(BaseFile* src, string chunkPath, uint64_t chunkSize,
                            vector<char>& buf, uint64_t* written) {
    *written = 0;
    unique_ptr<BaseFile> out;
    while (*written < chunkSize) {
        uint64_t want = min<uint64_t>(buf.size(), chunkSize - *written);
        int64_t n = _fs->readFile(src, buf.data(), want);
        if (n < 0)
            return ERR_IO;
        if (n == 0)
            break;
        if (!out) {
            out.reset(_fs->openFile(chunkPath, "write"));
            if (!out)
                return ERR_IO;
        }
        if (_fs->writeFile(out.get(), buf.data(), n) != n)
            return ERR_IO;
        *written += n;
    }
    if (out)
        return _fs->closeFile(out.get());
    return SUCCESS;
}

int SplitStream::writeMeta(string metaPath, const ChunkMeta* meta) {
    string text;
    MetaSerializer::encode(meta, &text);
    unique_ptr<BaseFile> out(_fs->openFile(metaPath, "write"));
    if (!out)
        return ERR_IO;
    if (_fs->writeFile(out.get(), text.data(), text.size()) != (int64_t)text.size())
        return ERR_IO;
    return _fs->closeFile(out.get());
}

int SplitStream::split(string filepath, uint64_t chunkSize, string outParent,
                       ChunkMeta* meta, string* folder) {
    if (chunkSize == 0) {
        cerr << "[ERROR] chunk size must be positive" << endl;
        return ERR_INVALID_ARG;
    }
    if (!_fs->isFile(filepath)) {
        cerr << "[ERROR] file '" << filepath << "' not found" << endl;
        return ERR_NOT_FOUND;
    }

    uint64_t fileSize = 0;
    int ret = _fs->getFileSize(filepath, &fileSize);
    if (ret != SUCCESS)
        return ret;
    string base = FSUtil::baseName(filepath);
    string folderName = base + CHUNKS_DIR_SUFFIX;
    string dir = FSUtil::joinPath(outParent, folderName);

    ret = _fs->makeDir(dir);
    if (ret != SUCCESS)
        return ret;

    if (_conf->_verbose) {
        cout << fixed << setprecision(2);
        cout << "[SplitStream] splitting '" << filepath << "' ("
             << (double)fileSize / BYTES_PER_MB << " MB)" << endl;
        cout << "[SplitStream] chunk size: " << (double)chunkSize / BYTES_PER_MB << " MB" << endl;
        cout << "[SplitStream] output folder: " << dir << "/" << endl;
        cout << "[SplitStream] calculating file hash..." << endl;
    }

    string digest;
    ret = _hasher->digestFile(filepath, &digest);
    if (ret != SUCCESS)
        return ret;

    unique_ptr<BaseFile> src(_fs->openFile(filepath, "read"));
    if (!src)
        return ERR_IO;

    vector<char> buf(min<uint64_t>(_conf->_pktSize, chunkSize));
    uint64_t chunkNum = 0;
    uint64_t total = 0;
    while (true) {
        string chunkName = ChunkMeta::partName(base, chunkNum);
        uint64_t written = 0;
        ret = writeChunk(src.get(), FSUtil::joinPath(dir, chunkName), chunkSize, buf, &written);
        if (ret != SUCCESS) {
            cerr << "[ERROR] failed writing " << chunkName << ", " << dir
                 << " is incomplete" << endl;
            return ret;
        }
        if (written == 0)
            break;
        total += written;
        if (_conf->_verbose)
            cout << "[SplitStream] created: " << chunkName << " ("
                 << (double)written / BYTES_PER_MB << " MB)" << endl;
        chunkNum++;
        if (written < chunkSize)
            break;
    }

    if (total != fileSize) {
        cerr << "[ERROR] '" << filepath << "' changed while splitting: expected "
             << fileSize << " bytes, read " << total << endl;
        return ERR_IO;
    }

    ChunkMeta tmp;
    tmp._originalName = base;
    tmp._numChunks = chunkNum;
    tmp._originalSize = fileSize;
    tmp._chunkSize = chunkSize;
    tmp._digest = digest;

    ret = writeMeta(FSUtil::joinPath(dir, ChunkMeta::metaName(base)), &tmp);
    if (ret != SUCCESS) {
        cerr << "[ERROR] failed writing metadata, " << dir << " is incomplete" << endl;
        return ret;
    }

    if (_conf->_verbose) {
        cout << "[SplitStream] split complete! created " << chunkNum << " chunks" << endl;
        cout << "[SplitStream] all files saved in: " << dir << "/" << endl;
        cout << "[SplitStream] original hash: " << digest << endl;
    }
    *meta = tmp;
    if (folder)
        *folder = dir;
    return SUCCESS;
}
