#include "JoinStream.hh"
#include "../storage/FSUtil.hh"

JoinStream::JoinStream(Config* conf, BaseFS* fs) {
    _conf = conf;
    _fs = fs;
    _hasher = new HashingHandler(conf, fs);
}

JoinStream::~JoinStream() {
    if (_hasher)
        delete _hasher;
}

/**
 * pick the metadata file of a chunk set
 * with several candidates the lexicographically smallest name wins
*/
int JoinStream::findMeta(string folder, const vector<string>& names, string* metaPath) {
    vector<string> metas;
    string suffix(META_SUFFIX);
    for (size_t i = 0; i < names.size(); i++) {
        const string& n = names[i];
        if (n.size() > suffix.size()
                && n.compare(n.size() - suffix.size(), suffix.size(), suffix) == 0
                && _fs->isFile(FSUtil::joinPath(folder, n)))
            metas.push_back(n);
    }
    if (metas.empty()) {
        cerr << "[ERROR] no metadata file found in '" << folder << "'" << endl;
        return ERR_NOT_FOUND;
    }
    if (metas.size() > 1) {
        cerr << "[WARNING] " << metas.size() << " metadata files in '" << folder
             << "', using " << metas[0] << ", ignoring:";
        for (size_t i = 1; i < metas.size(); i++)
            cerr << " " << metas[i];
        cerr << endl;
    }
    *metaPath = FSUtil::joinPath(folder, metas[0]);
    return SUCCESS;
}

int JoinStream::readMeta(string metaPath, ChunkMeta* meta) {
    unique_ptr<BaseFile> in(_fs->openFile(metaPath, "read"));
    if (!in)
        return ERR_IO;
    string text;
    char buf[4096];
    while (true) {
        int64_t n = _fs->readFile(in.get(), buf, sizeof(buf));
        if (n < 0)
            return ERR_IO;
        if (n == 0)
            break;
        text.append(buf, n);
    }
    int ret = MetaSerializer::decode(text, meta, _hasher->hexLength());
    if (ret != SUCCESS)
        cerr << "[ERROR] cannot parse " << metaPath << endl;
    return ret;
}

static bool parseIndex(const string& digits, uint64_t* index) {
    if (digits.empty() || digits.size() > 19)
        return false;
    uint64_t v = 0;
    for (size_t i = 0; i < digits.size(); i++) {
        if (digits[i] < '0' || digits[i] > '9')
            return false;
        v = v * 10 + (digits[i] - '0');
    }
    *index = v;
    return true;
}

/**
 * every chunk named by meta must be a regular file in folder
 * present chunks are counted from the listing so the work is bounded by the
 * folder size, not by num_chunks
*/
int JoinStream::checkChunks(string folder, const vector<string>& names, const ChunkMeta& meta,
                            JoinReport* report) {
    string prefix = meta._originalName + PART_INFIX;
    set<uint64_t> present;
    for (size_t i = 0; i < names.size(); i++) {
        const string& n = names[i];
        if (n.size() <= prefix.size() || n.compare(0, prefix.size(), prefix) != 0)
            continue;
        uint64_t index = 0;
        if (!parseIndex(n.substr(prefix.size()), &index) || index >= meta._numChunks)
            continue;
        if (ChunkMeta::partName(meta._originalName, index) != n)
            continue;
        if (_fs->isFile(FSUtil::joinPath(folder, n)))
            present.insert(index);
    }

    report->_missing.clear();
    report->_missingCount = meta._numChunks - present.size();
    if (report->_missingCount == 0)
        return SUCCESS;

    for (uint64_t i = 0; i < meta._numChunks && report->_missing.size() < MAX_REPORTED_MISSING; i++) {
        if (!present.count(i))
            report->_missing.push_back(FSUtil::joinPath(folder, ChunkMeta::partName(meta._originalName, i)));
    }
    cerr << "[ERROR] missing chunk files:" << endl;
    for (size_t i = 0; i < report->_missing.size(); i++)
        cerr << "  - " << report->_missing[i] << endl;
    if (report->_missingCount > report->_missing.size())
        cerr << "  ... and " << report->_missingCount - report->_missing.size() << " more" << endl;
    return ERR_MISSING_CHUNKS;
}

int JoinStream::appendChunk(BaseFile* out, string chunkPath, vector<char>& buf, uint64_t* copied) {
    *copied = 0;
    unique_ptr<BaseFile> in(_fs->openFile(chunkPath, "read"));
    if (!in)
        return ERR_IO;
    while (true) {
        int64_t n = _fs->readFile(in.get(), buf.data(), buf.size());
        if (n < 0)
            return ERR_IO;
        if (n == 0)
            break;
        if (_fs->writeFile(out, buf.data(), n) != n)
            return ERR_IO;
        *copied += n;
    }
    return SUCCESS;
}

int JoinStream::join(string folder, string outDir, JoinReport* report) {
    if (!_fs->isDir(folder)) {
        cerr << "[ERROR] folder '" << folder << "' not found" << endl;
        return ERR_NOT_FOUND;
    }

    vector<string> names;
    int ret = _fs->listDir(folder, &names);
    if (ret != SUCCESS)
        return ret;

    string metaPath;
    ret = findMeta(folder, names, &metaPath);
    if (ret != SUCCESS)
        return ret;

    ChunkMeta meta;
    ret = readMeta(metaPath, &meta);
    if (ret != SUCCESS)
        return ret;

    if (_conf->_verbose) {
        cout << "[JoinStream] rebuilding '" << meta._originalName << "' from "
             << meta._numChunks << " chunks" << endl;
        cout << "[JoinStream] source folder: " << folder << "/" << endl;
    }

    // every chunk must be present before any output is created
    ret = checkChunks(folder, names, meta, report);
    if (ret != SUCCESS)
        return ret;

    string outputPath = FSUtil::joinPath(outDir, meta._originalName);
    if (_fs->exists(outputPath)) {
        outputPath = FSUtil::joinPath(outDir, "rebuilt_" + meta._originalName);
        cerr << "[WARNING] output file exists, using '" << outputPath << "'" << endl;
    }
    report->_outputPath = outputPath;
    report->_expectedSize = meta._originalSize;
    report->_expectedDigest = meta._digest;

    unique_ptr<BaseFile> out(_fs->openFile(outputPath, "write"));
    if (!out)
        return ERR_IO;

    vector<char> buf(_conf->_pktSize);
    for (uint64_t i = 0; i < meta._numChunks; i++) {
        string chunkName = ChunkMeta::partName(meta._originalName, i);
        uint64_t copied = 0;
        ret = appendChunk(out.get(), FSUtil::joinPath(folder, chunkName), buf, &copied);
        if (ret != SUCCESS) {
            cerr << "[ERROR] failed merging " << chunkName << ", '" << outputPath
                 << "' is incomplete" << endl;
            return ret;
        }
        if (copied != meta.chunkLength(i))
            cerr << "[WARNING] " << chunkName << " holds " << copied
                 << " bytes, expected " << meta.chunkLength(i) << endl;
        if (_conf->_verbose)
            cout << "[JoinStream] merged: " << chunkName << endl;
    }
    ret = _fs->closeFile(out.get());
    if (ret != SUCCESS)
        return ret;

    uint64_t rebuiltSize = 0;
    ret = _fs->getFileSize(outputPath, &rebuiltSize);
    if (ret != SUCCESS)
        return ret;
    report->_rebuiltSize = rebuiltSize;

    if (_conf->_verbose) {
        cout << "[JoinStream] rebuilding complete!" << endl;
        cout << "[JoinStream] original size: " << meta._originalSize << " bytes" << endl;
        cout << "[JoinStream] rebuilt size:  " << rebuiltSize << " bytes" << endl;
    }

    if (rebuiltSize != meta._originalSize) {
        report->_status = VerifyStatus::SizeMismatch;
        cerr << "[WARNING] size mismatch! expected " << meta._originalSize
             << " bytes, got " << rebuiltSize << " bytes, output kept at '"
             << outputPath << "'" << endl;
        return SUCCESS;
    }

    if (_conf->_verbose)
        cout << "[JoinStream] size matches, verifying hash..." << endl;
    ret = _hasher->digestFile(outputPath, &report->_rebuiltDigest);
    if (ret != SUCCESS)
        return ret;

    if (report->_rebuiltDigest != meta._digest) {
        report->_status = VerifyStatus::HashMismatch;
        cerr << "[WARNING] hash mismatch! file may be corrupted" << endl;
        cerr << "[WARNING] expected: " << meta._digest << endl;
        cerr << "[WARNING] got:      " << report->_rebuiltDigest << endl;
        return SUCCESS;
    }

    report->_status = VerifyStatus::Verified;
    if (_conf->_verbose) {
        cout << "[JoinStream] hash matches! file integrity verified" << endl;
        cout << "[JoinStream] output: " << outputPath << endl;
    }
    return SUCCESS;
}
