#include "LocalFS.hh"

LocalFS::LocalFS(Config* conf) {
    _conf = conf;
}

LocalFS::~LocalFS() {
}

/**
 * mode "read"/"r" opens an existing file, "write"/"w" creates or truncates
 * the returned file closes itself when deleted
*/
LocalFile* LocalFS::openFile(string filename, string mode) {
    const char* fmode = nullptr;
    if (mode == "read" || mode == "r") {
        fmode = "rb";
    }
    else if (mode == "write" || mode == "w") {
        fmode = "wb";
    }
    else {
        cerr << "[ERROR] unrecognized open mode " << mode << " for " << filename << endl;
        return nullptr;
    }

    FILE* fp = fopen(filename.c_str(), fmode);
    if (!fp) {
        cerr << "[ERROR] file cannot open! " << filename << ": " << strerror(errno) << endl;
        return nullptr;
    }
    return new LocalFile(filename, mode, fp);
}

int64_t LocalFS::readFile(BaseFile* file, char* buffer, int64_t len) {
    LocalFile* lf = static_cast<LocalFile*>(file);
    if (!lf || !lf->_fp)
        return -ERR_IO;
    size_t n = fread(buffer, 1, len, lf->_fp);
    if (n < (size_t)len && ferror(lf->_fp)) {
        cerr << "[ERROR] read failed on " << lf->_filename << ": " << strerror(errno) << endl;
        return -ERR_IO;
    }
    return n;
}

int64_t LocalFS::writeFile(BaseFile* file, const char* buffer, int64_t len) {
    LocalFile* lf = static_cast<LocalFile*>(file);
    if (!lf || !lf->_fp)
        return -ERR_IO;
    size_t n = fwrite(buffer, 1, len, lf->_fp);
    if (n != (size_t)len) {
        cerr << "[ERROR] write failed on " << lf->_filename << ": " << strerror(errno) << endl;
        return -ERR_IO;
    }
    return n;
}

/**
 * flush and release the handle, reporting errors the buffered writes hid
*/
int LocalFS::closeFile(BaseFile* file) {
    LocalFile* lf = static_cast<LocalFile*>(file);
    if (!lf || !lf->_fp)
        return SUCCESS;
    int ret = fclose(lf->_fp);
    lf->_fp = nullptr;
    if (ret != 0) {
        cerr << "[ERROR] close failed on " << lf->_filename << ": " << strerror(errno) << endl;
        return ERR_IO;
    }
    return SUCCESS;
}

int LocalFS::getFileSize(string filename, uint64_t* psize) {
    struct stat st;
    if (stat(filename.c_str(), &st) != 0) {
        if (errno == ENOENT || errno == ENOTDIR)
            return ERR_NOT_FOUND;
        cerr << "[ERROR] cannot stat " << filename << ": " << strerror(errno) << endl;
        return ERR_IO;
    }
    *psize = st.st_size;
    return SUCCESS;
}

bool LocalFS::exists(string path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

bool LocalFS::isFile(string path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

bool LocalFS::isDir(string path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

int LocalFS::makeDir(string path) {
    if (mkdir(path.c_str(), 0755) == 0)
        return SUCCESS;
    if (errno == EEXIST && isDir(path))
        return SUCCESS;
    cerr << "[ERROR] cannot create directory " << path << ": " << strerror(errno) << endl;
    return ERR_IO;
}

/**
 * entry names of a directory, without "." and "..", sorted
*/
int LocalFS::listDir(string path, vector<string>* names) {
    DIR* dir = opendir(path.c_str());
    if (!dir) {
        if (errno == ENOENT || errno == ENOTDIR)
            return ERR_NOT_FOUND;
        cerr << "[ERROR] cannot list directory " << path << ": " << strerror(errno) << endl;
        return ERR_IO;
    }
    struct dirent* ent;
    while ((ent = readdir(dir)) != nullptr) {
        string name(ent->d_name);
        if (name == "." || name == "..")
            continue;
        names->push_back(name);
    }
    closedir(dir);
    sort(names->begin(), names->end());
    return SUCCESS;
}

int LocalFS::removeFile(string filename) {
    if (unlink(filename.c_str()) != 0) {
        if (errno == ENOENT)
            return ERR_NOT_FOUND;
        cerr << "[ERROR] cannot remove " << filename << ": " << strerror(errno) << endl;
        return ERR_IO;
    }
    return SUCCESS;
}
