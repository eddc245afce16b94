#ifndef _BASE_FS_HH_
#define _BASE_FS_HH_

#include "../inc/include.hh"
#include "../common/Config.hh"
#include "BaseFile.hh"

using namespace std;

/**
 * file system the chunk sets live on
 * read/write return the number of bytes transferred, or -ERR_IO
*/
class BaseFS {
public:
    Config* _conf;

    virtual ~BaseFS() {}
    virtual BaseFile* openFile(string filename, string mode) = 0;
    virtual int64_t readFile(BaseFile* file, char* buffer, int64_t len) = 0;
    virtual int64_t writeFile(BaseFile* file, const char* buffer, int64_t len) = 0;
    virtual int closeFile(BaseFile* file) = 0;
    virtual int getFileSize(string filename, uint64_t* psize) = 0;
    virtual bool exists(string path) = 0;
    virtual bool isFile(string path) = 0;
    virtual bool isDir(string path) = 0;
    virtual int makeDir(string path) = 0;
    virtual int listDir(string path, vector<string>* names) = 0;
    virtual int removeFile(string filename) = 0;
};

#endif
