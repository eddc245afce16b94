#ifndef _LOCAL_FS_HH_
#define _LOCAL_FS_HH_

#include "../inc/include.hh"
#include "BaseFile.hh"
#include "BaseFS.hh"
#include "../common/Config.hh"
#include "LocalFile.hh"

using namespace std;

class LocalFS: public BaseFS {
public:
    LocalFS(Config* conf);
    ~LocalFS();
    LocalFile* openFile(string filename, string mode);
    int64_t readFile(BaseFile* file, char* buffer, int64_t len);
    int64_t writeFile(BaseFile* file, const char* buffer, int64_t len);
    int closeFile(BaseFile* file);
    int getFileSize(string filename, uint64_t* psize);
    bool exists(string path);
    bool isFile(string path);
    bool isDir(string path);
    int makeDir(string path);
    int listDir(string path, vector<string>* names);
    int removeFile(string filename);
};

#endif
