#ifndef _LOCAL_FILE_HH_
#define _LOCAL_FILE_HH_

#include "../inc/include.hh"
#include "BaseFile.hh"

class LocalFile: public BaseFile {
public:
    FILE* _fp;

    LocalFile(std::string filename, std::string mode, FILE* fp): BaseFile(filename, mode), _fp(fp) {}
    ~LocalFile() {
        if (_fp)
            fclose(_fp);
    }

private:
    LocalFile(const LocalFile&);
    LocalFile& operator=(const LocalFile&);
};

#endif
