#ifndef _BASE_FILE_HH_
#define _BASE_FILE_HH_

#include "../inc/include.hh"

class BaseFile
{ 
public:
    std::string _filename;
    std::string _mode;

    BaseFile() {}
    BaseFile(std::string filename, std::string mode): _filename(filename), _mode(mode) {}
    virtual ~BaseFile() {}
};


#endif
