#ifndef _FS_UTIL_HH_
#define _FS_UTIL_HH_

#include "../inc/include.hh"
#include "BaseFS.hh"
#include "LocalFS.hh"
#include "../common/Config.hh"

using namespace std;

class FSUtil {
public:
    static BaseFS* createFS(Config* conf);
    static void deleteFS(BaseFS*);
    static string joinPath(string dir, string name);
    static string baseName(string path);
};

#endif
