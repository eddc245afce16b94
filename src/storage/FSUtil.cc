#include "FSUtil.hh"

BaseFS* FSUtil::createFS(Config* conf) {
    BaseFS* ret;
    ret = new LocalFS(conf);
    return ret;
}

void FSUtil::deleteFS(BaseFS* fshandler) {
    if(fshandler)
        delete fshandler;
}

string FSUtil::joinPath(string dir, string name) {
    if (dir.empty() || dir == ".")
        return name;
    if (dir[dir.size()-1] == '/')
        return dir + name;
    return dir + "/" + name;
}

/**
 * filename portion of a path, trailing slashes ignored
*/
string FSUtil::baseName(string path) {
    while (path.size() > 1 && path[path.size()-1] == '/')
        path.erase(path.size()-1);
    size_t pos = path.rfind('/');
    if (pos == string::npos)
        return path;
    return path.substr(pos+1);
}
