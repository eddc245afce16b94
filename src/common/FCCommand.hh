#ifndef _FC_COMMAND_HH_
#define _FC_COMMAND_HH_

#include "../inc/include.hh"
#include "Config.hh"
#include "JoinStream.hh"

#define EXIT_OK 0
#define EXIT_FAILED -1
#define EXIT_VERIFY_FAILED 2

/**
 * the split/join request surface of FCClient
 * chunk sets are created in, and files rebuilt into, _workDir
*/
class FCCommand {
private:
    Config* _conf;
    string _workDir;

    int splitFile(string filename, uint64_t chunkSize);
    int joinFiles(string folder, JoinReport* report);

public:
    FCCommand(Config* conf, string workDir);
    ~FCCommand();

    // args excludes the program name, the result is the process exit status
    int run(const vector<string>& args);

    static void usage();
    static bool parseChunkSize(string arg, uint64_t* bytes);
};

#endif
