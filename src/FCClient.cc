#include "inc/include.hh"
#include "common/Config.hh"
#include "common/FCCommand.hh"

using namespace std;

#define DEFAULT_CONF_PATH "conf/sys.conf"

int main(int argc, char** argv) {
    Config* conf = new Config();
    struct stat st;
    if (stat(DEFAULT_CONF_PATH, &st) == 0) {
        if (conf->parseConf(DEFAULT_CONF_PATH) != SUCCESS) {
            delete conf;
            return EXIT_FAILED;
        }
    }

    vector<string> args(argv + 1, argv + argc);
    FCCommand* cmd = new FCCommand(conf, ".");
    int ret = cmd->run(args);
    delete cmd;
    delete conf;
    return ret;
}
