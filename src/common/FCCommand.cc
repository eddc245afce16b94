#include "FCCommand.hh"
#include "SplitStream.hh"
#include "../storage/FSUtil.hh"

using namespace chrono;

static void printThroughput(string op, uint64_t size, milliseconds duration) {
    cout << op << " time is: " << duration.count() << " ms" << endl;
    if (duration.count() > 0)
        cout << op << " throughput is: "
             << (double(size)/double(BYTES_PER_MB)) / (double(duration.count())/1000)
             << " MB/s" << endl;
}

FCCommand::FCCommand(Config* conf, string workDir) {
    _conf = conf;
    _workDir = workDir;
}

FCCommand::~FCCommand() {

}

void FCCommand::usage() {
    cout << "usage: ./FCClient split <file> [chunkSizeMB]" << endl;
    cout << "       ./FCClient join <folderName>" << endl;
}

/**
 * chunk size given in MB (1 MB = 1024*1024 bytes), returned in bytes
*/
bool FCCommand::parseChunkSize(string arg, uint64_t* bytes) {
    if (arg.empty() || arg.size() > 19)
        return false;
    uint64_t v = 0;
    for (size_t i = 0; i < arg.size(); i++) {
        if (arg[i] < '0' || arg[i] > '9')
            return false;
        v = v * 10 + (arg[i] - '0');
    }
    if (v == 0 || v > MAX_CHUNK_SIZE_MB)
        return false;
    *bytes = v * BYTES_PER_MB;
    return true;
}

int FCCommand::splitFile(string filename, uint64_t chunkSize) {
    BaseFS* fs = FSUtil::createFS(_conf);
    SplitStream* splitter = new SplitStream(_conf, fs);
    ChunkMeta meta;
    int ret = splitter->split(filename, chunkSize, _workDir, &meta, nullptr);
    delete splitter;
    FSUtil::deleteFS(fs);
    return ret;
}

int FCCommand::joinFiles(string folder, JoinReport* report) {
    BaseFS* fs = FSUtil::createFS(_conf);
    JoinStream* joiner = new JoinStream(_conf, fs);
    int ret = joiner->join(folder, _workDir, report);
    delete joiner;
    FSUtil::deleteFS(fs);
    return ret;
}

int FCCommand::run(const vector<string>& args) {
    if (args.empty()) {
        usage();
        return EXIT_FAILED;
    }

    string reqType(args[0]);
    transform(reqType.begin(), reqType.end(), reqType.begin(), ::tolower);
    int ret = SUCCESS;
    if (reqType == "split") {
        if (args.size() != 2 && args.size() != 3) {
            usage();
            return EXIT_FAILED;
        }
        string filename(args[1]);
        uint64_t chunkSize = _conf->_chunkSizeMB * BYTES_PER_MB;
        if (args.size() == 3 && !parseChunkSize(args[2], &chunkSize)) {
            cerr << "[ERROR] chunk size must be a positive integer number of MB: " << args[2] << endl;
            usage();
            return EXIT_FAILED;
        }
        uint64_t size = 0;
        struct stat st;
        if (stat(filename.c_str(), &st) == 0)
            size = st.st_size;
        auto start = system_clock::now();
        ret = splitFile(filename, chunkSize);
        auto end = system_clock::now();
        if (ret == SUCCESS && _conf->_verbose)
            printThroughput("split", size, duration_cast<milliseconds>(end - start));
    } else if (reqType == "join") {
        if (args.size() != 2) {
            usage();
            return EXIT_FAILED;
        }
        JoinReport report;
        auto start = system_clock::now();
        ret = joinFiles(args[1], &report);
        auto end = system_clock::now();
        if (ret == SUCCESS) {
            if (_conf->_verbose)
                printThroughput("join", report._rebuiltSize, duration_cast<milliseconds>(end - start));
            if (report._status != VerifyStatus::Verified)
                return EXIT_VERIFY_FAILED;
        }
    } else {
        cout << "[ERROR] unrecognized request!" << endl;
        usage();
        return EXIT_FAILED;
    }

    if (ret != SUCCESS) {
        cerr << "[ERROR] " << reqType << " failed: " << errString(ret) << endl;
        return EXIT_FAILED;
    }
    return EXIT_OK;
}
