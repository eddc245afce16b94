#include "Config.hh"

static bool parseUnsigned(const string& value, uint64_t* out) {
    if (value.empty() || value.size() > 19)
        return false;
    uint64_t v = 0;
    for (size_t i = 0; i < value.size(); i++) {
        if (value[i] < '0' || value[i] > '9')
            return false;
        v = v * 10 + (value[i] - '0');
    }
    *out = v;
    return true;
}

Config::Config() {
}

Config::~Config() {

}

int Config::parseConf(string path) {
    fstream fs = fstream(path, ios::in);
    if (!fs.is_open()) {
        cerr << "[ERROR] cannot open the config file! " << path << endl;
        return ERR_CONFIG_FILE;
    }
    _sys_conf_path = path;
    string line;
    string key;
    string value;
    int lineno = 0;
    while(getline(fs, line)) {
        lineno++;
        if (!line.empty() && line[line.size()-1] == '\r')
            line.erase(line.size()-1);
        if (line.size() == 0)
            continue;
        if (line[0] == '#')
            continue;
        auto pos = line.find(' ');
        if (pos == string::npos) {
            cerr << "[ERROR] config line " << lineno << " has no value: " << line << endl;
            return ERR_CONFIG_FILE;
        }
        key = line.substr(0, pos);
        stringstream ss(line.substr(pos+1, line.size()));
        value.clear();
        ss >> value;
        uint64_t num = 0;
        if (key == "chunk_size_mb") {
            if (!parseUnsigned(value, &num) || num == 0 || num > MAX_CHUNK_SIZE_MB) {
                cerr << "[ERROR] chunk_size_mb must be in [1, " << MAX_CHUNK_SIZE_MB << "], got " << value << endl;
                return ERR_CONFIG_FILE;
            }
            _chunkSizeMB = num;
        }
        else if (key == "packet_size") {
            if (!parseUnsigned(value, &num) || num == 0 || num > (1u << 30)) {
                cerr << "[ERROR] packet_size must be in (0, 1073741824], got " << value << endl;
                return ERR_CONFIG_FILE;
            }
            _pktSize = (int)num;
        }
        else if (key == "hash_algorithm") {
            if (value == "sha256" || value == "sha1" || value == "sha512") {
                _hashAlg = value;
            } else {
                cerr << "[ERROR] unidentified hash algorithm " << value
                     << ", support algorithm: sha256, sha1, sha512" << endl;
                return ERR_CONFIG_FILE;
            }
        }
        else if (key == "verbose") {
            if (value == "true") _verbose = true;
            else if (value == "false") _verbose = false;
            else {
                cerr << "[ERROR] verbose must be true or false, got " << value << endl;
                return ERR_CONFIG_FILE;
            }
        }
        else {
            cerr << "[ERROR] unrecognized config key: " << key << endl;
            return ERR_CONFIG_FILE;
        }
    }
    return SUCCESS;
}
