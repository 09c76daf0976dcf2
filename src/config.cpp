#include "config.hpp"

#include "util.hpp"

#include <fstream>

namespace {

bool parse_bool(const std::string& s, bool& out) {
    if (s == "1" || s == "true" || s == "yes" || s == "on") { out = true; return true; }
    if (s == "0" || s == "false" || s == "no" || s == "off") { out = false; return true; }
    return false;
}

bool valid_level(const std::string& s) {
    return s == "debug" || s == "info" || s == "warn" || s == "error";
}

} // namespace

bool load_config(const std::string& path, Config& out, std::string& err) {
    std::ifstream in(path);
    if (!in.is_open()) {
        err = "failed to open config: " + path;
        return false;
    }

    std::string line;
    size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        line = trim(line);
        if (line.empty()) continue;
        if (line[0] == '#') continue;

        auto pos = line.find('=');
        if (pos == std::string::npos) {
            err = "bad config line " + std::to_string(lineno) + ": missing '='";
            return false;
        }
        std::string key = trim(line.substr(0, pos));
        std::string val = trim(line.substr(pos + 1));
        if (key.empty()) continue;

        try {
            if (key == "log_file") out.log_file = val;
            else if (key == "log_level") {
                if (!valid_level(val)) {
                    err = "bad config value at line " + std::to_string(lineno) + ": unknown log level " + val;
                    return false;
                }
                out.log_level = val;
            }
            else if (key == "sort_output" || key == "hex_uppercase") {
                bool b = false;
                if (!parse_bool(val, b)) {
                    err = "bad config value at line " + std::to_string(lineno) + ": invalid bool";
                    return false;
                }
                (key == "sort_output" ? out.sort_output : out.hex_uppercase) = b;
            }
            else if (key == "hex_wrap") out.hex_wrap = static_cast<size_t>(std::stoul(val));
            else {
                err = "unknown config key at line " + std::to_string(lineno) + ": " + key;
                return false;
            }
        } catch (const std::exception& e) {
            err = "bad config value at line " + std::to_string(lineno) + ": " + e.what();
            return false;
        }
    }

    return true;
}
