#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "attribute.hpp"
#include "config.hpp"
#include "ldif.hpp"
#include "logger.hpp"
#include "util.hpp"

namespace {

void usage(const char* argv0) {
    std::cout << "Usage:\n";
    std::cout << "  " << argv0 << " [-c <config_path>] encode <ldif_file>\n";
    std::cout << "  " << argv0 << " [-c <config_path>] decode <hex_file>\n";
}

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) throw std::runtime_error("failed to open " + path);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

std::string wrap(const std::string& s, size_t width) {
    if (width == 0 || s.size() <= width) return s;
    std::string out;
    for (size_t i = 0; i < s.size(); i += width) {
        if (i) out.push_back('\n');
        out += s.substr(i, width);
    }
    return out;
}

void sort_attributes(std::vector<ldap::Attribute>& attrs) {
    std::sort(attrs.begin(), attrs.end(),
              [](const ldap::Attribute& a, const ldap::Attribute& b) {
                  return ldap::Attribute::compare(a, b) < 0;
              });
}

int run_encode(const Config& cfg, const std::string& path, Logger& logger) {
    std::istringstream in(read_file(path));
    auto attrs = ldap::Attribute::from_object(ldif::parse(in));
    if (cfg.sort_output) sort_attributes(attrs);
    logger.info("encoding " + std::to_string(attrs.size()) + " attribute(s) from " + path);

    for (const auto& a : attrs) {
        auto encoded = a.to_ber();
        logger.debug("encoded " + a.type() + ": " + std::to_string(encoded.size()) + " bytes");
        std::cout << wrap(to_hex(encoded, cfg.hex_uppercase), cfg.hex_wrap) << "\n";
    }
    return 0;
}

int run_decode(const Config& cfg, const std::string& path, Logger& logger) {
    ber::Reader reader(from_hex(read_file(path)));
    std::vector<ldap::Attribute> attrs;
    while (reader.remaining() > 0) {
        size_t at = reader.offset();
        attrs.push_back(ldap::Attribute::from_ber(reader));
        logger.debug("decoded " + attrs.back().type() + " at offset " + std::to_string(at));
    }
    if (cfg.sort_output) sort_attributes(attrs);
    logger.info("decoded " + std::to_string(attrs.size()) + " attribute(s) from " + path);

    for (const auto& a : attrs) std::cout << ldif::format(a);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string cfg_path;
    if (args.size() >= 2 && args[0] == "-c") {
        cfg_path = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }
    if (args.size() != 2 || (args[0] != "encode" && args[0] != "decode")) {
        usage(argv[0]);
        return 2;
    }

    Config cfg;
    std::string err;
    if (!cfg_path.empty() && !load_config(cfg_path, cfg, err)) {
        std::cerr << err << "\n";
        return 2;
    }

    Logger logger(cfg.log_file, parse_level(cfg.log_level));

    try {
        if (args[0] == "encode") return run_encode(cfg, args[1], logger);
        return run_decode(cfg, args[1], logger);
    } catch (const std::exception& e) {
        logger.error(args[0] + " " + args[1] + ": " + e.what());
        std::cerr << args[0] << " failed: " << e.what() << "\n";
        return 2;
    }
}
