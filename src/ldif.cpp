#include "ldif.hpp"

#include "base64.hpp"
#include "util.hpp"

#include <sstream>
#include <stdexcept>

namespace ldif {

namespace {

// RFC 2849 SAFE-STRING, restricted to printable ASCII.
bool safe_string(const ber::Bytes& b) {
    if (b.empty()) return true;
    if (b.front() == ' ' || b.front() == ':' || b.front() == '<') return false;
    if (b.back() == ' ') return false;
    for (uint8_t c : b) {
        if (c < 0x20 || c >= 0x7F) return false;
    }
    return true;
}

} // namespace

ldap::Object parse(std::istream& in) {
    ldap::Object obj;
    std::string line;
    size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (trim(line).empty()) continue;
        if (line[0] == '#') continue;

        auto pos = line.find(':');
        if (pos == std::string::npos) {
            throw std::runtime_error("line " + std::to_string(lineno) + ": missing ':'");
        }
        std::string type = trim(line.substr(0, pos));
        if (type.empty()) {
            throw std::runtime_error("line " + std::to_string(lineno) + ": empty attribute type");
        }

        bool encoded = pos + 1 < line.size() && line[pos + 1] == ':';
        std::string rest = line.substr(pos + (encoded ? 2 : 1));
        size_t skip = rest.find_first_not_of(' ');
        rest = (skip == std::string::npos) ? std::string() : rest.substr(skip);

        auto it = obj.try_emplace(type, std::vector<ldap::Value>{}).first;
        auto& list = std::get<std::vector<ldap::Value>>(it->second);
        if (encoded) {
            try {
                list.emplace_back(b64::decode(trim(rest)));
            } catch (const std::exception& e) {
                throw std::runtime_error("line " + std::to_string(lineno) + ": " + e.what());
            }
        } else {
            list.emplace_back(rest);
        }
    }
    return obj;
}

std::string format(const ldap::Attribute& a) {
    std::ostringstream oss;
    const auto type = a.type();
    const auto buffers = a.buffers();
    if (buffers.empty()) {
        oss << "# " << type << " (no values)\n";
        return oss.str();
    }
    const bool binary = ldap::is_binary_type(type);
    for (const auto& b : buffers) {
        if (binary || !safe_string(b)) {
            oss << type << ":: " << b64::encode(b) << "\n";
        } else {
            oss << type << ": " << ber::bytes_str(b) << "\n";
        }
    }
    return oss.str();
}

} // namespace ldif
