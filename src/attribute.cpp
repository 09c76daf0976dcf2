#include "attribute.hpp"

#include "base64.hpp"
#include "protocol.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

namespace ldap {

namespace {

const std::string kBinaryOption = ";binary";

// ECMAScript Number::toString form: shortest round-trip digits,
// positional from 1e-6 up to 1e21, otherwise "1.5e+21" / "1e-7".
std::string double_str(double d) {
    if (std::isnan(d)) return "NaN";
    if (std::isinf(d)) return d > 0 ? "Infinity" : "-Infinity";
    if (d == 0) return "0";

    char buf[40];
    for (int prec = 0; prec <= 16; ++prec) {
        std::snprintf(buf, sizeof(buf), "%.*e", prec, d);
        if (std::strtod(buf, nullptr) == d) break;
    }

    // buf is "[-]d[.ddd]e[+-]xx"
    std::string e(buf);
    std::string sign_str;
    if (e[0] == '-') {
        sign_str = "-";
        e.erase(0, 1);
    }
    size_t epos = e.find('e');
    int exp10 = std::atoi(e.c_str() + epos + 1);
    std::string digits;
    for (size_t i = 0; i < epos; ++i) {
        if (e[i] != '.') digits.push_back(e[i]);
    }
    while (digits.size() > 1 && digits.back() == '0') digits.pop_back();

    const int k = static_cast<int>(digits.size());
    const int n = exp10 + 1;
    std::string out;
    if (k <= n && n <= 21) {
        out = digits + std::string(static_cast<size_t>(n - k), '0');
    } else if (0 < n && n <= 21) {
        out = digits.substr(0, static_cast<size_t>(n)) + "." + digits.substr(static_cast<size_t>(n));
    } else if (-6 < n && n <= 0) {
        out = "0." + std::string(static_cast<size_t>(-n), '0') + digits;
    } else {
        out = digits.substr(0, 1);
        if (k > 1) out += "." + digits.substr(1);
        out += (n - 1 < 0) ? "e-" : "e+";
        out += std::to_string(std::abs(n - 1));
    }
    return sign_str + out;
}

int sign(int v) {
    return (v > 0) - (v < 0);
}

} // namespace

std::string Value::to_string() const {
    if (const auto* s = std::get_if<std::string>(&v_)) return *s;
    if (const auto* b = std::get_if<ber::Bytes>(&v_)) return ber::bytes_str(*b);
    if (const auto* i = std::get_if<int64_t>(&v_)) return std::to_string(*i);
    if (const auto* u = std::get_if<uint64_t>(&v_)) return std::to_string(*u);
    if (const auto* d = std::get_if<double>(&v_)) return double_str(*d);
    return std::get<bool>(v_) ? "true" : "false";
}

bool operator==(const PlainAttribute& a, const PlainAttribute& b) {
    return a.type == b.type && a.values == b.values;
}

std::ostream& operator<<(std::ostream& os, const PlainAttribute& p) {
    os << "{ type: \"" << p.type << "\", values: [";
    for (size_t i = 0; i < p.values.size(); ++i) {
        if (i) os << ", ";
        os << '"' << p.values[i] << '"';
    }
    return os << "] }";
}

bool is_binary_type(const std::string& type) {
    return type.size() >= kBinaryOption.size() &&
           type.compare(type.size() - kBinaryOption.size(), kBinaryOption.size(), kBinaryOption) == 0;
}

std::string value_text(const std::string& type, const ber::Bytes& raw) {
    if (is_binary_type(type)) return b64::encode(raw);
    return ber::bytes_str(raw);
}

ber::Bytes value_bytes(const std::string& type, const std::string& text) {
    if (is_binary_type(type)) return b64::decode(text);
    return ber::str_bytes(text);
}

Attribute::Attribute(std::string type, const std::vector<Value>& values) : type_(std::move(type)) {
    set_values(values);
}

Attribute::Attribute(const AttributeOptions& opts) {
    if (!opts.type.is_text()) throw std::invalid_argument("type must be a string");
    type_ = opts.type.text();
    set_values(opts.values.empty() ? opts.vals : opts.values);
}

std::vector<std::string> Attribute::values() const {
    std::vector<std::string> out;
    out.reserve(buffers_.size());
    for (const auto& b : buffers_) out.push_back(value_text(type_, b));
    return out;
}

void Attribute::set_values(const Value& v) {
    add_value(v);
}

void Attribute::set_values(const std::vector<Value>& vs) {
    for (const auto& v : vs) add_value(v);
}

void Attribute::add_value(const Value& v) {
    if (v.is_bytes()) {
        buffers_.push_back(v.bytes());
    } else {
        buffers_.push_back(value_bytes(type_, v.to_string()));
    }
}

PlainAttribute Attribute::pojo() const {
    return PlainAttribute{type_, values()};
}

ber::Bytes Attribute::to_ber() const {
    ber::Writer w;
    w.start_sequence();
    w.write_string(type_);
    w.start_sequence(proto::LBER_SET);
    for (const auto& b : buffers_) {
        w.write_byte(ber::OCTET_STRING);
        w.write_length(b.size());
        w.append(b);
    }
    w.end_sequence();
    w.end_sequence();
    return w.buffer();
}

void Attribute::parse(ber::Reader& r) {
    Attribute attr = from_ber(r);
    type_ = attr.type_;
    for (auto& b : attr.buffers_) buffers_.push_back(std::move(b));
}

Attribute Attribute::from_ber(ber::Reader& r) {
    r.read_sequence();
    const size_t seq_end = r.offset() + r.length();

    Attribute attr;
    attr.type_ = r.read_string();
    if (r.offset() > seq_end) throw ber::ParseError("BER parse: type overruns SEQUENCE");

    // A missing SET, or one outside this SEQUENCE, means no values.
    if (r.offset() < seq_end && r.peek() == proto::LBER_SET) {
        r.read_sequence(proto::LBER_SET);
        const size_t end = r.offset() + r.length();
        if (end > seq_end) throw ber::ParseError("BER parse: SET overruns SEQUENCE");
        while (r.offset() < end) {
            attr.buffers_.push_back(r.read_octets(ber::OCTET_STRING));
        }
        if (r.offset() != end) throw ber::ParseError("BER parse: value overruns SET");
    }
    return attr;
}

Attribute Attribute::from_ber(const ber::Bytes& b) {
    ber::Reader r(b);
    return from_ber(r);
}

std::vector<Attribute> Attribute::from_object(const Object& obj) {
    std::vector<Attribute> attributes;
    attributes.reserve(obj.size());
    for (const auto& kv : obj) {
        if (const auto* list = std::get_if<std::vector<Value>>(&kv.second)) {
            attributes.emplace_back(kv.first, *list);
        } else {
            attributes.emplace_back(kv.first, std::vector<Value>{std::get<Value>(kv.second)});
        }
    }
    return attributes;
}

int Attribute::compare(const AttributeLike& a, const AttributeLike& b) {
    if (!is_attribute(a) || !is_attribute(b)) {
        throw std::invalid_argument("can only compare Attribute instances");
    }

    int c = sign(a.type().compare(b.type()));
    if (c != 0) return c;

    const auto av = a.values();
    const auto bv = b.values();
    if (av.size() < bv.size()) return -1;
    if (av.size() > bv.size()) return 1;

    for (size_t i = 0; i < av.size(); ++i) {
        c = sign(av[i].compare(bv[i]));
        if (c != 0) return c;
    }
    return 0;
}

int Attribute::compare(const AttributeOptions& a, const AttributeOptions& b) {
    if (!is_attribute(a) || !is_attribute(b)) {
        throw std::invalid_argument("can only compare Attribute instances");
    }
    return compare(Attribute(a), Attribute(b));
}

bool operator==(const Attribute& a, const Attribute& b) {
    return Attribute::compare(a, b) == 0;
}

bool operator!=(const Attribute& a, const Attribute& b) {
    return !(a == b);
}

bool operator<(const Attribute& a, const Attribute& b) {
    return Attribute::compare(a, b) < 0;
}

bool is_attribute(const AttributeLike&) {
    return true;
}

bool is_attribute(const PlainAttribute&) {
    return true;
}

bool is_attribute(const AttributeOptions& opts) {
    if (!opts.type.is_text()) return false;
    // Same list the constructor takes.
    const auto& values = opts.values.empty() ? opts.vals : opts.values;
    for (const auto& v : values) {
        if (!v.is_text() && !v.is_bytes()) return false;
    }
    return true;
}

} // namespace ldap
