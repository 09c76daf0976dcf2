#include "ber.hpp"

#include <cstdio>
#include <utility>

namespace ber {

namespace {

std::string hex_byte(uint8_t b) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%02x", b);
    return buf;
}

Bytes encode_length(size_t len) {
    Bytes b;
    if (len < 0x80) {
        b.push_back(static_cast<uint8_t>(len));
        return b;
    }
    if (len > 0xFFFFFFFFu) throw std::length_error("BER: length too large");
    int n = 0;
    for (size_t v = len; v > 0; v >>= 8) ++n;
    b.push_back(static_cast<uint8_t>(0x80 | n));
    for (int i = n - 1; i >= 0; --i) b.push_back(static_cast<uint8_t>((len >> (8*i)) & 0xFF));
    return b;
}

} // namespace

void Writer::write_byte(uint8_t b) {
    out_.push_back(b);
}

void Writer::write_length(size_t len) {
    append(encode_length(len));
}

void Writer::append(const Bytes& b) {
    out_.insert(out_.end(), b.begin(), b.end());
}

void Writer::write_string(const std::string& s, uint8_t tag) {
    write_octets(str_bytes(s), tag);
}

void Writer::write_octets(const Bytes& b, uint8_t tag) {
    write_byte(tag);
    write_length(b.size());
    append(b);
}

void Writer::start_sequence(uint8_t tag) {
    write_byte(tag);
    open_.push_back(out_.size());
}

void Writer::end_sequence() {
    if (open_.empty()) throw std::logic_error("BER: end_sequence without start_sequence");
    size_t start = open_.back();
    open_.pop_back();
    Bytes len = encode_length(out_.size() - start);
    out_.insert(out_.begin() + static_cast<std::ptrdiff_t>(start), len.begin(), len.end());
}

const Bytes& Writer::buffer() const {
    if (!open_.empty()) throw std::logic_error("BER: unterminated sequence");
    return out_;
}

Reader::Reader(Bytes in) : in_(std::move(in)) {}

void Reader::ensure(size_t need) const {
    if (need > remaining()) throw ParseError("BER parse: truncated");
}

std::optional<uint8_t> Reader::peek() const {
    if (remaining() == 0) return std::nullopt;
    return in_[off_];
}

uint8_t Reader::read_byte() {
    ensure(1);
    return in_[off_++];
}

size_t Reader::read_length() {
    uint8_t first = read_byte();
    if ((first & 0x80) == 0) {
        len_ = first;
        return len_;
    }
    int n = first & 0x7F;
    if (n == 0) throw ParseError("BER parse: indefinite length not supported");
    if (n > 4) throw ParseError("BER parse: length field too long");
    ensure(static_cast<size_t>(n));
    size_t v = 0;
    for (int i = 0; i < n; ++i) v = (v << 8) | static_cast<size_t>(in_[off_++]);
    len_ = v;
    return len_;
}

void Reader::expect_tag(uint8_t tag) {
    uint8_t got = read_byte();
    if (got != tag) {
        throw ParseError("BER parse: expected tag " + hex_byte(tag) + ", got " + hex_byte(got));
    }
}

uint8_t Reader::read_sequence(uint8_t tag) {
    expect_tag(tag);
    size_t len = read_length();
    ensure(len);
    return tag;
}

std::string Reader::read_string(uint8_t tag) {
    return bytes_str(read_octets(tag));
}

Bytes Reader::read_octets(uint8_t tag) {
    expect_tag(tag);
    size_t len = read_length();
    ensure(len);
    Bytes val(in_.begin() + static_cast<std::ptrdiff_t>(off_),
              in_.begin() + static_cast<std::ptrdiff_t>(off_ + len));
    off_ += len;
    return val;
}

Bytes str_bytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}
std::string bytes_str(const Bytes& b) {
    return std::string(b.begin(), b.end());
}

} // namespace ber
