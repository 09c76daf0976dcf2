#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace ber {

// ASN.1 BER, definite lengths only: [tag:u8][len:short|long form][value]
using Bytes = std::vector<uint8_t>;

enum Tag : uint8_t {
    OCTET_STRING = 0x04,
    SEQUENCE = 0x30
};

// Malformed or truncated input.
struct ParseError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

class Writer {
public:
    void write_byte(uint8_t b);
    void write_length(size_t len);
    void append(const Bytes& b);

    void write_string(const std::string& s, uint8_t tag = OCTET_STRING);
    void write_octets(const Bytes& b, uint8_t tag = OCTET_STRING);

    // Nested; the length is patched in by the matching end_sequence().
    void start_sequence(uint8_t tag = SEQUENCE);
    void end_sequence();

    const Bytes& buffer() const;

private:
    Bytes out_;
    std::vector<size_t> open_;
};

class Reader {
public:
    explicit Reader(Bytes in);

    size_t offset() const { return off_; }
    size_t remaining() const { return in_.size() - off_; }
    // Length of the most recently read header.
    size_t length() const { return len_; }

    std::optional<uint8_t> peek() const;

    uint8_t read_byte();
    size_t read_length();

    // Consumes tag and length only; the cursor is left on the content.
    uint8_t read_sequence(uint8_t tag = SEQUENCE);
    std::string read_string(uint8_t tag = OCTET_STRING);
    Bytes read_octets(uint8_t tag = OCTET_STRING);

private:
    void ensure(size_t need) const;
    void expect_tag(uint8_t tag);

    Bytes in_;
    size_t off_ = 0;
    size_t len_ = 0;
};

// helpers
Bytes str_bytes(const std::string& s);
std::string bytes_str(const Bytes& b);

} // namespace ber
