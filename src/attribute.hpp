#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "ber.hpp"

namespace ldap {

// A caller-supplied attribute value. Text and raw bytes are the real
// value kinds; numbers and booleans are coerced to their string form
// when stored.
class Value {
public:
    Value(const char* s) : v_(std::string(s)) {}
    Value(std::string s) : v_(std::move(s)) {}
    Value(ber::Bytes b) : v_(std::move(b)) {}
    Value(bool b) : v_(b) {}
    Value(double d) : v_(d) {}
    template <typename T,
              std::enable_if_t<std::is_integral_v<T> && std::is_signed_v<T>, int> = 0>
    Value(T i) : v_(static_cast<int64_t>(i)) {}
    template <typename T,
              std::enable_if_t<std::is_integral_v<T> && std::is_unsigned_v<T> &&
                               !std::is_same_v<T, bool>, int> = 0>
    Value(T i) : v_(static_cast<uint64_t>(i)) {}

    bool is_text() const { return std::holds_alternative<std::string>(v_); }
    bool is_bytes() const { return std::holds_alternative<ber::Bytes>(v_); }

    const std::string& text() const { return std::get<std::string>(v_); }
    const ber::Bytes& bytes() const { return std::get<ber::Bytes>(v_); }

    // String form of any non-bytes value.
    std::string to_string() const;

private:
    std::variant<std::string, ber::Bytes, int64_t, uint64_t, double, bool> v_;
};

// Anything that can present itself as an attribute.
class AttributeLike {
public:
    virtual ~AttributeLike() = default;

    virtual std::string type() const = 0;
    virtual std::vector<std::string> values() const = 0;
};

// Text projection handed to logging and other layers.
struct PlainAttribute {
    std::string type;
    std::vector<std::string> values;
};

bool operator==(const PlainAttribute& a, const PlainAttribute& b);
std::ostream& operator<<(std::ostream& os, const PlainAttribute& p);

// Loosely typed constructor input, e.g. decoded from JSON or a config.
struct AttributeOptions {
    Value type = std::string();
    std::vector<Value> values;
    std::vector<Value> vals; // old name for values; used when values is empty
};

using Field = std::variant<Value, std::vector<Value>>;
using Object = std::unordered_map<std::string, Field>;

// True if the type carries the ";binary" option.
bool is_binary_type(const std::string& type);
// Encoding policy: base64 for binary types, UTF-8 otherwise.
std::string value_text(const std::string& type, const ber::Bytes& raw);
ber::Bytes value_bytes(const std::string& type, const std::string& text);

/**
 * An LDAP attribute (RFC 4512 section 2.5): a type name and an ordered
 * list of values. Values are stored as raw bytes; values() recomputes
 * their text form from the current type on every call.
 */
class Attribute : public AttributeLike {
public:
    Attribute() = default;
    explicit Attribute(std::string type, const std::vector<Value>& values = {});
    // Throws std::invalid_argument if opts.type is not text.
    explicit Attribute(const AttributeOptions& opts);

    std::string type() const override { return type_; }
    void set_type(std::string name) { type_ = std::move(name); }

    std::vector<std::string> values() const override;

    // Both setters append, they never replace existing values.
    void set_values(const Value& v);
    void set_values(const std::vector<Value>& vs);

    // Raw bytes are stored as-is, anything else is encoded per type.
    void add_value(const Value& v);

    // Copy of the raw value storage.
    std::vector<ber::Bytes> buffers() const { return buffers_; }
    PlainAttribute pojo() const;

    std::vector<std::string> vals() const { return values(); }
    void set_vals(const std::vector<Value>& vs) { set_values(vs); }

    // SEQUENCE { OCTET STRING type, SET { OCTET STRING value... } }
    ber::Bytes to_ber() const;
    // Takes the decoded type and appends the decoded values.
    void parse(ber::Reader& r);

    // The reader must be positioned at the start of the SEQUENCE.
    static Attribute from_ber(ber::Reader& r);
    static Attribute from_ber(const ber::Bytes& b);

    // One attribute per key, in the map's iteration order.
    static std::vector<Attribute> from_object(const Object& obj);

    // -1, 0 or 1: by type, then value count, then values pairwise.
    static int compare(const AttributeLike& a, const AttributeLike& b);
    // Throws std::invalid_argument unless both pass is_attribute().
    static int compare(const AttributeOptions& a, const AttributeOptions& b);

private:
    std::string type_;
    std::vector<ber::Bytes> buffers_;
};

bool operator==(const Attribute& a, const Attribute& b);
bool operator!=(const Attribute& a, const Attribute& b);
bool operator<(const Attribute& a, const Attribute& b);

bool is_attribute(const AttributeLike& a);
bool is_attribute(const PlainAttribute& p);
bool is_attribute(const AttributeOptions& opts);

} // namespace ldap
