#pragma once

#include <istream>
#include <string>

#include "attribute.hpp"

namespace ldif {

// LDIF-style attribute lines (RFC 2849 subset):
//   cn: Babs Jensen        text value
//   photo:: /9j/4AAQ...    raw bytes, base64
// Blank lines and '#' comments are skipped. Repeated types collect
// into one value list. Throws std::runtime_error with the line number
// on malformed input.
ldap::Object parse(std::istream& in);

// One line per value; unsafe or binary values use the "::" form.
std::string format(const ldap::Attribute& a);

} // namespace ldif
