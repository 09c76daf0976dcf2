#pragma once

#include <cstdint>

namespace proto {

// LDAP (RFC 4511) constructed tags as sent by peer directory servers.
enum LberTag : uint8_t {
    LBER_SET = 0x31
};

} // namespace proto
