#pragma once
#include "zknotes_common.hpp"

// -------- Binary <-> text helpers (libsodium codecs) --------
std::string to_base64(const byte* bin, size_t len);
std::string to_base64(const Bytes& bin);

// false on malformed input; out is cleared
bool from_base64(const std::string& b64, Bytes& out);

std::string to_hex(const byte* bin, size_t len);
std::string to_hex(const Bytes& bin);
bool from_hex(const std::string& hex, Bytes& out);

inline Bytes bytes_of(const std::string& s) {
    return Bytes(s.begin(), s.end());
}
