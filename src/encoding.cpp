#include "encoding.hpp"

std::string to_base64(const byte* bin, size_t len) {
    if (!bin || len == 0) return "";
    size_t out_len = sodium_base64_encoded_len(len, sodium_base64_VARIANT_ORIGINAL);
    if (out_len == 0) return "";
    std::string out;
    out.resize(out_len);
    sodium_bin2base64(&out[0], out_len, bin, len, sodium_base64_VARIANT_ORIGINAL);
    // trim at first null
    size_t pos = out.find('\0');
    if (pos != std::string::npos) out.resize(pos);
    return out;
}

std::string to_base64(const Bytes& bin) {
    return to_base64(bin.data(), bin.size());
}

bool from_base64(const std::string& b64, Bytes& out) {
    out.clear();
    if (b64.empty()) return true;
    size_t max_out = b64.size();
    out.resize(max_out);
    size_t out_len = 0;
    if (sodium_base642bin(out.data(),
        out.size(),
        b64.c_str(),
        b64.size(),
        nullptr,
        &out_len,
        nullptr,
        sodium_base64_VARIANT_ORIGINAL) != 0) {
        out.clear();
        return false;
    }
    if (out_len > out.size()) {
        out.clear();
        return false;
    }
    out.resize(out_len);
    return true;
}

std::string to_hex(const byte* bin, size_t len) {
    if (!bin || len == 0) return "";
    std::string out;
    out.resize(len * 2 + 1);
    sodium_bin2hex(&out[0], out.size(), bin, len);
    out.resize(len * 2);
    return out;
}

std::string to_hex(const Bytes& bin) {
    return to_hex(bin.data(), bin.size());
}

bool from_hex(const std::string& hex, Bytes& out) {
    out.clear();
    if (hex.size() % 2 != 0) return false;
    out.resize(hex.size() / 2);
    size_t out_len = 0;
    if (sodium_hex2bin(out.data(), out.size(),
        hex.c_str(), hex.size(),
        nullptr, &out_len, nullptr) != 0 || out_len != out.size()) {
        out.clear();
        return false;
    }
    return true;
}
