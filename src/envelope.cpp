#include "envelope.hpp"
#include "encoding.hpp"

#include <nlohmann/json.hpp>
#include <type_traits>
#include <stdexcept>

using json = nlohmann::json;

const char* cipher_alg_str(CipherAlg a) {
    switch (a) {
    case CipherAlg::XCHACHA20_POLY1305: return "XChaCha20-Poly1305";
    }
    return "unknown";
}

const char* wrap_alg_str(WrapAlg a) {
    switch (a) {
    case WrapAlg::XCHACHA20_POLY1305_SIV: return "XChaCha20-Poly1305-SIV";
    }
    return "unknown";
}

const char* seal_alg_str(SealAlg a) {
    switch (a) {
    case SealAlg::X25519_SEALED_BOX: return "X25519-SealedBox";
    }
    return "unknown";
}

// -------- field helpers --------
static Bytes b64_field(const json& j, const char* name) {
    Bytes out;
    if (!from_base64(j.at(name).get<std::string>(), out)) {
        throw std::invalid_argument(std::string("bad base64 in field ") + name);
    }
    return out;
}

static void expect_alg(const json& j, const char* expected) {
    if (j.at("algorithm").get<std::string>() != expected) {
        throw std::invalid_argument("unsupported algorithm");
    }
}

// -------- tagged union --------
void envelope_to_json(json& j, const Envelope& env) {
    std::visit([&j](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, EncryptedBlob>) {
            j = json{
                {"type", "encrypted"},
                {"iv", to_base64(v.iv)},
                {"ciphertext", to_base64(v.ciphertext)},
                {"tag", to_base64(v.tag)},
                {"keyId", to_base64(v.key_id)},
                {"algorithm", cipher_alg_str(v.algorithm)}
            };
        }
        else if constexpr (std::is_same_v<T, WrappedKey>) {
            j = json{
                {"type", "wrapped"},
                {"wrappedKey", to_base64(v.wrapped)},
                {"keyId", to_base64(v.key_id)},
                {"algorithm", wrap_alg_str(v.algorithm)}
            };
        }
        else if constexpr (std::is_same_v<T, SealedKey>) {
            j = json{
                {"type", "sealed"},
                {"sealedKey", to_base64(v.sealed)},
                {"algorithm", seal_alg_str(v.algorithm)}
            };
        }
        else {
            static_assert(sizeof(T) == 0, "unhandled envelope alternative");
        }
        }, env);
}

static Envelope parse_envelope(const json& j) {
    const std::string type = j.at("type").get<std::string>();
    if (type == "encrypted") {
        expect_alg(j, cipher_alg_str(CipherAlg::XCHACHA20_POLY1305));
        EncryptedBlob b;
        b.iv = b64_field(j, "iv");
        b.ciphertext = b64_field(j, "ciphertext");
        b.tag = b64_field(j, "tag");
        b.key_id = b64_field(j, "keyId");
        return b;
    }
    if (type == "wrapped") {
        expect_alg(j, wrap_alg_str(WrapAlg::XCHACHA20_POLY1305_SIV));
        WrappedKey k;
        k.wrapped = b64_field(j, "wrappedKey");
        k.key_id = b64_field(j, "keyId");
        return k;
    }
    if (type == "sealed") {
        expect_alg(j, seal_alg_str(SealAlg::X25519_SEALED_BOX));
        SealedKey k;
        k.sealed = b64_field(j, "sealedKey");
        return k;
    }
    throw std::invalid_argument("unknown envelope type: " + type);
}

bool envelope_from_json(const json& j, Envelope& out) {
    try {
        out = parse_envelope(j);
        return true;
    }
    catch (const std::exception&) {
        return false;
    }
}

template <typename T>
static void typed_from_json(const json& j, T& out) {
    Envelope env = parse_envelope(j);
    const T* v = std::get_if<T>(&env);
    if (!v) {
        throw std::invalid_argument("envelope has unexpected type");
    }
    out = *v;
}

void to_json(json& j, const EncryptedBlob& b) { envelope_to_json(j, Envelope(b)); }
void from_json(const json& j, EncryptedBlob& b) { typed_from_json(j, b); }
void to_json(json& j, const WrappedKey& k) { envelope_to_json(j, Envelope(k)); }
void from_json(const json& j, WrappedKey& k) { typed_from_json(j, k); }
void to_json(json& j, const SealedKey& k) { envelope_to_json(j, Envelope(k)); }
void from_json(const json& j, SealedKey& k) { typed_from_json(j, k); }
