#pragma once
#include "zknotes_common.hpp"

#include <variant>
#include <nlohmann/json_fwd.hpp>

enum class CipherAlg { XCHACHA20_POLY1305 };
enum class WrapAlg { XCHACHA20_POLY1305_SIV };
enum class SealAlg { X25519_SEALED_BOX };

// Output of authenticated encryption
struct EncryptedBlob {
    Bytes iv;
    Bytes ciphertext;
    Bytes tag;
    Bytes key_id;   // identifies the key, not secret
    CipherAlg algorithm = CipherAlg::XCHACHA20_POLY1305;

    bool empty() const { return iv.empty() && ciphertext.empty() && tag.empty(); }
    bool operator==(const EncryptedBlob& o) const {
        return iv == o.iv && ciphertext == o.ciphertext && tag == o.tag &&
            key_id == o.key_id && algorithm == o.algorithm;
    }
    bool operator!=(const EncryptedBlob& o) const { return !(*this == o); }
};

// Output of deterministic key wrap: synthetic IV || ciphertext || tag
struct WrappedKey {
    Bytes wrapped;
    Bytes key_id;   // id of the wrapping key
    WrapAlg algorithm = WrapAlg::XCHACHA20_POLY1305_SIV;

    bool empty() const { return wrapped.empty(); }
    bool operator==(const WrappedKey& o) const {
        return wrapped == o.wrapped && key_id == o.key_id && algorithm == o.algorithm;
    }
    bool operator!=(const WrappedKey& o) const { return !(*this == o); }
};

// Key sealed to a public key (recovery escrow)
struct SealedKey {
    Bytes sealed;
    SealAlg algorithm = SealAlg::X25519_SEALED_BOX;

    bool empty() const { return sealed.empty(); }
    bool operator==(const SealedKey& o) const {
        return sealed == o.sealed && algorithm == o.algorithm;
    }
    bool operator!=(const SealedKey& o) const { return !(*this == o); }
};

using Envelope = std::variant<EncryptedBlob, WrappedKey, SealedKey>;

const char* cipher_alg_str(CipherAlg a);
const char* wrap_alg_str(WrapAlg a);
const char* seal_alg_str(SealAlg a);

// -------- JSON (tagged with "type") --------
void to_json(nlohmann::json& j, const EncryptedBlob& b);
void from_json(const nlohmann::json& j, EncryptedBlob& b);
void to_json(nlohmann::json& j, const WrappedKey& k);
void from_json(const nlohmann::json& j, WrappedKey& k);
void to_json(nlohmann::json& j, const SealedKey& k);
void from_json(const nlohmann::json& j, SealedKey& k);

void envelope_to_json(nlohmann::json& j, const Envelope& env);
// false on unknown type or malformed fields
bool envelope_from_json(const nlohmann::json& j, Envelope& out);
