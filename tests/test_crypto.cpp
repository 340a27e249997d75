#include <catch2/catch.hpp>

#include "crypto.hpp"
#include "encoding.hpp"

#include <nlohmann/json.hpp>

#include <set>

using json = nlohmann::json;

static SecureKey random_key() {
    Bytes raw = random_bytes(KEY_LEN);
    return SecureKey(raw.data(), raw.size());
}

TEST_CASE("SHA-256 matches the FIPS 180-2 vector", "[crypto][hash]") {
    CHECK(sha256_hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("PBKDF2-HMAC-SHA256 matches RFC 7914 vector", "[crypto][pbkdf2]") {
    const std::string pw = "passwd";
    const std::string salt = "salt";
    byte out[64];
    REQUIRE(pbkdf2_sha256(reinterpret_cast<const byte*>(pw.data()), pw.size(),
        reinterpret_cast<const byte*>(salt.data()), salt.size(), 1, out, sizeof(out)));
    CHECK(to_hex(out, sizeof(out)) ==
        "55ac046e56e3089fec1691c22544b605f94185216dde0465e68b9d57c20dacbc"
        "49ca9cccf179b645991664b39d77ef317c71b845b1e30bd509112041d3a19783");

    CHECK_FALSE(pbkdf2_sha256(reinterpret_cast<const byte*>(pw.data()), pw.size(),
        reinterpret_cast<const byte*>(salt.data()), salt.size(), 0, out, sizeof(out)));
}

TEST_CASE("HKDF-SHA256 with empty salt matches RFC 5869 A.3", "[crypto][hkdf]") {
    Bytes ikm(22, 0x0b);
    byte okm[42];
    REQUIRE(hkdf_sha256(ikm.data(), ikm.size(), "", okm, sizeof(okm)));
    CHECK(to_hex(okm, sizeof(okm)) ==
        "8da4e775a563c18f715f802a063c5a31b8a11f5c5ee1879ec3454e5f3c738d2d"
        "9d201395faa4b61a96c8");
}

TEST_CASE("Authenticated encryption", "[crypto][aead]") {
    SecureKey key = random_key();

    SECTION("round trip with a fresh IV every time") {
        EncryptedBlob a, b;
        REQUIRE(encrypt_text(key, "hello", a) == ZkStatus::OK);
        REQUIRE(encrypt_text(key, "hello", b) == ZkStatus::OK);
        CHECK(a.iv.size() == NONCE_LEN);
        CHECK(a.tag.size() == TAG_LEN);
        CHECK(a.key_id == key_id_of(key));
        CHECK(a.iv != b.iv);
        CHECK(a.ciphertext != b.ciphertext);

        std::string out;
        REQUIRE(decrypt_text(key, a, out) == ZkStatus::OK);
        CHECK(out == "hello");
    }

    SECTION("empty plaintext") {
        EncryptedBlob blob;
        REQUIRE(encrypt_text(key, "", blob) == ZkStatus::OK);
        std::string out = "x";
        REQUIRE(decrypt_text(key, blob, out) == ZkStatus::OK);
        CHECK(out.empty());
    }

    SECTION("wrong key is an authentication failure") {
        EncryptedBlob blob;
        REQUIRE(encrypt_text(key, "secret", blob) == ZkStatus::OK);
        SecureKey other = random_key();
        std::string out;
        CHECK(decrypt_text(other, blob, out) == ZkStatus::AUTHENTICATION_FAILURE);
    }

    SECTION("altered bytes under the right key are an integrity failure") {
        EncryptedBlob blob;
        REQUIRE(encrypt_text(key, "secret", blob) == ZkStatus::OK);
        std::string out;

        EncryptedBlob bad_ct = blob;
        bad_ct.ciphertext[0] ^= 0x01;
        CHECK(decrypt_text(key, bad_ct, out) == ZkStatus::INTEGRITY_FAILURE);

        EncryptedBlob bad_tag = blob;
        bad_tag.tag[TAG_LEN - 1] ^= 0x80;
        CHECK(decrypt_text(key, bad_tag, out) == ZkStatus::INTEGRITY_FAILURE);

        EncryptedBlob bad_iv = blob;
        bad_iv.iv[3] ^= 0x10;
        CHECK(decrypt_text(key, bad_iv, out) == ZkStatus::INTEGRITY_FAILURE);

        EncryptedBlob short_iv = blob;
        short_iv.iv.pop_back();
        CHECK(decrypt_text(key, short_iv, out) == ZkStatus::INTEGRITY_FAILURE);
    }
}

TEST_CASE("Unicode and large bodies round trip", "[crypto][aead]") {
    SecureKey key = random_key();

    SECTION("multi-byte UTF-8") {
        const std::string text = u8"Grüße, naïve café. 日本語のメモ. Ελληνικά. \U0001F512\U0001F4DD";
        EncryptedBlob blob;
        REQUIRE(encrypt_text(key, text, blob) == ZkStatus::OK);
        std::string out;
        REQUIRE(decrypt_text(key, blob, out) == ZkStatus::OK);
        CHECK(out == text);
    }

    SECTION("150 KB of binary data") {
        Bytes big = random_bytes(150 * 1024);
        EncryptedBlob blob;
        REQUIRE(encrypt_blob(key, big.data(), big.size(), blob) == ZkStatus::OK);
        CHECK(blob.ciphertext.size() == big.size());

        SecureBuffer out;
        REQUIRE(decrypt_blob(key, blob, out) == ZkStatus::OK);
        REQUIRE(out.size() == big.size());
        CHECK(std::memcmp(out.data(), big.data(), big.size()) == 0);
    }
}

TEST_CASE("Every altered ciphertext or tag byte is rejected", "[crypto][aead]") {
    SecureKey key = random_key();
    EncryptedBlob blob;
    REQUIRE(encrypt_text(key, "forty-eight bytes of note body, give or take...", blob) == ZkStatus::OK);
    std::string out;

    for (size_t i = 0; i < blob.ciphertext.size(); ++i) {
        EncryptedBlob bad = blob;
        bad.ciphertext[i] ^= 0x01;
        INFO("ciphertext byte " << i);
        CHECK(decrypt_text(key, bad, out) == ZkStatus::INTEGRITY_FAILURE);
    }
    for (size_t i = 0; i < blob.tag.size(); ++i) {
        EncryptedBlob bad = blob;
        bad.tag[i] ^= 0x80;
        INFO("tag byte " << i);
        CHECK(decrypt_text(key, bad, out) == ZkStatus::INTEGRITY_FAILURE);
    }
}

TEST_CASE("Salts and nonces do not repeat", "[crypto][random]") {
    SecureKey key = random_key();
    std::set<Bytes> salts;
    std::set<Bytes> nonces;
    const size_t trials = 500;
    for (size_t i = 0; i < trials; ++i) {
        salts.insert(generate_salt());
        EncryptedBlob blob;
        REQUIRE(encrypt_text(key, "same text", blob) == ZkStatus::OK);
        nonces.insert(blob.iv);
    }
    CHECK(salts.size() == trials);
    CHECK(nonces.size() == trials);
}

TEST_CASE("Key identifiers", "[crypto][key_id]") {
    SecureKey a = random_key();
    SecureKey b = random_key();
    SecureKey a_copy(a.data(), a.size());

    CHECK(key_id_of(a).size() == KEY_ID_LEN);
    CHECK(key_id_of(a) == key_id_of(a_copy));
    CHECK(key_id_of(a) != key_id_of(b));
}

TEST_CASE("Envelope JSON carries a type discriminator", "[crypto][envelope]") {
    SecureKey key = random_key();
    EncryptedBlob blob;
    REQUIRE(encrypt_text(key, "payload", blob) == ZkStatus::OK);

    json j;
    envelope_to_json(j, Envelope(blob));
    REQUIRE(j.contains("type"));

    Envelope back;
    REQUIRE(envelope_from_json(j, back));
    REQUIRE(std::holds_alternative<EncryptedBlob>(back));
    CHECK(std::get<EncryptedBlob>(back) == blob);

    SECTION("decoding as another alternative is rejected") {
        CHECK_THROWS(j.get<WrappedKey>());
    }

    SECTION("unknown type is rejected") {
        json bad = j;
        bad["type"] = "rot13";
        Envelope out;
        CHECK_FALSE(envelope_from_json(bad, out));
    }

    SECTION("malformed base64 is rejected") {
        json bad = j;
        bad["iv"] = "***";
        Envelope out;
        CHECK_FALSE(envelope_from_json(bad, out));
    }
}

TEST_CASE("Base64 and hex codecs", "[crypto][encoding]") {
    Bytes data = { 0x00, 0xff, 0x10, 0x7f };
    Bytes back;
    REQUIRE(from_base64(to_base64(data), back));
    CHECK(back == data);
    REQUIRE(from_hex(to_hex(data), back));
    CHECK(back == data);
    CHECK(to_hex(data) == "00ff107f");
    CHECK_FALSE(from_base64("not base64!", back));
    CHECK(back.empty());
}
