#include <catch2/catch.hpp>

#include "crypto.hpp"
#include "save_document.hpp"
#include "sample_save.hpp"
#include <json-c/json.h>

namespace {

DecodeErrorKind decode_failure(const std::string& cipher){
    try {
        decrypt_save(cipher);
    } catch (const DecodeError& ex){
        return ex.kind();
    }
    FAIL("decrypt_save did not throw for '" << cipher << "'");
    return DecodeErrorKind::InvalidBase64;
}

} // namespace

TEST_CASE("encrypt_save matches the game's fixed key and IV")
{
    CHECK(encrypt_save("{\"a\":1}") == "u9bcSUF3rVpSfbPAFIiDjw==");
    // empty plaintext is one full block of padding
    CHECK(encrypt_save("") == "kJ0UKe+3BuP55TXzOxd9+A==");
}

TEST_CASE("encryption is deterministic")
{
    const std::string plain = sample_save_json();
    CHECK(encrypt_save(plain) == encrypt_save(plain));
}

TEST_CASE("decrypt_save inverts encrypt_save")
{
    const std::string texts[] = {
        "",
        "{\"a\":1}",
        "exactly sixteen!",
        "Vault 42 \xe2\x98\xa2 caf\xc3\xa9",
        sample_save_json(),
    };
    for (const auto& text : texts)
        CHECK(decrypt_save(encrypt_save(text)) == text);
}

TEST_CASE("decrypt_save ignores surrounding whitespace")
{
    CHECK(decrypt_save("  u9bcSUF3rVpSfbPAFIiDjw==\r\n") == "{\"a\":1}");
}

TEST_CASE("decrypt_save reports the failure kind")
{
    SECTION("malformed base64")
    {
        CHECK(decode_failure("not-base64!!") == DecodeErrorKind::InvalidBase64);
        CHECK(decode_failure("abc") == DecodeErrorKind::InvalidBase64);
        CHECK(decode_failure("ab=c") == DecodeErrorKind::InvalidBase64);
    }
    SECTION("random bytes fail the padding check")
    {
        // bytes 0x00..0x1f
        CHECK(decode_failure("AAECAwQFBgcICQoLDA0ODxAREhMUFRYXGBkaGxwdHh8=") == DecodeErrorKind::InvalidPadding);
    }
    SECTION("truncated or empty ciphertext")
    {
        CHECK(decode_failure("") == DecodeErrorKind::InvalidPadding);
        CHECK(decode_failure("u9bcSUF3rVpS") == DecodeErrorKind::InvalidPadding);
    }
    SECTION("plaintext that is not UTF-8")
    {
        // encrypts the bytes ff fe 61 62
        CHECK(decode_failure("S4YjzJUw58xCtXvYVGMTUQ==") == DecodeErrorKind::InvalidUtf8);
    }
}

TEST_CASE("decrypted JSON parses back to the original tree")
{
    SaveDocument doc = SaveDocument::parse(decrypt_save(encrypt_save("{\"a\":1}")));
    json_object* expected = json_tokener_parse("{\"a\":1}");
    CHECK(json_object_equal(doc.root(), expected));
    json_object_put(expected);
    CHECK(doc.serialize() == "{\"a\":1}");
}

TEST_CASE("base64 helpers")
{
    CHECK(base64_encode("") == "");
    CHECK(base64_encode("f") == "Zg==");
    CHECK(base64_encode("foobar") == "Zm9vYmFy");
    CHECK(base64_decode("Zg==") == "f");
    CHECK(base64_decode("Zm9vYg==") == "foob");
    CHECK(base64_decode("") == "");
    CHECK(base64_decode("Zm8=") == "fo");
    CHECK_THROWS_AS(base64_decode("Zm9v\nYmFy"), DecodeError);
}

TEST_CASE("base64 with stray bits before the padding is malformed")
{
    CHECK(decode_failure("Zh==") == DecodeErrorKind::InvalidBase64);
    CHECK(decode_failure("Zm9=") == DecodeErrorKind::InvalidBase64);
    CHECK_THROWS_AS(base64_decode("Zh=="), DecodeError);
}
