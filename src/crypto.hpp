#pragma once
#include <stdexcept>
#include <string>

enum class DecodeErrorKind {
    InvalidBase64,
    InvalidPadding,  // wrong key, corrupted or truncated ciphertext
    InvalidUtf8,
};

class DecodeError : public std::runtime_error {
public:
    DecodeError(DecodeErrorKind kind, const std::string& what);
    DecodeErrorKind kind() const { return kind_; }
private:
    DecodeErrorKind kind_;
};

const char* decode_error_name(DecodeErrorKind kind);

// Save container codec. AES-256-CBC with PKCS7 padding, the key and IV are
// fixed by the game format, so equal plaintext always gives equal ciphertext.
std::string decrypt_save(const std::string& cipher_b64);
std::string encrypt_save(const std::string& plaintext);

std::string base64_encode(const std::string& in);
// Strict: throws DecodeError(InvalidBase64) on anything but canonical base64.
std::string base64_decode(const std::string& in);
