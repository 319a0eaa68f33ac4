#include "crypto.hpp"
#include "util.hpp"
#include <openssl/evp.h>
#include <openssl/buffer.h>
#include <openssl/bio.h>
#include <vector>

// Key words as the game ships them, big-endian.
static const unsigned char kSaveKey[32] = {
    0xA7,0xCA,0x9F,0x33, 0x66,0xD8,0x92,0xC2, 0xF0,0xBE,0xF4,0x17, 0x34,0x1C,0xA9,0x71,
    0xB6,0x9A,0xE9,0xF7, 0xBA,0xCC,0xCF,0xFC, 0xF4,0x3C,0x62,0xD1, 0xD7,0xD0,0x21,0xF9,
};
static const unsigned char kSaveIv[16] = {
    't','u','8','9','g','e','j','i','3','4','0','t','8','9','u','2',
};
static const size_t kBlock = 16;

DecodeError::DecodeError(DecodeErrorKind kind, const std::string& what)
    : std::runtime_error(what), kind_(kind) {}

const char* decode_error_name(DecodeErrorKind kind){
    switch(kind){
        case DecodeErrorKind::InvalidBase64: return "invalid base64";
        case DecodeErrorKind::InvalidPadding: return "invalid padding";
        case DecodeErrorKind::InvalidUtf8: return "invalid utf-8";
    }
    return "unknown";
}

std::string base64_encode(const std::string& in){
    BIO *bio, *b64; BUF_MEM *bufferPtr;
    b64 = BIO_new(BIO_f_base64());
    bio = BIO_new(BIO_s_mem());
    if (!b64 || !bio) { BIO_free(b64); BIO_free(bio); throw std::runtime_error("BIO_new failed"); }
    b64 = BIO_push(b64, bio);
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    if (!in.empty() && BIO_write(b64, in.data(), (int)in.size()) != (int)in.size()){
        BIO_free_all(b64); throw std::runtime_error("base64 write failed");
    }
    (void)BIO_flush(b64);
    BIO_get_mem_ptr(b64, &bufferPtr);
    std::string out(bufferPtr->data, bufferPtr->length);
    BIO_free_all(b64);
    return out;
}

// 6-bit value of a base64 symbol, -1 for anything else
static int b64_value(char c){
    if (c>='A' && c<='Z') return c - 'A';
    if (c>='a' && c<='z') return c - 'a' + 26;
    if (c>='0' && c<='9') return c - '0' + 52;
    if (c=='+') return 62;
    if (c=='/') return 63;
    return -1;
}

std::string base64_decode(const std::string& in){
    if (in.size() % 4 != 0)
        throw DecodeError(DecodeErrorKind::InvalidBase64, "base64 length is not a multiple of 4");
    size_t pad = 0;
    while (pad < 2 && pad < in.size() && in[in.size()-1-pad] == '=') ++pad;
    for (size_t i = 0; i < in.size() - pad; ++i){
        if (b64_value(in[i]) < 0)
            throw DecodeError(DecodeErrorKind::InvalidBase64,
                              "unexpected character in base64 at offset " + std::to_string(i));
    }
    if (in.empty()) return std::string();
    // bits of the last symbol that fall into the padding must be zero
    if (pad > 0){
        int unused = pad == 1 ? 0x03 : 0x0F;
        if (b64_value(in[in.size()-1-pad]) & unused)
            throw DecodeError(DecodeErrorKind::InvalidBase64, "non-canonical base64 before padding");
    }

    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding
    std::string out(in.size() / 4 * 3, '\0');
    int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                            reinterpret_cast<const unsigned char*>(in.data()), (int)in.size());
    if (n < 0) throw DecodeError(DecodeErrorKind::InvalidBase64, "base64 decode failed");
    out.resize((size_t)n - pad);
    return out;
}

std::string encrypt_save(const std::string& plaintext){
    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) throw std::runtime_error("EVP_CIPHER_CTX_new failed");

    int rc = EVP_EncryptInit_ex(ctx, EVP_aes_256_cbc(), nullptr, kSaveKey, kSaveIv);
    if (rc != 1) { EVP_CIPHER_CTX_free(ctx); throw std::runtime_error("EncryptInit failed"); }

    std::vector<unsigned char> out(plaintext.size() + kBlock);
    int outlen1=0, outlen2=0;
    rc = EVP_EncryptUpdate(ctx, out.data(), &outlen1, reinterpret_cast<const unsigned char*>(plaintext.data()), (int)plaintext.size());
    if (rc != 1) { EVP_CIPHER_CTX_free(ctx); throw std::runtime_error("EncryptUpdate failed"); }

    rc = EVP_EncryptFinal_ex(ctx, out.data()+outlen1, &outlen2);
    EVP_CIPHER_CTX_free(ctx);
    if (rc != 1) throw std::runtime_error("EncryptFinal failed");

    return base64_encode(std::string(reinterpret_cast<const char*>(out.data()), (size_t)(outlen1 + outlen2)));
}

std::string decrypt_save(const std::string& cipher_b64){
    std::string cipher = base64_decode(trim(cipher_b64));
    if (cipher.empty() || cipher.size() % kBlock != 0)
        throw DecodeError(DecodeErrorKind::InvalidPadding,
                          "ciphertext length " + std::to_string(cipher.size()) + " is not a whole number of blocks");

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    int rc = EVP_DecryptInit_ex(ctx, EVP_aes_256_cbc(), nullptr, kSaveKey, kSaveIv);
    if (rc != 1) { EVP_CIPHER_CTX_free(ctx); throw std::runtime_error("DecryptInit failed"); }

    std::string out; out.resize(cipher.size() + kBlock);
    int outlen1=0, outlen2=0;
    rc = EVP_DecryptUpdate(ctx, reinterpret_cast<unsigned char*>(&out[0]), &outlen1,
                           reinterpret_cast<const unsigned char*>(cipher.data()), (int)cipher.size());
    if (rc != 1) { EVP_CIPHER_CTX_free(ctx); throw std::runtime_error("DecryptUpdate failed"); }

    rc = EVP_DecryptFinal_ex(ctx, reinterpret_cast<unsigned char*>(&out[0]) + outlen1, &outlen2);
    EVP_CIPHER_CTX_free(ctx);
    if (rc != 1) throw DecodeError(DecodeErrorKind::InvalidPadding, "bad PKCS7 padding (wrong key or corrupted save)");

    out.resize(outlen1 + outlen2);
    if (!is_valid_utf8(out)) throw DecodeError(DecodeErrorKind::InvalidUtf8, "decrypted save is not UTF-8 text");
    return out;
}
