#include "session.hpp"
#include "crypto.hpp"
#include "host_io.hpp"
#include "log.hpp"
#include <stdexcept>
#include <utility>

void EditSession::open_text(const std::string& cipher_b64, const std::string& origin){
    std::string plain = decrypt_save(cipher_b64);
    log_debug("decrypted %zu bytes of save JSON", plain.size());
    open_json(plain, origin);
}

void EditSession::open_json(const std::string& plaintext, const std::string& origin){
    SaveDocument doc = SaveDocument::parse(plaintext);
    doc_ = std::move(doc);
    origin_ = origin;
    modified_ = false;
}

SaveDocument& EditSession::document(){
    if (!doc_) throw std::logic_error("no save loaded");
    return *doc_;
}

const SaveDocument& EditSession::document() const {
    if (!doc_) throw std::logic_error("no save loaded");
    return *doc_;
}

std::string EditSession::save_text(){
    std::string cipher = encrypt_save(document().serialize());
    modified_ = false;
    return cipher;
}

void EditSession::open_file(FileHost& host, const std::string& path){
    open_text(host.read_text(path), path);
    log_info("loaded %s", path.c_str());
}

std::string EditSession::save_file(FileHost& host, const std::string& path){
    std::string dest = path.empty() ? origin_ : path;
    if (dest.empty()) throw std::logic_error("no destination for save");
    // encrypt fully before touching the file
    std::string cipher = encrypt_save(document().serialize());
    host.write_text(dest, cipher);
    modified_ = false;
    log_info("saved %s (%zu bytes)", dest.c_str(), cipher.size());
    return dest;
}

std::string EditSession::backup(FileHost& host){
    if (origin_.empty()) throw std::logic_error("no file to back up");
    return host.copy_file(origin_);
}
