#pragma once
#include "save_document.hpp"
#include <optional>
#include <string>

class FileHost;

// One open save. Opening another replaces the document without merging;
// callers that want an "unsaved changes" prompt check modified() first.
class EditSession {
public:
    // Both throw (DecodeError, ParseError) and keep the previous document on failure.
    void open_text(const std::string& cipher_b64, const std::string& origin = std::string());
    void open_json(const std::string& plaintext, const std::string& origin = std::string());

    // Serializes and encrypts the current document.
    std::string save_text();

    void open_file(FileHost& host, const std::string& path);
    // Writes to path, or to origin() when path is empty. Returns the path written.
    std::string save_file(FileHost& host, const std::string& path = std::string());
    std::string backup(FileHost& host);

    bool has_document() const { return doc_.has_value(); }
    SaveDocument& document();
    const SaveDocument& document() const;
    const std::string& origin() const { return origin_; }

    bool modified() const { return modified_; }
    void mark_modified(size_t applied) { if (applied > 0) modified_ = true; }

private:
    std::optional<SaveDocument> doc_;
    std::string origin_;
    bool modified_ = false;
};
