#pragma once
#include <stdexcept>
#include <string>

struct json_object;

class ParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Owns the root of a parsed save. json-c keeps object keys in insertion
// order, so serialize() writes keys back in the order they were read.
class SaveDocument {
public:
    SaveDocument();  // empty object
    explicit SaveDocument(json_object* root);  // takes ownership
    ~SaveDocument();
    SaveDocument(SaveDocument&& other) noexcept;
    SaveDocument& operator=(SaveDocument&& other) noexcept;
    SaveDocument(const SaveDocument&) = delete;
    SaveDocument& operator=(const SaveDocument&) = delete;

    static SaveDocument parse(const std::string& text);

    std::string serialize() const;
    std::string pretty() const;

    json_object* root() const { return root_; }

private:
    json_object* root_;
};
