#include "save_document.hpp"
#include "util.hpp"
#include <json-c/json.h>
#include <utility>

SaveDocument::SaveDocument(): root_(json_object_new_object()) {
    if (!root_) throw std::runtime_error("json_object_new_object failed");
}

SaveDocument::SaveDocument(json_object* root): root_(root) {}

SaveDocument::~SaveDocument(){
    json_object_put(root_);
}

SaveDocument::SaveDocument(SaveDocument&& other) noexcept: root_(other.root_) {
    other.root_ = nullptr;
}

SaveDocument& SaveDocument::operator=(SaveDocument&& other) noexcept {
    if (this != &other){
        json_object_put(root_);
        root_ = other.root_;
        other.root_ = nullptr;
    }
    return *this;
}

// json-c would stop at 32 levels by default
static const int kMaxParseDepth = 1024;

SaveDocument SaveDocument::parse(const std::string& text){
    json_tokener* tok = json_tokener_new_ex(kMaxParseDepth);
    if (!tok) throw std::runtime_error("json_tokener_new_ex failed");
    json_tokener_set_flags(tok, JSON_TOKENER_STRICT);

    // length includes the terminating NUL so a bare top-level number completes
    json_object* root = json_tokener_parse_ex(tok, text.c_str(), (int)text.size() + 1);
    enum json_tokener_error err = json_tokener_get_error(tok);
    size_t end = json_tokener_get_parse_end(tok);
    json_tokener_free(tok);

    if (err != json_tokener_success){
        json_object_put(root);
        throw ParseError(std::string("invalid save JSON: ") + json_tokener_error_desc(err) +
                         " near offset " + std::to_string(end));
    }
    for (size_t i = end; i < text.size(); ++i){
        if (!is_space(text[i])){
            json_object_put(root);
            throw ParseError("invalid save JSON: trailing data at offset " + std::to_string(i));
        }
    }
    return SaveDocument(root);
}

static std::string render(json_object* root, int flags){
    size_t len = 0;
    const char* s = json_object_to_json_string_length(root, flags, &len);
    if (!s) throw std::runtime_error("failed to render save JSON");
    return std::string(s, len);
}

std::string SaveDocument::serialize() const {
    return render(root_, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE);
}

std::string SaveDocument::pretty() const {
    return render(root_, JSON_C_TO_STRING_PRETTY | JSON_C_TO_STRING_SPACED | JSON_C_TO_STRING_NOSLASHESCAPE);
}
