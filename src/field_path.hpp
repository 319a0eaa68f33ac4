#pragma once
#include <string>
#include <vector>

struct json_object;

// Dot-separated object keys, e.g. "experience.currentLevel". There is no
// array indexing; a segment is always looked up as an object key.
class FieldPath {
public:
    explicit FieldPath(const std::string& dotted);  // throws std::invalid_argument

    const std::vector<std::string>& segments() const { return segments_; }
    std::string str() const;
    FieldPath child(const std::string& key) const;

private:
    FieldPath() = default;
    std::vector<std::string> segments_;
};

// Returns false when any segment is missing or a parent is not an object.
// A present JSON null is found and reported as *out == nullptr.
bool path_get(json_object* root, const FieldPath& path, json_object** out);

// Writes value at path, taking ownership of it. Missing parents, and parents
// that are not objects, are replaced by empty objects first.
void path_set(json_object* root, const FieldPath& path, json_object* value);

// Integral finite values are stored as JSON integers, everything else as a
// double rendered with the fewest digits that read back exactly.
json_object* make_number(double v);
