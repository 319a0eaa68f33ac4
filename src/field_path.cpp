#include "field_path.hpp"
#include <json-c/json.h>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <utility>

FieldPath::FieldPath(const std::string& dotted){
    if (dotted.empty()) throw std::invalid_argument("empty field path");
    size_t start = 0;
    while (true){
        size_t dot = dotted.find('.', start);
        std::string seg = dotted.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (seg.empty()) throw std::invalid_argument("empty segment in field path '" + dotted + "'");
        segments_.push_back(std::move(seg));
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
}

std::string FieldPath::str() const {
    std::string s;
    for (size_t i = 0; i < segments_.size(); ++i){
        if (i) s += '.';
        s += segments_[i];
    }
    return s;
}

FieldPath FieldPath::child(const std::string& key) const {
    if (key.empty() || key.find('.') != std::string::npos)
        throw std::invalid_argument("bad field path segment '" + key + "'");
    FieldPath p;
    p.segments_ = segments_;
    p.segments_.push_back(key);
    return p;
}

bool path_get(json_object* root, const FieldPath& path, json_object** out){
    json_object* cur = root;
    for (const auto& seg : path.segments()){
        if (!json_object_is_type(cur, json_type_object)) return false;
        json_object* next = nullptr;
        if (!json_object_object_get_ex(cur, seg.c_str(), &next)) return false;
        cur = next;
    }
    if (out) *out = cur;
    return true;
}

void path_set(json_object* root, const FieldPath& path, json_object* value){
    if (!json_object_is_type(root, json_type_object)){
        json_object_put(value);
        throw std::invalid_argument("cannot set '" + path.str() + "': document root is not an object");
    }
    const auto& segs = path.segments();
    json_object* cur = root;
    for (size_t i = 0; i + 1 < segs.size(); ++i){
        json_object* next = nullptr;
        if (!json_object_object_get_ex(cur, segs[i].c_str(), &next) || !json_object_is_type(next, json_type_object)){
            next = json_object_new_object();
            if (!next || json_object_object_add(cur, segs[i].c_str(), next) != 0){
                json_object_put(next);
                json_object_put(value);
                throw std::runtime_error("failed to create '" + segs[i] + "' while setting '" + path.str() + "'");
            }
        }
        cur = next;
    }
    if (json_object_object_add(cur, segs.back().c_str(), value) != 0){
        json_object_put(value);
        throw std::runtime_error("failed to set '" + path.str() + "'");
    }
}

json_object* make_number(double v){
    if (std::isfinite(v) && std::floor(v) == v && std::fabs(v) < 9.0e15)
        return json_object_new_int64((int64_t)v);
    if (!std::isfinite(v)) return json_object_new_double(v);

    // shortest %g text that reads back as the same double, so 0.1 stays "0.1"
    char buf[32];
    for (int prec = 15; prec <= 17; ++prec){
        snprintf(buf, sizeof buf, "%.*g", prec, v);
        if (std::strtod(buf, nullptr) == v) break;
    }
    return json_object_new_double_s(v, buf);
}
