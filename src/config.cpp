#include "config.hpp"
#include "host_io.hpp"
#include <json-c/json.h>
#include <fstream>
#include <stdexcept>

EditorCfg load_cfg(const std::string& path){
    LocalFileHost host;
    auto s = host.read_text(path);
    json_object* root = json_tokener_parse(s.c_str());
    if (!root) throw std::runtime_error(path + " parse error");
    if (!json_object_is_type(root, json_type_object)){
        json_object_put(root);
        throw std::runtime_error(path + " must contain a JSON object");
    }

    EditorCfg c{};
    auto getB=[&](const char* k, bool def)->bool{
        json_object* v=nullptr;
        if(!json_object_object_get_ex(root,k,&v)) return def;
        return json_object_get_boolean(v) != 0;
    };
    auto getI=[&](const char* k, int def)->int{
        json_object* v=nullptr;
        if(!json_object_object_get_ex(root,k,&v)) return def;
        return json_object_get_int(v);
    };

    c.backup_before_save = getB("backup_before_save", c.backup_before_save);
    c.pretty_indent_export = getB("pretty_indent_export", c.pretty_indent_export);
    c.verbose = getI("verbose", c.verbose);

    json_object_put(root);
    if (c.verbose < 0 || c.verbose > 2)
        throw std::runtime_error(path + ": verbose must be 0, 1 or 2");
    return c;
}

EditorCfg load_cfg_if_present(const std::string& path){
    std::ifstream probe(path);
    if (!probe) return EditorCfg{};
    return load_cfg(path);
}
