#pragma once
#include <string>

struct EditorCfg {
    bool backup_before_save = true;
    bool pretty_indent_export = true;
    int verbose = 1;
};

// Reads a JSON config. Missing keys keep their defaults.
EditorCfg load_cfg(const std::string& path);
// Defaults when path does not exist; used for the implicit vaultedit.json.
EditorCfg load_cfg_if_present(const std::string& path);
