#include <cstdio>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>
#include <optional>
#include <stdexcept>
#include "config.hpp"
#include "crypto.hpp"
#include "editors.hpp"
#include "host_io.hpp"
#include "log.hpp"
#include "schema.hpp"
#include "session.hpp"
#include "util.hpp"

static void usage(){
    fprintf(stderr,
        "usage: vaultedit [--config FILE] <command> ...\n"
        "  info SAVE                         shelter, resources and resident count\n"
        "  decrypt SAVE OUT.json             export the save as JSON\n"
        "  encrypt IN.json SAVE              import JSON into an encrypted save\n"
        "  resources SAVE name=value...      edit resources (");
    for (size_t i = 0; i < kResourceFields.size(); ++i)
        fprintf(stderr, "%s%s", i ? ", " : "", kResourceFields[i].name);
    fprintf(stderr, ")\n"
        "  max-resources SAVE                set every resource to its ceiling\n"
        "  shelter SAVE [--name N] [--mode Normal|Survival] [--theme ID]\n"
        "  residents SAVE                    list residents\n"
        "  resident SAVE INDEX field=value...  level, happiness, health, strength..luck\n"
        "  max-special SAVE INDEX [field=value...]\n"
        "  max-residents SAVE                level 50, full health/happiness, SPECIAL 10\n"
        "  backup SAVE\n");
}

static FieldEdits parse_assignments(int argc, char** argv, int first){
    FieldEdits edits;
    for (int i = first; i < argc; ++i){
        char* eq = std::strchr(argv[i], '=');
        if (!eq || eq == argv[i]) throw std::invalid_argument(std::string("expected name=value, got '") + argv[i] + "'");
        edits[std::string(argv[i], eq)] = std::string(eq + 1);
    }
    return edits;
}

static bool file_exists(const std::string& p){
    std::ifstream f(p);
    return (bool)f;
}

static size_t parse_index(const char* s){
    auto v = parse_integer(s);
    if (!v || *v < 0) throw std::invalid_argument(std::string("bad resident index '") + s + "'");
    return (size_t)*v;
}

static json_object* require_resident(EditSession& session, size_t index){
    json_object* r = resident_at(session.document(), index);
    if (!r) throw std::out_of_range("resident " + std::to_string(index) + " not found (" +
                                    std::to_string(resident_count(session.document())) + " in save)");
    return r;
}

static int commit(EditSession& session, FileHost& host, const EditorCfg& cfg, size_t applied, const char* what){
    session.mark_modified(applied);
    if (!session.modified()){
        log_warn("no valid %s changes to apply, save left untouched", what);
        return 0;
    }
    printf("Applied %zu %s change%s\n", applied, what, applied == 1 ? "" : "s");
    if (cfg.backup_before_save) session.backup(host);
    session.save_file(host);
    return 0;
}

static std::string fmt_opt(const std::optional<double>& v){
    if (!v) return "-";
    char buf[32]; snprintf(buf, sizeof(buf), "%.15g", *v);
    return buf;
}

static void print_info(const EditSession& session){
    const SaveDocument& doc = session.document();
    ShelterInfo s = read_shelter(doc);
    printf("Shelter:   %s\n", s.name ? s.name->c_str() : "-");
    printf("Mode:      %s\n", s.mode ? s.mode->c_str() : "-");
    printf("Theme:     %s\n", s.theme ? std::to_string(*s.theme).c_str() : "-");
    printf("Residents: %zu\n", resident_count(doc));
    printf("Resources:\n");
    for (const auto& field : kResourceFields)
        printf("  %-16s %-18s %s\n", field.name, field.label, fmt_opt(read_resource(doc, field.name)).c_str());
}

static void print_residents(const EditSession& session){
    const SaveDocument& doc = session.document();
    size_t n = resident_count(doc);
    if (n == 0) { printf("No residents found in save\n"); return; }
    printf("%4s  %-24s %-6s %5s %6s %6s %-8s", "#", "name", "gender", "level", "happy", "health", "pregnant");
    for (const auto& stat : kSpecialStats) printf(" %2c", stat.letter);
    printf("\n");
    for (size_t i = 0; i < n; ++i){
        ResidentInfo r = read_resident(resident_at(doc, i));
        std::string name = r.name ? *r.name : "Resident " + std::to_string(i + 1);
        const char* gender = !r.gender ? "-" : *r.gender == Gender::Female ? "female" : "male";
        printf("%4zu  %-24s %-6s %5s %6s %6s %-8s", i, name.c_str(), gender,
               fmt_opt(r.level).c_str(), fmt_opt(r.happiness).c_str(), fmt_opt(r.health).c_str(),
               r.pregnant && *r.pregnant ? "yes" : "no");
        for (const auto& v : r.special){
            if (v) printf(" %2lld", *v);
            else printf("  -");
        }
        printf("\n");
    }
}

static int run(int argc, char** argv, const EditorCfg& cfg){
    if (argc < 2) { usage(); return 1; }
    const std::string cmd = argv[0];
    const std::string path = argv[1];
    LocalFileHost host;
    EditSession session;

    if (cmd == "encrypt"){
        if (argc != 3) { usage(); return 1; }
        session.open_json(host.read_text(path));
        std::string cipher = session.save_text();
        const std::string dest = argv[2];
        if (cfg.backup_before_save && file_exists(dest)) host.copy_file(dest);
        host.write_text(dest, cipher);
        log_info("encrypted %s -> %s", path.c_str(), dest.c_str());
        return 0;
    }

    session.open_file(host, path);

    if (cmd == "info" && argc == 2){
        print_info(session);
        return 0;
    }
    if (cmd == "decrypt" && argc == 3){
        const SaveDocument& doc = session.document();
        host.write_text(argv[2], cfg.pretty_indent_export ? doc.pretty() : doc.serialize());
        log_info("wrote %s", argv[2]);
        return 0;
    }
    if (cmd == "residents" && argc == 2){
        print_residents(session);
        return 0;
    }
    if (cmd == "backup" && argc == 2){
        printf("%s\n", session.backup(host).c_str());
        return 0;
    }
    if (cmd == "resources"){
        size_t n = apply_resource_edits(session.document(), parse_assignments(argc, argv, 2));
        return commit(session, host, cfg, n, "resource");
    }
    if (cmd == "max-resources" && argc == 2){
        return commit(session, host, cfg, max_all_resources(session.document()), "resource");
    }
    if (cmd == "shelter"){
        ShelterEdits edits;
        for (int i = 2; i < argc; i += 2){
            if (i + 1 >= argc) throw std::invalid_argument(std::string("missing value for ") + argv[i]);
            std::string opt = argv[i];
            if (opt == "--name") edits.name = argv[i+1];
            else if (opt == "--mode") edits.mode = argv[i+1];
            else if (opt == "--theme") edits.theme = argv[i+1];
            else throw std::invalid_argument("unknown shelter option " + opt);
        }
        return commit(session, host, cfg, apply_shelter_edits(session.document(), edits), "shelter");
    }
    if (cmd == "resident" && argc >= 3){
        json_object* r = require_resident(session, parse_index(argv[2]));
        return commit(session, host, cfg, apply_resident_edits(r, parse_assignments(argc, argv, 3)), "resident");
    }
    if (cmd == "max-special" && argc >= 3){
        json_object* r = require_resident(session, parse_index(argv[2]));
        return commit(session, host, cfg, max_resident_special(r, parse_assignments(argc, argv, 3)), "resident");
    }
    if (cmd == "max-residents" && argc == 2){
        size_t n = max_all_residents(session.document());
        if (n > 0) printf("Maxed out %zu resident%s\n", n, n == 1 ? "" : "s");
        return commit(session, host, cfg, n, "resident");
    }
    usage();
    return 1;
}

int main(int argc, char** argv){
    std::vector<char*> args(argv + 1, argv + argc);
    std::string cfgPath = "vaultedit.json";
    bool explicitCfg = false;
    if (args.size() >= 2 && std::strcmp(args[0], "--config") == 0){
        cfgPath = args[1];
        explicitCfg = true;
        args.erase(args.begin(), args.begin() + 2);
    }

    try {
        EditorCfg cfg = explicitCfg ? load_cfg(cfgPath) : load_cfg_if_present(cfgPath);
        log_verbosity() = cfg.verbose;
        return run((int)args.size(), args.data(), cfg);
    } catch (const DecodeError& ex){
        log_error("decryption failed (%s): %s", decode_error_name(ex.kind()), ex.what());
    } catch (const ParseError& ex){
        log_error("load failed: %s", ex.what());
    } catch (const std::exception& ex){
        log_error("%s", ex.what());
    }
    return 1;
}
