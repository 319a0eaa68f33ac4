#include "editors.hpp"
#include "field_path.hpp"
#include "log.hpp"
#include "save_document.hpp"
#include "schema.hpp"
#include "util.hpp"
#include <json-c/json.h>
#include <cmath>

static std::optional<double> number_at(json_object* root, const FieldPath& path){
    json_object* v = nullptr;
    if (!path_get(root, path, &v)) return std::nullopt;
    if (!json_object_is_type(v, json_type_int) && !json_object_is_type(v, json_type_double)) return std::nullopt;
    return json_object_get_double(v);
}

static std::optional<std::string> string_at(json_object* root, const FieldPath& path){
    json_object* v = nullptr;
    if (!path_get(root, path, &v) || !json_object_is_type(v, json_type_string)) return std::nullopt;
    return std::string(json_object_get_string(v), (size_t)json_object_get_string_len(v));
}

static std::optional<long long> integer_at(json_object* root, const FieldPath& path){
    auto v = number_at(root, path);
    if (!v || std::fabs(*v) > 9.0e15 || std::floor(*v) != *v) return std::nullopt;
    return (long long)*v;
}

static json_object* section(const SaveDocument& doc, const char* path, json_type type){
    json_object* v = nullptr;
    if (!path_get(doc.root(), FieldPath(path), &v) || !json_object_is_type(v, type)) return nullptr;
    return v;
}

static const std::string* find_edit(const FieldEdits& edits, const char* name){
    auto it = edits.find(name);
    return it == edits.end() ? nullptr : &it->second;
}

size_t apply_resource_edits(SaveDocument& doc, const FieldEdits& edits){
    if (!section(doc, kResourcesPath, json_type_object)){
        log_warn("save has no %s, resource edits skipped", kResourcesPath);
        return 0;
    }
    const FieldPath base(kResourcesPath);
    size_t applied = 0;
    for (const auto& field : kResourceFields){
        const std::string* text = find_edit(edits, field.name);
        if (!text) continue;
        auto v = parse_number(*text);
        if (!v || *v < 0){
            log_debug("resource %s: rejected '%s'", field.name, text->c_str());
            continue;
        }
        path_set(doc.root(), base.child(field.raw_key), make_number(*v));
        ++applied;
    }
    for (const auto& e : edits)
        if (!find_resource_field(e.first)) log_debug("unknown resource '%s' ignored", e.first.c_str());
    return applied;
}

size_t max_all_resources(SaveDocument& doc){
    FieldEdits edits;
    for (const auto& field : kResourceFields)
        edits[field.name] = std::to_string((long long)field.ceiling);
    return apply_resource_edits(doc, edits);
}

size_t apply_shelter_edits(SaveDocument& doc, const ShelterEdits& edits){
    if (!section(doc, kShelterPath, json_type_object)){
        log_warn("save has no %s object, shelter edits skipped", kShelterPath);
        return 0;
    }
    const FieldPath base(kShelterPath);
    size_t applied = 0;
    if (edits.name){
        std::string name = trim(*edits.name);
        if (!name.empty()){
            path_set(doc.root(), base.child("VaultName"), json_object_new_string_len(name.data(), (int)name.size()));
            ++applied;
        }
    }
    if (edits.mode){
        std::string mode = trim(*edits.mode);
        for (const char* known : kShelterModes){
            if (mode == known){
                path_set(doc.root(), base.child("VaultMode"), json_object_new_string(known));
                ++applied;
                break;
            }
        }
    }
    if (edits.theme){
        auto theme = parse_integer(*edits.theme);
        if (theme && *theme >= 0){
            path_set(doc.root(), base.child("VaultTheme"), json_object_new_int64(*theme));
            ++applied;
        }
    }
    return applied;
}

size_t apply_resident_edits(json_object* resident, const FieldEdits& edits){
    if (!json_object_is_type(resident, json_type_object)) return 0;
    size_t applied = 0;

    // basic stats only need to be numbers; the nominal ranges are not enforced
    for (const auto& field : kResidentFields){
        const std::string* text = find_edit(edits, field.name);
        if (!text) continue;
        auto v = parse_number(*text);
        if (!v) continue;
        path_set(resident, FieldPath(field.path), make_number(*v));
        ++applied;
    }

    const FieldPath stats(kSpecialPath);
    for (const auto& stat : kSpecialStats){
        const std::string* text = find_edit(edits, stat.name);
        if (!text) continue;
        auto v = parse_integer(*text);
        if (!v || *v < kSpecialMin || *v > kSpecialMax){
            log_debug("SPECIAL %s: rejected '%s'", stat.name, text->c_str());
            continue;
        }
        path_set(resident, stats.child(stat.key), json_object_new_int64(*v));
        ++applied;
    }
    for (const auto& e : edits)
        if (!find_resident_field(e.first) && !find_special_stat(e.first))
            log_debug("unknown resident field '%s' ignored", e.first.c_str());
    return applied;
}

size_t max_resident_special(json_object* resident, const FieldEdits& edits){
    FieldEdits all = edits;
    for (const auto& stat : kSpecialStats)
        all[stat.name] = std::to_string(kSpecialMax);
    return apply_resident_edits(resident, all);
}

size_t max_all_residents(SaveDocument& doc){
    json_object* list = section(doc, kResidentsPath, json_type_array);
    if (!list) return 0;

    const FieldPath level(find_resident_field("level")->path);
    const FieldPath happiness(find_resident_field("happiness")->path);
    const FieldPath health(find_resident_field("health")->path);
    const FieldPath experience(kExperienceValuePath);
    const FieldPath stats(kSpecialPath);

    size_t processed = 0;
    size_t n = json_object_array_length(list);
    for (size_t i = 0; i < n; ++i){
        json_object* r = json_object_array_get_idx(list, i);
        if (!json_object_is_type(r, json_type_object)) continue;
        path_set(r, level, json_object_new_int(kMaxResidentLevel));
        path_set(r, experience, json_object_new_int64(kMaxLevelExperience));
        path_set(r, happiness, json_object_new_int(kMaxResidentHappiness));
        path_set(r, health, json_object_new_int(kMaxResidentHealth));
        for (const auto& stat : kSpecialStats)
            path_set(r, stats.child(stat.key), json_object_new_int(kSpecialMax));
        ++processed;
    }
    return processed;
}

std::optional<double> read_resource(const SaveDocument& doc, const std::string& name){
    const ResourceField* field = find_resource_field(name);
    if (!field) return std::nullopt;
    return number_at(doc.root(), FieldPath(kResourcesPath).child(field->raw_key));
}

ShelterInfo read_shelter(const SaveDocument& doc){
    const FieldPath base(kShelterPath);
    ShelterInfo info;
    info.name = string_at(doc.root(), base.child("VaultName"));
    info.mode = string_at(doc.root(), base.child("VaultMode"));
    info.theme = integer_at(doc.root(), base.child("VaultTheme"));
    return info;
}

ResidentInfo read_resident(json_object* resident){
    ResidentInfo info;
    if (!json_object_is_type(resident, json_type_object)) return info;
    info.name = string_at(resident, FieldPath("name"));
    if (auto g = integer_at(resident, FieldPath("gender")))
        info.gender = *g == kFemaleGender ? Gender::Female : Gender::Male;
    info.level = number_at(resident, FieldPath(kResidentFields[0].path));
    info.happiness = number_at(resident, FieldPath(kResidentFields[1].path));
    info.health = number_at(resident, FieldPath(kResidentFields[2].path));

    json_object* p = nullptr;
    if (path_get(resident, FieldPath("relations.pregnant"), &p) && json_object_is_type(p, json_type_boolean))
        info.pregnant = json_object_get_boolean(p) != 0;

    const FieldPath stats(kSpecialPath);
    for (size_t i = 0; i < kSpecialStats.size(); ++i)
        info.special[i] = integer_at(resident, stats.child(kSpecialStats[i].key));
    return info;
}

size_t resident_count(const SaveDocument& doc){
    json_object* list = section(doc, kResidentsPath, json_type_array);
    return list ? json_object_array_length(list) : 0;
}

json_object* resident_at(const SaveDocument& doc, size_t index){
    json_object* list = section(doc, kResidentsPath, json_type_array);
    if (!list || index >= json_object_array_length(list)) return nullptr;
    return json_object_array_get_idx(list, index);
}
