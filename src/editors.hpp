#pragma once
#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

struct json_object;
class SaveDocument;

// Logical field name -> text as typed by the user. Each edit is validated on
// its own; rejected edits are skipped and only the applied count is returned.
using FieldEdits = std::map<std::string, std::string>;

struct ShelterEdits {
    std::optional<std::string> name;
    std::optional<std::string> mode;
    std::optional<std::string> theme;
};

struct ShelterInfo {
    std::optional<std::string> name;
    std::optional<std::string> mode;
    std::optional<long long> theme;
};

enum class Gender { Male, Female };

struct ResidentInfo {
    std::optional<std::string> name;
    std::optional<Gender> gender;
    std::optional<double> level;
    std::optional<double> happiness;
    std::optional<double> health;
    std::optional<bool> pregnant;
    std::array<std::optional<long long>, 7> special;
};

size_t apply_resource_edits(SaveDocument& doc, const FieldEdits& edits);
size_t max_all_resources(SaveDocument& doc);
size_t apply_shelter_edits(SaveDocument& doc, const ShelterEdits& edits);

size_t apply_resident_edits(json_object* resident, const FieldEdits& edits);
size_t max_resident_special(json_object* resident, const FieldEdits& edits = FieldEdits());
size_t max_all_residents(SaveDocument& doc);

// Typed read access. An empty optional means the field is absent or has the wrong type.
std::optional<double> read_resource(const SaveDocument& doc, const std::string& name);
ShelterInfo read_shelter(const SaveDocument& doc);
ResidentInfo read_resident(json_object* resident);
size_t resident_count(const SaveDocument& doc);
json_object* resident_at(const SaveDocument& doc, size_t index);  // nullptr when out of range
