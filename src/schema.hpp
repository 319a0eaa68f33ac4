#pragma once
#include <array>
#include <string>

// Raw save layout
const char* const kResourcesPath = "vault.storage.resources";
const char* const kShelterPath   = "vault";
const char* const kResidentsPath = "dwellers.dwellers";
const char* const kSpecialPath   = "serializeableSpecialStats.stats";  // relative to a resident

struct ResourceField {
    const char* name;     // logical name used by callers
    const char* raw_key;  // key under vault.storage.resources
    const char* label;
    double ceiling;       // value written by max_all_resources
};

struct ResidentField {
    const char* name;
    const char* path;     // relative to the resident record
};

struct SpecialStat {
    const char* name;
    const char* key;      // "1".."7"
    char letter;
};

// Adding a resource means adding one row here.
extern const std::array<ResourceField, 10> kResourceFields;
extern const std::array<ResidentField, 3> kResidentFields;
extern const std::array<SpecialStat, 7> kSpecialStats;

const ResourceField* find_resource_field(const std::string& name);
const ResidentField* find_resident_field(const std::string& name);
const SpecialStat* find_special_stat(const std::string& name);

const int kSpecialMin = 1;
const int kSpecialMax = 10;
const int kMaxResidentLevel = 50;
const long long kMaxLevelExperience = 2916000;
const int kMaxResidentHappiness = 100;
const int kMaxResidentHealth = 100;
const char* const kExperienceValuePath = "experience.experienceValue";

const char* const kShelterModes[] = {"Normal", "Survival"};
const int kFemaleGender = 2;
