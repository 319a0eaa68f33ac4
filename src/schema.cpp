#include "schema.hpp"

const std::array<ResourceField, 10> kResourceFields = {{
    {"caps",           "Nuka",            "Caps",              999999},
    {"food",           "Food",            "Food",              999999},
    {"water",          "Water",           "Water",             999999},
    {"power",          "Energy",          "Power",             999999},
    {"stimpaks",       "StimPack",        "Stimpaks",          999999},
    {"radaway",        "RadAway",         "RadAway",           999999},
    {"quantum",        "NukaColaQuantum", "Nuka-Cola Quantum", 999},
    {"lunchbox",       "Lunchbox",        "Lunchboxes",        999},
    {"robotCompanion", "MrHandy",         "Mr. Handy",         99},
    {"petCarrier",     "PetCarrier",      "Pet Carriers",      999},
}};

const std::array<ResidentField, 3> kResidentFields = {{
    {"level",     "experience.currentLevel"},
    {"happiness", "happiness.happinessValue"},
    {"health",    "health.healthValue"},
}};

const std::array<SpecialStat, 7> kSpecialStats = {{
    {"strength",     "1", 'S'},
    {"perception",   "2", 'P'},
    {"endurance",    "3", 'E'},
    {"charisma",     "4", 'C'},
    {"intelligence", "5", 'I'},
    {"agility",      "6", 'A'},
    {"luck",         "7", 'L'},
}};

template <typename Row, size_t N>
static const Row* find_row(const std::array<Row, N>& table, const std::string& name){
    for (const auto& row : table)
        if (name == row.name) return &row;
    return nullptr;
}

const ResourceField* find_resource_field(const std::string& name){ return find_row(kResourceFields, name); }
const ResidentField* find_resident_field(const std::string& name){ return find_row(kResidentFields, name); }
const SpecialStat* find_special_stat(const std::string& name){ return find_row(kSpecialStats, name); }
