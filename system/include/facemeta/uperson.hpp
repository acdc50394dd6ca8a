// ============= include/facemeta/uperson.hpp =============
#pragma once
#include "facemeta/uuid.hpp"
#include <optional>
#include <string>

struct UPerson {
    Uuid uuid;
    std::string name;
    std::optional<double> age;  // puede ser fraccional o desconocida

    UPerson() : uuid(Uuid::generate()) {}
    explicit UPerson(const Uuid& uuid) : uuid(uuid) {}

    bool operator==(const UPerson& other) const {
        return uuid == other.uuid && name == other.name && age == other.age;
    }
};
