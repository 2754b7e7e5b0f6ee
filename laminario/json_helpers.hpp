#pragma once

#include <optional>
#include <string>
#include <utility>

#include <laminario/jsonio.hpp>

#include <nlohmann/json.hpp>

namespace laminario {

// Search a json object for an entry with a given name.
// If found, return the value and remove from json object.
template <typename T>
std::optional<T> find_and_remove_json(const char* name, nlohmann::json& j) {
    auto it = j.find(name);
    if (it==j.end()) {
        return std::nullopt;
    }
    try {
        T value = it->template get<T>();
        j.erase(name);
        return std::move(value);
    }
    catch (nlohmann::json::exception& e) {
        throw jsonio_type_error(name, e.what());
    }
}

template <typename T>
T find_and_remove_required_json(const char* name, nlohmann::json& j) {
    if (auto value = find_and_remove_json<T>(name, j)) {
        return std::move(*value);
    }
    throw jsonio_missing_field(name);
}

void throw_if_not_empty(const nlohmann::json& json);

} // namespace laminario
