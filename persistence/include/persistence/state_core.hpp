#pragma once

#include <nlohmann/json.hpp>

#include <optional>

namespace Persistence
{
    /// Leaves the key out when the value is empty.
    template <typename T>
    void writeOptional(nlohmann::json& json, char const* key, std::optional<T> const& value)
    {
        if (value.has_value())
            json[key] = *value;
    }

    /// A missing key and an explicit null both read as empty.
    template <typename T>
    void readOptional(nlohmann::json const& json, char const* key, std::optional<T>& value)
    {
        auto iter = json.find(key);
        if (iter == json.end() || iter->is_null())
            value.reset();
        else
            value = iter->get<T>();
    }

    /// Used by the useDefaultsFrom members to layer a session over the global defaults.
    template <typename T>
    void fillUnset(std::optional<T>& value, std::optional<T> const& fallback)
    {
        if (!value.has_value())
            value = fallback;
    }
}
