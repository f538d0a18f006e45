#pragma once

#include <utility/describe.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace Utility
{
    template <typename EnumType>
    std::optional<EnumType> tryEnumFromString(std::string_view name)
    {
        std::optional<EnumType> found{std::nullopt};
        boost::mp11::mp_for_each<boost::describe::describe_enumerators<EnumType>>([&](auto enumerator) {
            if (!found && name == enumerator.name)
                found = enumerator.value;
        });
        return found;
    }

    template <typename EnumType>
    EnumType enumFromString(std::string_view name)
    {
        if (auto value = tryEnumFromString<EnumType>(name); value)
            return *value;
        throw std::invalid_argument("Unknown enumerator name: " + std::string{name});
    }

    template <typename EnumType>
    std::string enumToString(EnumType value)
    {
        if (char const* name = boost::describe::enum_to_string(value, nullptr); name != nullptr)
            return name;
        throw std::invalid_argument(
            "Enumerator without name: " + std::to_string(static_cast<long long>(value)));
    }
}
