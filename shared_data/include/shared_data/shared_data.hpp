#pragma once

#include <nlohmann/json.hpp>
#include <utility/describe.hpp>
#include <utility/enum_string_convert.hpp>

#include <optional>
#include <string>
#include <type_traits>

/**
 * JSON conversion for every type that carries a Boost.Describe description.
 * Enums are written by enumerator name, structs as objects keyed by member name.
 * An empty optional member is left out and a null or absent key reads back as empty.
 */
namespace SharedData
{
    namespace Detail
    {
        template <typename T>
        struct IsOptional : std::false_type
        {};
        template <typename T>
        struct IsOptional<std::optional<T>> : std::true_type
        {};

        template <typename T>
        inline constexpr bool isOptional = IsOptional<T>::value;

        template <typename T>
        using DescribedMembers = boost::describe::describe_members<T, boost::describe::mod_any_access>;
        template <typename T>
        using DescribedBases = boost::describe::describe_bases<T, boost::describe::mod_any_access>;
    }

    template <typename EnumT, typename = boost::describe::describe_enumerators<EnumT>>
    void to_json(nlohmann::json& j, EnumT const& e)
    {
        j = Utility::enumToString(e);
    }

    template <typename EnumT, typename = boost::describe::describe_enumerators<EnumT>>
    void from_json(nlohmann::json const& j, EnumT& e)
    {
        e = Utility::enumFromString<EnumT>(j.template get<std::string>());
    }

    template <
        typename T,
        typename Members = Detail::DescribedMembers<T>,
        typename = std::enable_if_t<std::is_class_v<T>>>
    void to_json(nlohmann::json& j, T const& obj)
    {
        if (!j.is_object())
            j = nlohmann::json::object();

        boost::mp11::mp_for_each<Detail::DescribedBases<T>>([&](auto base) {
            using BaseType = typename decltype(base)::type;
            to_json(j, static_cast<BaseType const&>(obj));
        });
        boost::mp11::mp_for_each<Members>([&](auto member) {
            auto const& value = obj.*member.pointer;
            if constexpr (Detail::isOptional<std::decay_t<decltype(value)>>)
            {
                if (value.has_value())
                    j[member.name] = *value;
            }
            else
                j[member.name] = value;
        });
    }

    template <
        typename T,
        typename Members = Detail::DescribedMembers<T>,
        typename = std::enable_if_t<std::is_class_v<T>>>
    void from_json(nlohmann::json const& j, T& obj)
    {
        boost::mp11::mp_for_each<Detail::DescribedBases<T>>([&](auto base) {
            using BaseType = typename decltype(base)::type;
            from_json(j, static_cast<BaseType&>(obj));
        });
        boost::mp11::mp_for_each<Members>([&](auto member) {
            auto& value = obj.*member.pointer;
            using ValueType = std::decay_t<decltype(value)>;
            if constexpr (Detail::isOptional<ValueType>)
            {
                auto iter = j.find(member.name);
                if (iter == j.end() || iter->is_null())
                    value = std::nullopt;
                else
                    value = iter->template get<typename ValueType::value_type>();
            }
            else
            {
                // Throws nlohmann::json::out_of_range for a missing key.
                j.at(member.name).get_to(value);
            }
        });
    }
}
