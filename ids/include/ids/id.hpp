#pragma once

#include <nlohmann/json.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <compare>
#include <cstddef>
#include <functional>
#include <string>
#include <utility>

namespace Ids
{
    /**
     * A string identifier that is only comparable to identifiers of the same Tag.
     * Default constructed ids are invalid.
     */
    template <typename Tag>
    class Id
    {
      public:
        Id() = default;

        static Id generate()
        {
            thread_local boost::uuids::random_generator generator{};
            return Id{boost::uuids::to_string(generator())};
        }

        static Id fromString(std::string value)
        {
            return Id{std::move(value)};
        }

        std::string const& value() const
        {
            return value_;
        }

        bool isValid() const
        {
            return !value_.empty();
        }

        friend auto operator<=>(Id const&, Id const&) = default;

        friend void to_json(nlohmann::json& j, Id const& id)
        {
            j = id.value_;
        }

        friend void from_json(nlohmann::json const& j, Id& id)
        {
            id.value_ = j.get<std::string>();
        }

      private:
        explicit Id(std::string value)
            : value_{std::move(value)}
        {}

      private:
        std::string value_{};
    };

    struct IdHash
    {
        template <typename Tag>
        std::size_t operator()(Id<Tag> const& id) const
        {
            return std::hash<std::string>{}(id.value());
        }
    };
}
