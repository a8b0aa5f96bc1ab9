#pragma once

#include <nlohmann/json.hpp>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <compare>
#include <functional>
#include <string>

namespace Ids
{
    /**
     * @brief Base of all strongly typed string identifiers.
     */
    class Id
    {
      public:
        friend Id generateId();

        Id(Id const&) = default;
        Id(Id&&) = default;
        Id& operator=(Id const&) = default;
        Id& operator=(Id&&) = default;
        ~Id() = default;

        std::string const& value() const
        {
            return id_;
        }

        /**
         * @brief A shortened form of the id, sufficient to tell log lines apart.
         */
        std::string shortValue() const
        {
            return id_.substr(0, 8);
        }

        friend std::strong_ordering operator<=>(Id const& lhs, Id const& rhs) = default;

        bool isValid() const
        {
            return id_ != invalidId;
        }

      protected:
        constexpr static char const* invalidId = "INVALID_ID";

        Id() = delete;
        explicit Id(std::string id)
            : id_{std::move(id)}
        {}

      private:
        std::string id_;
    };

    struct IdHash
    {
        template <typename T>
        std::size_t operator()(T const& id) const
        {
            return std::hash<std::string>{}(id.value());
        }
    };

    inline Id generateId()
    {
        return Id{boost::uuids::to_string(boost::uuids::random_generator()())};
    }
}

#define DEFINE_ID_TYPE(name) \
    namespace Ids \
    { \
        class name : public Id \
        { \
          public: \
            friend name generate##name(); \
            friend name make##name(std::string const&); \
\
          public: \
            name() \
                : Id{invalidId} \
            {} \
\
          private: \
            explicit name(std::string const& str) \
                : Id{str} \
            {} \
        }; \
\
        inline name generate##name() \
        { \
            return name{generateId().value()}; \
        } \
\
        inline name make##name(std::string const& str) \
        { \
            return name{str}; \
        } \
        inline void to_json(nlohmann::json& j, name const& id) \
        { \
            j = id.value(); \
        } \
        inline void from_json(nlohmann::json const& j, name& id) \
        { \
            id = make##name(j.get<std::string>()); \
        } \
    }
