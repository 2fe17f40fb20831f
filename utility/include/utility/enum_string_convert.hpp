#pragma once

#include <utility/describe.hpp>

#include <string>
#include <stdexcept>

namespace Utility
{
    template <typename EnumType>
    std::string enumToString(EnumType const& enumValue)
    {
        char const* result = nullptr;
        boost::mp11::mp_for_each<boost::describe::describe_enumerators<EnumType>>([&result, &enumValue](auto desc) {
            if (enumValue == desc.value)
                result = desc.name;
        });

        if (result == nullptr)
            throw std::invalid_argument("Invalid enum value");
        return result;
    }

    /**
     * @brief Same as enumToString, but yields the fallback for values that have no name instead of throwing.
     */
    template <typename EnumType>
    std::string enumToString(EnumType const& enumValue, std::string const& fallback)
    {
        std::string result = fallback;
        boost::mp11::mp_for_each<boost::describe::describe_enumerators<EnumType>>([&result, &enumValue](auto desc) {
            if (enumValue == desc.value)
                result = desc.name;
        });
        return result;
    }

    template <typename EnumType>
    EnumType enumFromString(std::string const& str)
    {
        EnumType enumValue{};
        bool found = false;
        boost::mp11::mp_for_each<boost::describe::describe_enumerators<EnumType>>(
            [&found, &enumValue, &str](auto desc) {
                if (str == desc.name)
                {
                    enumValue = desc.value;
                    found = true;
                }
            });

        if (!found)
            throw std::invalid_argument("Invalid enum string: " + str);

        return enumValue;
    }
}
