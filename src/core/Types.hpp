// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace toolbridge
{

/// @brief Launch definition of a single tool provider process.
struct ProviderConfig
{
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
};

/// @brief Declared type of a tool parameter.
enum class ParameterType : std::uint8_t
{
    String,
    Integer,
    Number,
    Boolean,
};

[[nodiscard]] constexpr auto parameterTypeToString(ParameterType type) -> std::string_view
{
    switch (type)
    {
        case ParameterType::String: return "string";
        case ParameterType::Integer: return "integer";
        case ParameterType::Number: return "number";
        case ParameterType::Boolean: return "boolean";
    }
    return "string";
}

/// @brief Maps a JSON-Schema type tag to a ParameterType.
/// @return The matching type; unrecognized tags map to ParameterType::String.
[[nodiscard]] constexpr auto parameterTypeFromString(std::string_view str) -> ParameterType
{
    if (str == "integer")
        return ParameterType::Integer;
    if (str == "number")
        return ParameterType::Number;
    if (str == "boolean")
        return ParameterType::Boolean;
    return ParameterType::String;
}

/// @brief A typed parameter value. Alternative order follows ParameterType.
using ParameterValue = std::variant<std::string, std::int64_t, double, bool>;

/// @brief Schema for an input parameter in a tool definition.
struct ParameterSpec
{
    std::string name;
    ParameterType type = ParameterType::String;
    std::string description;
    bool required = false;
};

/// @brief Describes a tool as announced by a provider in its tools/list response.
struct ToolDescriptor
{
    std::string name;
    std::string description;
    std::vector<ParameterSpec> parameters;

    /// @brief Returns the parameter with the given name, or nullptr.
    [[nodiscard]] auto findParameter(std::string_view paramName) const -> const ParameterSpec*
    {
        for (const auto& param: parameters)
        {
            if (param.name == paramName)
                return &param;
        }
        return nullptr;
    }
};

} // namespace toolbridge
