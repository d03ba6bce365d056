// SPDX-License-Identifier: Apache-2.0
#include "ToolSchema.hpp"

#include <core/JsonUtils.hpp>

#include <format>
#include <string>

namespace toolbridge
{

namespace
{

    auto typeTagOf(const nlohmann::json& property) -> std::string
    {
        if (!property.is_object() || !property.contains("type"))
            return "string";

        auto const& type = property["type"];
        if (type.is_string())
            return type.get<std::string>();

        if (type.is_array())
        {
            for (const auto& entry: type)
            {
                if (entry.is_string() && entry != "null")
                    return entry.get<std::string>();
            }
        }
        return "string";
    }

    auto isListedAsRequired(const nlohmann::json& required, const std::string& name) -> bool
    {
        if (!required.is_array())
            return false;
        for (const auto& entry: required)
        {
            if (entry.is_string() && entry.get<std::string>() == name)
                return true;
        }
        return false;
    }

} // namespace

auto parseInputSchema(const nlohmann::json& schema) -> std::vector<ParameterSpec>
{
    auto parameters = std::vector<ParameterSpec> {};
    if (!schema.is_object() || !schema.contains("properties") || !schema["properties"].is_object())
        return parameters;

    auto const required = schema.value("required", nlohmann::json::array());

    for (const auto& [name, property]: schema["properties"].items())
    {
        parameters.push_back(ParameterSpec {
            .name = name,
            .type = parameterTypeFromString(typeTagOf(property)),
            .description = json::getStringOr(property, "description", ""),
            .required = isListedAsRequired(required, name) || json::getBoolOr(property, "required", false),
        });
    }

    return parameters;
}

auto parseToolDescriptor(const nlohmann::json& tool) -> Result<ToolDescriptor>
{
    if (!tool.is_object() || !tool.contains("name") || !tool["name"].is_string())
        return makeError(ErrorCode::InvalidArgument, std::format("Tool entry without a name: {}", json::dump(tool)));

    auto descriptor = ToolDescriptor {
        .name = tool["name"].get<std::string>(),
        .description = json::getStringOr(tool, "description", ""),
        .parameters = parseInputSchema(tool.value("inputSchema", nlohmann::json::object())),
    };

    if (descriptor.name.empty())
        return makeError(ErrorCode::InvalidArgument, "Tool entry with an empty name");

    return descriptor;
}

} // namespace toolbridge
