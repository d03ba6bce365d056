// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <vector>

namespace toolbridge
{

/// @brief Derives typed parameter specs from a JSON-Schema-like input schema.
///
/// Reads `properties` (name → {type, description, required}) and the top-level `required`
/// array. A property is required if either source says so. Missing or unrecognized type
/// tags become ParameterType::String; a type array uses its first non-"null" entry.
/// @param schema The tool's `inputSchema` value; anything but an object yields no parameters.
[[nodiscard]] auto parseInputSchema(const nlohmann::json& schema) -> std::vector<ParameterSpec>;

/// @brief Parses one entry of a tools/list `result.tools` array.
/// @return The descriptor, or InvalidArgument if the entry has no string `name`.
[[nodiscard]] auto parseToolDescriptor(const nlohmann::json& tool) -> Result<ToolDescriptor>;

} // namespace toolbridge
