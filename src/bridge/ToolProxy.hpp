// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <future>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace toolbridge
{

class InvocationRouter;

/// @brief Checks that a value matches the declared parameter type.
///
/// An integer is accepted for a number parameter and widened to double.
/// @return The value to store, or an InvalidArgument error.
[[nodiscard]] auto coerceParameterValue(const ParameterSpec& spec, ParameterValue value) -> Result<ParameterValue>;

/// @brief Converts an untyped JSON value into the parameter's declared type.
[[nodiscard]] auto parameterValueFromJson(const ParameterSpec& spec, const nlohmann::json& value)
    -> Result<ParameterValue>;

/// @brief Converts a typed value into its JSON representation.
[[nodiscard]] auto parameterValueToJson(const ParameterValue& value) -> nlohmann::json;

/// @brief Locally callable stand-in for one remote tool.
///
/// A proxy carries the tool's descriptor, the name of its provider and a set of bound
/// parameter values. It does not own the provider process; invocations go through the
/// InvocationRouter, which must outlive the proxy.
class ToolProxy
{
  public:
    ToolProxy(ToolDescriptor descriptor, std::string providerName, InvocationRouter& router);

    [[nodiscard]] auto name() const -> const std::string& { return _descriptor.name; }
    [[nodiscard]] auto description() const -> const std::string& { return _descriptor.description; }
    [[nodiscard]] auto parameters() const -> const std::vector<ParameterSpec>& { return _descriptor.parameters; }
    [[nodiscard]] auto providerName() const -> const std::string& { return _providerName; }
    [[nodiscard]] auto descriptor() const -> const ToolDescriptor& { return _descriptor; }

    /// @brief Binds a typed value to a declared parameter.
    /// @return Success, or InvalidArgument for an unknown parameter or mismatched type.
    [[nodiscard]] auto set(std::string_view parameter, ParameterValue value) -> VoidResult;

    /// @brief Binds every member of a JSON object, with the same checks as set().
    ///
    /// Nothing is bound if any member is rejected.
    [[nodiscard]] auto bind(const nlohmann::json& values) -> VoidResult;

    void unset(std::string_view parameter);
    void clear();

    /// @brief Returns the bound value of a parameter, if any.
    [[nodiscard]] auto bound(std::string_view parameter) const -> const ParameterValue*;

    /// @brief Merges bound values with @p explicitArgs into the tools/call arguments object.
    ///
    /// Explicit values take precedence and are checked against the declared types; keys the
    /// tool does not declare pass through unchanged.
    /// @return The arguments object, or InvalidArgument if a value has the wrong type or a
    ///         required parameter is missing.
    [[nodiscard]] auto buildArguments(const nlohmann::json& explicitArgs = nlohmann::json::object()) const
        -> Result<nlohmann::json>;

    /// @brief Calls the tool and waits for its textual result. Never fails: errors are
    ///        rendered as "Error..." strings.
    [[nodiscard]] auto invoke(const nlohmann::json& explicitArgs = nlohmann::json::object()) const
        -> std::string;

    /// @brief Calls the tool on the worker pool.
    [[nodiscard]] auto call(const nlohmann::json& explicitArgs = nlohmann::json::object()) const
        -> std::future<std::string>;

  private:
    ToolDescriptor _descriptor;
    std::string _providerName;
    std::reference_wrapper<InvocationRouter> _router;
    std::map<std::string, ParameterValue, std::less<>> _bound;
};

/// @brief Builds the proxy for one tool descriptor of a provider.
[[nodiscard]] auto materialize(ToolDescriptor descriptor, std::string providerName, InvocationRouter& router)
    -> ToolProxy;

} // namespace toolbridge
