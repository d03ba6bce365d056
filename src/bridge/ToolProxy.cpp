// SPDX-License-Identifier: Apache-2.0
#include "ToolProxy.hpp"

#include <bridge/InvocationRouter.hpp>
#include <core/JsonUtils.hpp>

#include <format>
#include <limits>

namespace toolbridge
{

namespace
{

    auto valueTypeName(const ParameterValue& value) -> std::string_view
    {
        return parameterTypeToString(static_cast<ParameterType>(value.index()));
    }

    auto typeMismatch(const ParameterSpec& spec, std::string_view actual) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Parameter '{}' expects {}, got {}",
                                     spec.name,
                                     parameterTypeToString(spec.type),
                                     actual));
    }

} // namespace

auto coerceParameterValue(const ParameterSpec& spec, ParameterValue value) -> Result<ParameterValue>
{
    if (spec.type == ParameterType::Number)
    {
        if (auto const* integer = std::get_if<std::int64_t>(&value))
            return ParameterValue { static_cast<double>(*integer) };
    }

    if (static_cast<ParameterType>(value.index()) != spec.type)
        return typeMismatch(spec, valueTypeName(value));

    return value;
}

auto parameterValueFromJson(const ParameterSpec& spec, const nlohmann::json& value) -> Result<ParameterValue>
{
    switch (spec.type)
    {
        case ParameterType::String:
            if (value.is_string())
                return ParameterValue { value.get<std::string>() };
            break;
        case ParameterType::Integer:
            if (value.is_number_unsigned()
                && value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
                return makeError(ErrorCode::InvalidArgument,
                                 std::format("Parameter '{}' is out of range", spec.name));
            if (value.is_number_integer())
                return ParameterValue { value.get<std::int64_t>() };
            break;
        case ParameterType::Number:
            if (value.is_number())
                return ParameterValue { value.get<double>() };
            break;
        case ParameterType::Boolean:
            if (value.is_boolean())
                return ParameterValue { value.get<bool>() };
            break;
    }
    return typeMismatch(spec, value.type_name());
}

auto parameterValueToJson(const ParameterValue& value) -> nlohmann::json
{
    return std::visit([](const auto& v) { return nlohmann::json(v); }, value);
}

ToolProxy::ToolProxy(ToolDescriptor descriptor, std::string providerName, InvocationRouter& router):
    _descriptor(std::move(descriptor)), _providerName(std::move(providerName)), _router(router)
{
}

auto ToolProxy::set(std::string_view parameter, ParameterValue value) -> VoidResult
{
    auto const* spec = _descriptor.findParameter(parameter);
    if (!spec)
    {
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Tool '{}' has no parameter '{}'", _descriptor.name, parameter));
    }

    auto coerced = coerceParameterValue(*spec, std::move(value));
    if (!coerced)
        return std::unexpected(coerced.error());

    _bound.insert_or_assign(spec->name, std::move(*coerced));
    return {};
}

auto ToolProxy::bind(const nlohmann::json& values) -> VoidResult
{
    if (!values.is_object())
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Expected a JSON object, got {}", values.type_name()));

    auto staged = std::map<std::string, ParameterValue, std::less<>> {};
    for (const auto& [key, value]: values.items())
    {
        auto const* spec = _descriptor.findParameter(key);
        if (!spec)
        {
            return makeError(ErrorCode::InvalidArgument,
                             std::format("Tool '{}' has no parameter '{}'", _descriptor.name, key));
        }
        auto converted = parameterValueFromJson(*spec, value);
        if (!converted)
            return std::unexpected(converted.error());
        staged.insert_or_assign(key, std::move(*converted));
    }

    for (auto& [key, value]: staged)
        _bound.insert_or_assign(key, std::move(value));
    return {};
}

void ToolProxy::unset(std::string_view parameter)
{
    if (auto const it = _bound.find(parameter); it != _bound.end())
        _bound.erase(it);
}

void ToolProxy::clear()
{
    _bound.clear();
}

auto ToolProxy::bound(std::string_view parameter) const -> const ParameterValue*
{
    auto const it = _bound.find(parameter);
    return it != _bound.end() ? &it->second : nullptr;
}

auto ToolProxy::buildArguments(const nlohmann::json& explicitArgs) const -> Result<nlohmann::json>
{
    if (!explicitArgs.is_null() && !explicitArgs.is_object())
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Arguments must be a JSON object, got {}", explicitArgs.type_name()));

    auto arguments = nlohmann::json::object();
    for (const auto& [key, value]: _bound)
        arguments[key] = parameterValueToJson(value);

    if (explicitArgs.is_object())
    {
        for (const auto& [key, value]: explicitArgs.items())
        {
            auto const* spec = _descriptor.findParameter(key);
            if (!spec)
            {
                arguments[key] = value;
                continue;
            }

            // An explicit null leaves the parameter out.
            if (value.is_null())
            {
                arguments.erase(key);
                continue;
            }

            auto converted = parameterValueFromJson(*spec, value);
            if (!converted)
                return std::unexpected(converted.error());
            arguments[key] = parameterValueToJson(*converted);
        }
    }

    for (const auto& param: _descriptor.parameters)
    {
        if (param.required && !arguments.contains(param.name))
        {
            return makeError(ErrorCode::InvalidArgument,
                             std::format("Missing required parameter '{}' for tool '{}'", param.name, _descriptor.name));
        }
    }

    return arguments;
}

auto ToolProxy::invoke(const nlohmann::json& explicitArgs) const -> std::string
{
    return _router.get().invoke(*this, explicitArgs);
}

auto ToolProxy::call(const nlohmann::json& explicitArgs) const -> std::future<std::string>
{
    return _router.get().invokeAsync(*this, explicitArgs);
}

auto materialize(ToolDescriptor descriptor, std::string providerName, InvocationRouter& router) -> ToolProxy
{
    return ToolProxy(std::move(descriptor), std::move(providerName), router);
}

} // namespace toolbridge
