#include "tools/argument_validator.h"
#include <algorithm>

static bool matches_type(const json &value, const std::string &type)
{
	if (type == "string")
		return value.is_string();
	if (type == "number")
		return value.is_number();
	if (type == "integer")
		return value.is_number_integer();
	if (type == "boolean")
		return value.is_boolean();
	if (type == "array")
		return value.is_array();
	if (type == "object")
		return value.is_object();
	if (type == "null")
		return value.is_null();
	return false;
}

static std::string join_path(const std::string &parent, const std::string &key)
{
	return parent == "$" ? key : parent + "." + key;
}

void ArgumentValidator::apply_defaults(json &args, const json &schema)
{
	if (!schema.is_object() || !args.is_object())
		return;

	const json props = schema.value("properties", json::object());

	for (const auto &[key, prop] : props.items())
	{
		if (!prop.is_object())
			continue;

		if (!args.contains(key))
		{
			if (prop.contains("default"))
				args[key] = prop["default"];
			continue;
		}

		if (args[key].is_object())
			apply_defaults(args[key], prop);
	}
}

std::optional<ArgumentError>
ArgumentValidator::check_object(const json &object, const json &schema, const std::string &path)
{
	const json props = schema.value("properties", json::object());

	for (const auto &req : schema.value("required", json::array()))
	{
		if (req.is_string() && !object.contains(req.get<std::string>()))
			return ArgumentError{join_path(path, req.get<std::string>()), "missing required field"};
	}

	// Schemas without a property list accept any keys
	if (!schema.contains("properties"))
		return std::nullopt;

	for (const auto &[key, value] : object.items())
	{
		if (!props.contains(key))
			return ArgumentError{join_path(path, key), "unknown field"};

		if (auto err = check_value(value, props[key], join_path(path, key)))
			return err;
	}

	return std::nullopt;
}

std::optional<ArgumentError>
ArgumentValidator::check_value(const json &value, const json &schema, const std::string &path)
{
	if (!schema.is_object())
		return std::nullopt;

	if (schema.contains("type") && schema["type"].is_string())
	{
		const std::string type = schema["type"].get<std::string>();
		if (!matches_type(value, type))
			return ArgumentError{path, "type mismatch, expected " + type};
	}

	if (schema.contains("enum") && schema["enum"].is_array())
	{
		const json &allowed = schema["enum"];
		if (std::find(allowed.begin(), allowed.end(), value) == allowed.end())
			return ArgumentError{path, "value not in enum"};
	}

	if (value.is_number())
	{
		double number = value.get<double>();
		if (schema.contains("minimum") && schema["minimum"].is_number() && number < schema["minimum"].get<double>())
			return ArgumentError{path, "value below minimum " + schema["minimum"].dump()};
		if (schema.contains("maximum") && schema["maximum"].is_number() && number > schema["maximum"].get<double>())
			return ArgumentError{path, "value above maximum " + schema["maximum"].dump()};
	}

	if (value.is_array() && schema.contains("items"))
	{
		for (size_t i = 0; i < value.size(); ++i)
		{
			if (auto err = check_value(value[i], schema["items"], path + "[" + std::to_string(i) + "]"))
				return err;
		}
	}

	if (value.is_object() && (schema.contains("properties") || schema.contains("required")))
		return check_object(value, schema, path);

	return std::nullopt;
}

std::optional<ArgumentError>
ArgumentValidator::validate(json &args, const json &schema)
{
	if (!schema.is_object())
		return std::nullopt;

	if (!args.is_object())
		return ArgumentError{"$", "arguments must be an object"};

	apply_defaults(args, schema);
	return check_object(args, schema, "$");
}
