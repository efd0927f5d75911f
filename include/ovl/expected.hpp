#pragma once

#include <optional>
#include <variant>
#include "errors.hpp"

namespace ovl {

// Either a value or the error that prevented one.
template <typename Value>
struct expected
{
	expected(const expected& rhs) = default;
	expected(expected&& rhs) noexcept = default;
	auto operator=(const expected& rhs) -> expected& = default;
	auto operator=(expected&& rhs) noexcept -> expected& = default;

	expected(const Value& value)
		: var_{value}
	{
	}

	expected(Value&& value)
		: var_{std::move(value)}
	{
	}

	expected(error e)
		: var_{e}
	{
	}

	operator bool() const
	{
		return std::holds_alternative<Value>(var_);
	}

	auto get_error() const -> error
	{
		return std::get<error>(var_);
	}

	auto& get_value()
	{
		return std::get<Value>(var_);
	}

	auto& get_value() const
	{
		return std::get<Value>(var_);
	}

	auto operator*() -> Value& { return get_value(); }
	auto operator*() const -> const Value& { return get_value(); }

private:

	std::variant<Value, error> var_;
};

template <>
struct expected<void>
{
	expected() = default;

	expected(error e)
		: error_{e}
	{
	}

	operator bool() const
	{
		return !error_;
	}

	auto get_error() const -> error
	{
		return *error_;
	}

private:

	std::optional<error> error_;
};

} // ovl
