#pragma once

#include <stdexcept>
#include <string>

namespace ovl {

enum class error {
	out_of_range,
	underflow,
	deletion_underflow,
};

inline auto to_string(error e) -> const char* {
	switch (e) {
		case error::out_of_range: return "index out of range";
		case error::underflow: return "pop from empty array";
		case error::deletion_underflow: return "deletion precedes an earlier deletion";
	}
	return "unknown error";
}

class array_error : public std::logic_error {
public:
	array_error(error code, const std::string& what) : std::logic_error(what), code_{code} {}
	auto code() const { return code_; }
private:
	error code_;
};

class index_out_of_range : public array_error {
public:
	explicit index_out_of_range(const std::string& what) : array_error(error::out_of_range, what) {}
	explicit index_out_of_range(const char* what) : array_error(error::out_of_range, what) {}
};
class underflow : public array_error {
public:
	explicit underflow(const std::string& what) : array_error(error::underflow, what) {}
	explicit underflow(const char* what) : array_error(error::underflow, what) {}
};
class deletion_underflow : public array_error {
public:
	explicit deletion_underflow(const std::string& what) : array_error(error::deletion_underflow, what) {}
	explicit deletion_underflow(const char* what) : array_error(error::deletion_underflow, what) {}
};

[[noreturn]] inline auto throw_error(error e, const std::string& detail) -> void {
	const auto what{std::string{to_string(e)} + ": " + detail};
	switch (e) {
		case error::out_of_range: throw index_out_of_range{what};
		case error::underflow: throw underflow{what};
		case error::deletion_underflow: throw deletion_underflow{what};
	}
	throw array_error{e, what};
}

} // ovl
