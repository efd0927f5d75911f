#pragma once

#include <iterator>
#include <string>
#include <vector>
#include "address_space.hpp"
#include "errors.hpp"
#include "expected.hpp"
#include "tombstone_log.hpp"

namespace ovl {

namespace sparse_array_detail {

template <typename Array>
struct iterator_t
{
	using iterator_category = std::forward_iterator_tag;
	using difference_type   = std::ptrdiff_t;
	using value_type        = word;
	using pointer           = const word*;
	using reference         = word;
	iterator_t(const Array* array, word position)
		: array_{array}
		, position_{position}
	{}
	auto operator*() const -> reference {
		return array_->get(position_);
	}
	auto operator++() -> iterator_t& {
		position_++;
		return *this;
	}
	auto operator++(int) -> iterator_t {
		iterator_t tmp = *this;
		++(*this);
		return tmp;
	}
	auto index() const { return position_; }
	friend bool operator== (const iterator_t& a, const iterator_t& b) { return a.position_ == b.position_; };
	friend bool operator!= (const iterator_t& a, const iterator_t& b) { return a.position_ != b.position_; };
private:
	const Array* array_;
	word position_;
};

inline auto describe(word index, word size) -> std::string {
	return "index " + std::to_string(index) + ", size " + std::to_string(size);
}

} // sparse_array_detail

// Array of words laid over a word-addressed store.
//
// Deleting an interior element never moves any other
// element. Instead the deletion is appended to a tombstone
// log and later reads and writes skip over the vacated
// slots, at a cost of O(log d) reads after d deletions.
//
// All state lives in the store, so any number of
// sparse_array objects constructed with the same store and
// base address refer to the same array. Operations on one
// base address must be serialized by the caller.
template <typename Store, typename Layout = default_layout>
class sparse_array
{
public:

	using iterator_t = sparse_array_detail::iterator_t<sparse_array<Store, Layout>>;

	sparse_array(Store* store, address base)
		: store_{store}
		, space_{base}
		, log_{store, space_}
	{
	}

	auto base() const { return space_.base(); }
	auto size() const -> word { return store_->read(space_.length_address()); }
	auto empty() const { return size() == 0; }
	auto tombstone_count() const { return log_.count(); }
	auto tombstones() const -> const tombstone_log<Store, Layout>& { return log_; }
	auto addresses() const -> const address_space<Layout>& { return space_; }

	auto begin() const { return iterator_t{this, 0}; }
	auto end() const { return iterator_t{this, size()}; }

	// Overwrites the element at index, or appends if index
	// is one past the end.
	auto store(word index, word value) -> void
	{
		if (const auto result{try_store(index, value)}; !result) {
			throw_error(result.get_error(), sparse_array_detail::describe(index, size()));
		}
	}

	auto get(word index) const -> word
	{
		const auto result{try_get(index)};
		if (!result) {
			throw_error(result.get_error(), sparse_array_detail::describe(index, size()));
		}
		return result.get_value();
	}

	auto push(word value) -> void
	{
		write_element(append_slot(), value);
	}

	// The vacated slot keeps its value but becomes
	// unreachable.
	auto pop() -> void
	{
		if (const auto result{try_pop()}; !result) {
			throw_error(result.get_error(), "size 0");
		}
	}

	auto back() const -> word
	{
		const auto length{size()};
		if (length == 0) {
			throw_error(error::underflow, "back() on empty array");
		}
		return read_element(length - 1);
	}

	// Deletes without checking that index is at or after the
	// most recently deleted index. Deleting out of order
	// corrupts every later lookup.
	auto delete_at(word index) -> void
	{
		if (const auto result{try_delete_at(index)}; !result) {
			throw_error(result.get_error(), sparse_array_detail::describe(index, size()));
		}
	}

	// Deletes, rejecting any index before the most recently
	// deleted one.
	auto safe_delete_at(word index) -> void
	{
		if (const auto result{try_safe_delete_at(index)}; !result) {
			throw_error(result.get_error(), sparse_array_detail::describe(index, size()));
		}
	}

	auto try_store(word index, word value) -> expected<void>
	{
		const auto length{size()};
		if (index > length) {
			return error::out_of_range;
		}
		if (index == length) {
			store_->write(space_.length_address(), length + 1);
		}
		write_element(index, value);
		return {};
	}

	auto try_get(word index) const -> expected<word>
	{
		if (index >= size()) {
			return error::out_of_range;
		}
		return read_element(index);
	}

	auto try_pop() -> expected<void>
	{
		const auto length{size()};
		if (length == 0) {
			return error::underflow;
		}
		store_->write(space_.length_address(), length - 1);
		return {};
	}

	auto try_delete_at(word index) -> expected<void>
	{
		const auto length{size()};
		if (index >= length) {
			return error::out_of_range;
		}
		store_->write(space_.length_address(), length - 1);
		log_.record_deletion(index);
		return {};
	}

	auto try_safe_delete_at(word index) -> expected<void>
	{
		const auto length{size()};
		if (index >= length) {
			return error::out_of_range;
		}
		if (!log_.accepts(index)) {
			return error::deletion_underflow;
		}
		store_->write(space_.length_address(), length - 1);
		log_.record_deletion(index);
		return {};
	}

	// Reads every live element in logical order.
	auto to_vector() const -> std::vector<word>
	{
		std::vector<word> out;
		out.reserve(size());
		for (const auto value : *this) {
			out.push_back(value);
		}
		return out;
	}

	// Physical address currently backing logical index.
	// Does not check bounds.
	auto physical_address(word index) const -> address
	{
		return space_.element_address(index) + log_.resolve_offset(index);
	}

private:

	// Returns: The logical index of the new element.
	auto append_slot() -> word
	{
		const auto length{size()};
		store_->write(space_.length_address(), length + 1);
		return length;
	}

	auto read_element(word index) const -> word
	{
		return store_->read(physical_address(index));
	}

	auto write_element(word index, word value) -> void
	{
		store_->write(physical_address(index), value);
	}

	Store* store_;
	address_space<Layout> space_;
	tombstone_log<Store, Layout> log_;
};

} // ovl
