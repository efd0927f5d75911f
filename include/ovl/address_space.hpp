#pragma once

#include "words.hpp"

namespace ovl {

// Derives every store address used by the array living at
// a base address. The length word sits at the base address
// itself, elements at H(base) + i, the tombstone count at
// H(base, tag) and tombstone entries at H(H(base, tag)) + k.
template <typename Layout = default_layout>
class address_space
{
public:

	using hasher = typename Layout::hasher;

	explicit address_space(address base)
		: base_{base}
		, element_base_{hasher::hash(base)}
		, tombstone_log_{hasher::hash(base, Layout::tombstone_tag)}
		, tombstone_base_{hasher::hash(tombstone_log_)}
	{
	}

	auto base() const { return base_; }
	auto length_address() const { return base_; }
	auto tombstone_log_address() const { return tombstone_log_; }

	// Canonical address of logical index i, before any
	// tombstone offset is applied.
	auto element_address(word index) const -> address
	{
		return element_base_ + index;
	}

	auto tombstone_entry_address(word k) const -> address
	{
		return tombstone_base_ + k;
	}

	auto operator==(const address_space& rhs) const { return base_ == rhs.base_; }
	auto operator!=(const address_space& rhs) const { return base_ != rhs.base_; }

private:

	address base_{0};
	address element_base_{0};
	address tombstone_log_{0};
	address tombstone_base_{0};
};

} // ovl
