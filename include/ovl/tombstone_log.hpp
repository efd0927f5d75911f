#pragma once

#include <optional>
#include "address_space.hpp"

namespace ovl {

// Append-only record of deletions for one array.
//
// Entry k holds i + k + 1, where i is the logical index
// deleted by the k-th deletion. While deletions arrive in
// non-decreasing logical order the entries strictly increase
// and (entry[k] - k - 1) is non-decreasing, which is what
// resolve_offset relies on.
template <typename Store, typename Layout = default_layout>
class tombstone_log
{
public:

	tombstone_log(Store* store, address_space<Layout> space)
		: store_{store}
		, space_{space}
	{
	}

	auto count() const -> word
	{
		return store_->read(space_.tombstone_log_address());
	}

	auto entry(word k) const -> word
	{
		return store_->read(space_.tombstone_entry_address(k));
	}

	auto last_entry() const -> std::optional<word>
	{
		const auto n{count()};
		if (n == 0) return std::nullopt;
		return entry(n - 1);
	}

	// Number of physical slots to skip past the canonical
	// address of logical index i. This is the number of
	// entries k with entry[k] <= i + k + 1, i.e. the number of
	// deletions recorded at a logical index <= i. That
	// predicate holds for a prefix of the log, so the
	// boundary is found by binary search in O(log count)
	// reads.
	auto resolve_offset(word index) const -> word
	{
		const auto n{count()};

		if (n == 0) return 0;

		word low{0};
		word high{n};

		while (low < high)
		{
			const auto mid{low + (high - low) / 2};
			const auto offset{mid + 1};
			const auto canonical{index + offset};

			if (canonical < entry(mid))
			{
				// Candidate offset too large
				high = mid;
			}
			else
			{
				// Entry mid lies at or before this index
				low = mid + 1;
			}
		}

		return low;
	}

	// Returns: The value recorded for this deletion.
	auto record_deletion(word index) -> word
	{
		const auto n{count()};
		const auto recorded{index + n + 1};
		store_->write(space_.tombstone_entry_address(n), recorded);
		store_->write(space_.tombstone_log_address(), n + 1);
		return recorded;
	}

	// True if deleting logical index would keep the entries
	// strictly increasing.
	auto accepts(word index) const -> bool
	{
		const auto last{last_entry()};
		if (!last) return true;
		return index + count() + 1 > *last;
	}

private:

	Store* store_;
	address_space<Layout> space_;
};

} // ovl
