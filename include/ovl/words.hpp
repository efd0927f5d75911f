#pragma once

#include <cstddef>
#include <cstdint>

namespace ovl {

using word = uint64_t;
using address = uint64_t;

namespace detail {

static constexpr uint64_t FNV_OFFSET_BASIS{14695981039346656037u};
static constexpr uint64_t FNV_PRIME{1099511628211u};

inline auto fnv1a_step(uint64_t hash, word value) -> uint64_t
{
	// Little-endian byte order regardless of host
	for (size_t i = 0; i < sizeof(word); i++) {
		hash ^= (value >> (i * 8)) & 0xFF;
		hash *= FNV_PRIME;
	}
	return hash;
}

} // detail

// 64-bit FNV-1a over the bytes of one or more words.
struct fnv1a {
	static auto hash(word a) -> address {
		return detail::fnv1a_step(detail::FNV_OFFSET_BASIS, a);
	}
	static auto hash(word a, word b) -> address {
		return detail::fnv1a_step(detail::fnv1a_step(detail::FNV_OFFSET_BASIS, a), b);
	}
};

struct default_layout {
	using hasher = fnv1a;
	// Mixed in with the base address to find the tombstone log.
	static constexpr word tombstone_tag{0x746f6d6273746f6e};
};

} // ovl
