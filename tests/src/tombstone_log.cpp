#include <random>
#include <catch2/catch_test_macros.hpp>
#include <ovl/memory_store.hpp>
#include <ovl/tombstone_log.hpp>
#include "reference_array.hpp"

TEST_CASE("tombstone_log", "[tombstone_log]") {
	ovl::memory_store store;
	ovl::tombstone_log<ovl::memory_store> log{&store, ovl::address_space<>{7}};

	SECTION("empty log") {
		REQUIRE(log.count() == 0);
		REQUIRE(!log.last_entry());
		REQUIRE(log.resolve_offset(0) == 0);
		REQUIRE(log.resolve_offset(1000) == 0);
		REQUIRE(log.accepts(0));
		REQUIRE(store.size() == 0);
	}

	SECTION("recorded values") {
		REQUIRE(log.record_deletion(1) == 2);
		REQUIRE(log.record_deletion(3) == 5);
		REQUIRE(log.record_deletion(5) == 8);
		REQUIRE(log.record_deletion(6) == 10);
		REQUIRE(log.count() == 4);
		REQUIRE(log.entry(0) == 2);
		REQUIRE(log.entry(3) == 10);
		REQUIRE(*log.last_entry() == 10);
	}

	SECTION("single deletion") {
		log.record_deletion(1);
		REQUIRE(log.resolve_offset(0) == 0);
		REQUIRE(log.resolve_offset(1) == 1);
		REQUIRE(log.resolve_offset(2) == 1);
	}

	SECTION("several deletions") {
		log.record_deletion(1);
		log.record_deletion(3);
		log.record_deletion(5);
		log.record_deletion(6);
		REQUIRE(log.resolve_offset(0) == 0);
		REQUIRE(log.resolve_offset(1) == 1);
		REQUIRE(log.resolve_offset(2) == 1);
		REQUIRE(log.resolve_offset(3) == 2);
		REQUIRE(log.resolve_offset(4) == 2);
		REQUIRE(log.resolve_offset(5) == 3);
		REQUIRE(log.resolve_offset(6) == 4);
	}

	SECTION("repeated deletion at one index") {
		log.record_deletion(1);
		log.record_deletion(1);
		log.record_deletion(1);
		REQUIRE(log.resolve_offset(0) == 0);
		REQUIRE(log.resolve_offset(1) == 3);
		REQUIRE(log.resolve_offset(2) == 3);
	}

	SECTION("ordering") {
		log.record_deletion(3);
		REQUIRE(log.accepts(3));
		REQUIRE(log.accepts(4));
		REQUIRE(!log.accepts(2));
		REQUIRE(!log.accepts(0));
	}

	SECTION("resolving does not write") {
		log.record_deletion(2);
		const auto words{store.size()};
		log.resolve_offset(0);
		log.resolve_offset(5);
		REQUIRE(store.size() == words);
	}
}

TEST_CASE("tombstone_log matches a brute force scan", "[tombstone_log]") {
	std::mt19937 rng(12345);
	auto randi = [&rng](uint64_t min, uint64_t max) {
		std::uniform_int_distribution<uint64_t> dist(min, max);
		return dist(rng);
	};
	for (int run = 0; run < 200; run++) {
		ovl::memory_store store;
		ovl::tombstone_log<ovl::memory_store> log{&store, ovl::address_space<>{static_cast<ovl::address>(run)}};
		ovl::test::reference_array ref;
		uint64_t index{0};
		const auto deletions{randi(1, 64)};
		for (uint64_t d = 0; d < deletions; d++) {
			index += randi(0, 3);
			REQUIRE(log.accepts(index));
			ref.vacate(index);
			log.record_deletion(index);
			for (uint64_t i = 0; i < index + 8; i++) {
				REQUIRE(log.resolve_offset(i) == ref.offset(i));
			}
		}
	}
}
