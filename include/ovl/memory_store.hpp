#pragma once

#include <functional>
#include <unordered_map>
#include "words.hpp"

namespace ovl {

// Word-addressed store held in memory. Addresses that
// were never written read as zero.
class memory_store {
public:
	auto read(address addr) const -> word {
		const auto pos{words_.find(addr)};
		if (pos == words_.end()) {
			return 0;
		}
		return pos->second;
	}
	auto write(address addr, word value) -> void {
		words_[addr] = value;
	}
	auto contains(address addr) const -> bool {
		return words_.find(addr) != words_.end();
	}
	// Returns: The number of distinct addresses ever written.
	auto size() const { return words_.size(); }
	auto begin() const { return words_.begin(); }
	auto end() const { return words_.end(); }
private:
	std::unordered_map<address, word> words_;
};

struct access {
	enum class kind { read, write };
	kind type;
	address addr;
	word value;
};

// Forwards to another store, reporting every word access
// to the observer if one is set.
template <typename Store>
class traced_store {
public:
	using observer_t = std::function<void(const access&)>;

	traced_store(Store* inner)
		: inner_{inner}
	{}
	traced_store(Store* inner, observer_t observer)
		: inner_{inner}
		, observer_{std::move(observer)}
	{}
	auto set_observer(observer_t observer) -> void {
		observer_ = std::move(observer);
	}
	auto read(address addr) const -> word {
		const auto value{inner_->read(addr)};
		if (observer_) {
			observer_(access{access::kind::read, addr, value});
		}
		return value;
	}
	auto write(address addr, word value) -> void {
		inner_->write(addr, value);
		if (observer_) {
			observer_(access{access::kind::write, addr, value});
		}
	}
private:
	Store* inner_;
	observer_t observer_;
};

} // ovl
