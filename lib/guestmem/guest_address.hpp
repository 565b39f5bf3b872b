#pragma once
#include "common.hpp"
#include <cassert>
#include <compare>
#include <optional>
#include <ostream>

namespace guestmem {

/* An offset into the guest physical address space. */
struct GuestAddress {
	uint64_t value = 0;

	constexpr GuestAddress() noexcept = default;
	constexpr explicit GuestAddress(uint64_t v) noexcept : value(v) {}

	constexpr uint64_t offset() const noexcept { return value; }

	/* Returns nothing instead of wrapping around. */
	constexpr std::optional<GuestAddress> checked_add(uint64_t other) const noexcept {
		const uint64_t sum = this->value + other;
		if (UNLIKELY(sum < this->value))
			return std::nullopt;
		return GuestAddress{sum};
	}
	constexpr std::optional<GuestAddress> checked_sub(uint64_t other) const noexcept {
		if (UNLIKELY(other > this->value))
			return std::nullopt;
		return GuestAddress{this->value - other};
	}
	/* Only for arithmetic that has already been bounds-checked. */
	constexpr GuestAddress unchecked_add(uint64_t other) const noexcept {
		return GuestAddress{this->value + other};
	}
	constexpr GuestAddress unchecked_sub(uint64_t other) const noexcept {
		return GuestAddress{this->value - other};
	}

	/* Distance from base. Callers check containment first. */
	constexpr uint64_t offset_from(GuestAddress base) const noexcept {
		assert(base.value <= this->value && "offset_from() below base");
		return this->value - base.value;
	}

	constexpr GuestAddress mask(uint64_t m) const noexcept {
		return GuestAddress{this->value & m};
	}

	/* Round up to a power-of-two alignment. */
	constexpr std::optional<GuestAddress> align(uint64_t alignment) const noexcept {
		assert(alignment != 0 && (alignment & (alignment - 1)) == 0);
		const uint64_t mask = alignment - 1;
		if (auto addr = checked_add(mask))
			return addr->mask(~mask);
		return std::nullopt;
	}

	constexpr auto operator<=>(const GuestAddress&) const noexcept = default;
};

inline std::ostream& operator<<(std::ostream& os, GuestAddress addr)
{
	const auto flags = os.flags();
	os << "0x" << std::hex << addr.value;
	os.flags(flags);
	return os;
}

} // guestmem
