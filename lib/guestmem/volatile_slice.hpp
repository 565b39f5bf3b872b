#pragma once
#include "common.hpp"
#include <cstring>
#include <span>

namespace guestmem {

/* A view of guest memory that may be modified concurrently by the
   guest or by other threads. Shared, externally synchronized: there
   is no locking and no atomicity beyond what the caller provides. */
struct VolatileSlice
{
	constexpr VolatileSlice() noexcept = default;
	constexpr VolatileSlice(uint8_t* p, size_t s) noexcept : m_ptr(p), m_size(s) {}

	uint8_t* as_mut_ptr() const noexcept { return m_ptr; }
	const uint8_t* as_ptr() const noexcept { return m_ptr; }
	size_t size() const noexcept { return m_size; }
	bool empty() const noexcept { return m_size == 0; }
	std::span<uint8_t> span() const noexcept { return {m_ptr, m_size}; }

	VolatileSlice sub_slice(size_t offset, size_t count) const;
	/* Returns the rest of the slice after offset. */
	VolatileSlice offset(size_t count) const;

	/* Copies min(size(), buf.size()) bytes, returning the amount. */
	size_t copy_to(std::span<uint8_t> buf) const noexcept;
	size_t copy_from(std::span<const uint8_t> buf) const noexcept;
	void write_bytes(uint8_t value) const noexcept;

private:
	uint8_t* m_ptr = nullptr;
	size_t   m_size = 0;
};

/* Load/store handle for exactly sizeof(T) bytes of guest memory. */
template <typename T>
struct VolatileRef
{
	static_assert(std::is_trivially_copyable_v<T>, "VolatileRef requires plain data");

	explicit VolatileRef(uint8_t* p) noexcept : m_ptr(p) {}

	T load() const noexcept {
		if constexpr (std::is_integral_v<T>) {
			if (is_aligned())
				return *reinterpret_cast<volatile const T*>(m_ptr);
		}
		T value;
		std::memcpy(&value, m_ptr, sizeof(T));
		return value;
	}
	void store(const T& value) const noexcept {
		if constexpr (std::is_integral_v<T>) {
			if (is_aligned()) {
				*reinterpret_cast<volatile T*>(m_ptr) = value;
				return;
			}
		}
		std::memcpy(m_ptr, &value, sizeof(T));
	}
	uint8_t* as_mut_ptr() const noexcept { return m_ptr; }
	static constexpr size_t size() noexcept { return sizeof(T); }

private:
	bool is_aligned() const noexcept {
		return (reinterpret_cast<uintptr_t>(m_ptr) & (alignof(T) - 1)) == 0;
	}
	uint8_t* m_ptr;
};

} // guestmem
