#pragma once
#include "common.hpp"
#include "volatile_slice.hpp"
#include <cstring>
#include <span>

namespace guestmem {

/* Host page size, cached after the first call. */
extern size_t host_page_size() noexcept;

/* A shared read/write mapping of a descriptor. Owns the host virtual
   range exclusively and unmaps it on destruction. */
struct MemoryMapping
{
	/* Maps size bytes of fd starting at offset, which must be page aligned. */
	static MemoryMapping from_descriptor(int fd, size_t size, uint64_t offset);

	uint8_t* as_ptr() const noexcept { return m_ptr; }
	size_t size() const noexcept { return m_size; }

	/* Partial copies are allowed: returns the number of bytes copied. */
	size_t write_slice(std::span<const uint8_t> buf, size_t offset) const;
	size_t read_slice(std::span<uint8_t> buf, size_t offset) const;

	template <typename T>
	void write_obj(const T& value, size_t offset) const;
	template <typename T>
	T read_obj(size_t offset) const;

	VolatileSlice get_slice(size_t offset, size_t count) const;

	/* Transfer exactly count bytes between the mapping and a file
	   descriptor, retrying short reads and writes. */
	void read_to_memory(size_t offset, int src_fd, size_t count) const;
	void write_from_memory(size_t offset, int dst_fd, size_t count) const;

	/* Releases the backing pages. They read back as zeroes. */
	void remove_range(size_t offset, size_t count) const;
	void advise(size_t offset, size_t count, int advice) const;
	void lock_on_fault() const;

	MemoryMapping(MemoryMapping&&) noexcept;
	MemoryMapping& operator=(MemoryMapping&&) noexcept;
	MemoryMapping(const MemoryMapping&) = delete;
	MemoryMapping& operator=(const MemoryMapping&) = delete;
	~MemoryMapping();

private:
	MemoryMapping(uint8_t* p, size_t s) : m_ptr(p), m_size(s) {}
	/* Throws unless [offset, offset + count) is inside the mapping. */
	size_t range_end(size_t offset, size_t count) const;
	[[noreturn]] static void mapping_exception(MappingError, const char*,
		uint64_t offset, uint64_t count, uint64_t size, int err = 0);

	uint8_t* m_ptr = nullptr;
	size_t   m_size = 0;
};

template <typename T>
inline void MemoryMapping::write_obj(const T& value, size_t offset) const
{
	static_assert(std::is_trivially_copyable_v<T>, "write_obj requires plain data");
	range_end(offset, sizeof(T));
	std::memcpy(&m_ptr[offset], &value, sizeof(T));
}

template <typename T>
inline T MemoryMapping::read_obj(size_t offset) const
{
	static_assert(std::is_trivially_copyable_v<T>, "read_obj requires plain data");
	range_end(offset, sizeof(T));
	T value;
	std::memcpy(&value, &m_ptr[offset], sizeof(T));
	return value;
}

} // guestmem
