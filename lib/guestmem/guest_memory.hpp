#pragma once
#include "common.hpp"
#include "guest_address.hpp"
#include "memory_region.hpp"
#include <iterator>
#include <memory>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace guestmem {

/* What the hypervisor needs to install one region as a guest
   physical memory slot, or a peer process needs to map it. */
struct MemoryRegionInformation {
	size_t index;
	GuestAddress guest_addr;
	size_t size;
	uintptr_t host_addr;
	const BackingObject& shm;
	uint64_t shm_offset;
};

/* A (guest address, length) request from the async I/O executor. */
struct MemRegion {
	uint64_t offset;
	size_t   len;
};

/* Tracks the memory regions mapped into a guest, along with the
   backing objects of those regions. The set of regions is fixed at
   construction, so every query is lock-free and may be called from
   any thread. Copies are cheap and share the same regions. */
struct GuestMemory
{
	using range_t = std::pair<GuestAddress, uint64_t>;
	using region_list_t = std::vector<MemoryRegion>;

	/* Allocates one shared memory object for all ranges, which must be
	   sorted, non-overlapping and host page size aligned. */
	static GuestMemory New(std::span<const range_t> ranges, const MemoryOptions& = {});
	/* Builds guest memory from regions with their own backing objects. */
	static GuestMemory from_regions(region_list_t regions, const MemoryOptions& = {});

	/* Exclusive end of the highest region. */
	GuestAddress end_addr() const noexcept;
	/* Sum of all region sizes. */
	uint64_t memory_size() const noexcept;
	size_t num_regions() const noexcept { return m_regions->size(); }

	bool address_in_range(GuestAddress addr) const noexcept;
	/* True if [start, end) intersects any region. */
	bool range_overlap(GuestAddress start, GuestAddress end) const noexcept;
	/* Returns addr + offset when that address is in a region. Only the
	   end point is checked, use is_valid_range() for the whole span. */
	std::optional<GuestAddress> checked_offset(GuestAddress addr, uint64_t offset) const noexcept;
	/* True if [start, start + length) is non-empty and inside a single
	   region. Adjacent regions are not contiguous in host memory. */
	bool is_valid_range(GuestAddress start, uint64_t length) const noexcept;

	struct RegionIterator;
	struct RegionRange;
	/* Lazy, restartable sequence of MemoryRegionInformation. */
	RegionRange regions() const noexcept;
	/* Calls cb(const MemoryRegionInformation&) for each region in order.
	   An exception from the callback stops the iteration. */
	template <typename F>
	void with_regions(F&& cb) const;

	/* Writes as much of buf as fits in the region containing addr. */
	size_t write_at_addr(std::span<const uint8_t> buf, GuestAddress addr) const;
	/* Like write_at_addr(), but a partial write is an error. The
	   bytes that fit have been written regardless. */
	void write_all_at_addr(std::span<const uint8_t> buf, GuestAddress addr) const;
	size_t read_at_addr(std::span<uint8_t> buf, GuestAddress addr) const;
	void read_exact_at_addr(std::span<uint8_t> buf, GuestAddress addr) const;

	/* Typed access. The object must fit in the containing region. */
	template <typename T>
	T read_obj_from_addr(GuestAddress addr) const;
	template <typename T>
	void write_obj_at_addr(const T& value, GuestAddress addr) const;

	VolatileSlice get_slice_at_addr(GuestAddress addr, size_t len) const;
	template <typename T>
	VolatileRef<T> get_ref_at_addr(GuestAddress addr) const;

	/* Moves exactly count bytes between guest memory and a file
	   descriptor. The span must fit in the containing region. */
	void read_to_memory(GuestAddress addr, int src_fd, size_t count) const;
	void write_from_memory(GuestAddress addr, int dst_fd, size_t count) const;

	/* Unchecked escape hatch for kernel interfaces that take host
	   addresses. The pointer is only valid while this memory lives. */
	uint8_t* get_host_address(GuestAddress addr) const;
	uint8_t* get_host_address_range(GuestAddress addr, size_t size) const;

	/* Backing object of the region containing a guest address, or
	   an offset relative to the first region. */
	const BackingObject& shm_region(GuestAddress addr) const;
	const BackingObject& offset_region(uint64_t offset) const;
	/* Offset of a guest address inside its backing object. */
	uint64_t offset_from_base(GuestAddress addr) const;
	/* USE WITH CAUTION: one descriptor per region, they are not
	   necessarily memfds and may repeat. */
	std::vector<int> as_raw_descriptors() const;

	/* Finds the region containing addr and calls
	   cb(const MemoryMapping&, size_t offset_in_region, uint64_t obj_offset). */
	template <typename F>
	auto do_in_region(GuestAddress addr, F&& cb) const;

	void set_memory_policy(const MemoryPolicy&) const;
	/* Releases the host pages behind [addr, addr + count). */
	void remove_range(GuestAddress addr, uint64_t count) const;
	VolatileSlice get_volatile_slice(MemRegion) const;

	void print_layout() const;

	/* Copy only, so that no handle is ever left without regions. */
	GuestMemory(const GuestMemory&) = default;
	GuestMemory& operator=(const GuestMemory&) = default;

private:
	explicit GuestMemory(region_list_t regions);
	const MemoryRegion* find_region(GuestAddress addr) const noexcept;
	/* do_in_region() reporting mapping failures as memory access errors. */
	template <typename F>
	auto access_in_region(GuestAddress addr, F&& cb) const;
	[[noreturn]] static void memory_exception(Error, const char*, uint64_t, uint64_t = 0, int = 0);

	std::shared_ptr<const region_list_t> m_regions;
};

struct GuestMemory::RegionIterator
{
	using iterator_category = std::forward_iterator_tag;
	using value_type = MemoryRegionInformation;
	using difference_type = std::ptrdiff_t;

	MemoryRegionInformation operator*() const noexcept;
	RegionIterator& operator++() noexcept { ++m_index; return *this; }
	RegionIterator operator++(int) noexcept { auto it = *this; ++m_index; return it; }
	bool operator==(const RegionIterator& other) const noexcept {
		return m_regions == other.m_regions && m_index == other.m_index;
	}

	const region_list_t* m_regions = nullptr;
	size_t m_index = 0;
};

struct GuestMemory::RegionRange
{
	RegionIterator begin() const noexcept { return {m_regions.get(), 0}; }
	RegionIterator end() const noexcept { return {m_regions.get(), m_regions->size()}; }
	size_t size() const noexcept { return m_regions->size(); }

	/* Keeps the regions alive while iterating. */
	std::shared_ptr<const region_list_t> m_regions;
};

#include "guest_memory_inline.hpp"
}
