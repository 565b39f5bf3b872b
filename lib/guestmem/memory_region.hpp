#pragma once
#include "backing_object.hpp"
#include "guest_address.hpp"
#include "memory_mapping.hpp"

namespace guestmem {

/* One contiguous range of guest physical memory, backed by a host
   mapping of a slice of a backing object. Regions do not know about
   their siblings: non-overlap is checked by GuestMemory. */
struct MemoryRegion
{
	static MemoryRegion new_from_shm(uint64_t size, GuestAddress guest_base,
		uint64_t offset, std::shared_ptr<SharedMemory> shm);
	static MemoryRegion new_from_file(uint64_t size, GuestAddress guest_base,
		uint64_t offset, std::shared_ptr<File> file);

	GuestAddress start() const noexcept { return m_guest_base; }
	/* Exclusive end. The range never wraps, see the constructor. */
	GuestAddress end() const noexcept { return m_guest_base.unchecked_add(m_mapping.size()); }
	size_t size() const noexcept { return m_mapping.size(); }
	bool contains(GuestAddress addr) const noexcept {
		return addr >= start() && addr < end();
	}

	const MemoryMapping& mapping() const noexcept { return m_mapping; }
	const BackingObject& shared_obj() const noexcept { return m_shared_obj; }
	uint64_t obj_offset() const noexcept { return m_obj_offset; }

	MemoryRegion(MemoryMapping, GuestAddress, BackingObject, uint64_t obj_offset);
	MemoryRegion(MemoryRegion&&) noexcept = default;
	MemoryRegion& operator=(MemoryRegion&&) noexcept = default;

private:
	MemoryMapping m_mapping;
	GuestAddress  m_guest_base;
	BackingObject m_shared_obj;
	uint64_t      m_obj_offset;
};

} // guestmem
