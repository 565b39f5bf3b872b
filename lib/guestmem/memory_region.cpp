#include "memory_region.hpp"

#include <limits>

namespace guestmem {

MemoryRegion::MemoryRegion(MemoryMapping mapping, GuestAddress base, BackingObject obj, uint64_t obj_offset)
	: m_mapping(std::move(mapping)),
	  m_guest_base(base),
	  m_shared_obj(std::move(obj)),
	  m_obj_offset(obj_offset)
{
	if (UNLIKELY(!m_guest_base.checked_add(m_mapping.size()))) {
		throw MemoryException(Error::MemoryRegionTooLarge,
			"Memory region wraps around the end of the address space",
			m_guest_base.offset(), m_mapping.size());
	}
}

static MemoryMapping map_region(int fd, uint64_t size, GuestAddress guest_base, uint64_t offset)
{
	if (UNLIKELY(size > std::numeric_limits<size_t>::max())) {
		throw MemoryException(Error::MemoryRegionTooLarge,
			"Memory region size is too large", guest_base.offset(), size);
	}
	try {
		return MemoryMapping::from_descriptor(fd, size, offset);
	} catch (const MappingException& e) {
		throw MemoryException(Error::MemoryMappingFailed,
			"Failed to map guest memory", offset, size, e.error_number());
	}
}

MemoryRegion MemoryRegion::new_from_shm(uint64_t size, GuestAddress guest_base,
	uint64_t offset, std::shared_ptr<SharedMemory> shm)
{
	auto mapping = map_region(shm->as_raw_descriptor(), size, guest_base, offset);
	return MemoryRegion(std::move(mapping), guest_base, BackingObject{std::move(shm)}, offset);
}

MemoryRegion MemoryRegion::new_from_file(uint64_t size, GuestAddress guest_base,
	uint64_t offset, std::shared_ptr<File> file)
{
	auto mapping = map_region(file->as_raw_descriptor(), size, guest_base, offset);
	return MemoryRegion(std::move(mapping), guest_base, BackingObject{std::move(file)}, offset);
}

} // guestmem
