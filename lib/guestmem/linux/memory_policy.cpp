#include "../guest_memory.hpp"

#include <cstdio>
#include <cstring>
#include <sys/mman.h>

namespace guestmem {

void GuestMemory::set_memory_policy(const MemoryPolicy& policy) const
{
	for (const auto& region : *m_regions)
	{
		const auto& mapping = region.mapping();
		/* Policies are advisory, so a failure is not fatal. */
		if (policy.use_hugepages) {
			try {
				mapping.advise(0, mapping.size(), MADV_HUGEPAGE);
			} catch (const MappingException& e) {
				fprintf(stderr, "Failed to enable hugepages for guest memory at 0x%lX: %s\n",
					region.start().offset(), strerror(e.error_number()));
			}
		}
		if (policy.lock_guest_memory) {
			try {
				mapping.lock_on_fault();
			} catch (const MappingException& e) {
				fprintf(stderr, "Failed to lock guest memory at 0x%lX: %s\n",
					region.start().offset(), strerror(e.error_number()));
			}
		}
	}
}

void GuestMemory::remove_range(GuestAddress addr, uint64_t count) const
{
	if (UNLIKELY(!this->is_valid_range(addr, count))) {
		memory_exception(Error::InvalidGuestAddress,
			"Range to remove is not inside a single region", addr.offset(), count);
	}
	access_in_region(addr,
		[count] (const MemoryMapping& mapping, size_t offset) {
			mapping.remove_range(offset, count);
		});
}

} // guestmem
