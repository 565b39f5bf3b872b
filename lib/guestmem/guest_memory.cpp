#include "guest_memory.hpp"

#include <algorithm>
#include <cstdio>
#include <limits>

namespace guestmem {
static constexpr bool VERBOSE_GUEST_MEMORY = false;

const char* to_string(Error kind) noexcept
{
	switch (kind) {
	case Error::InvalidGuestAddress:  return "invalid guest address";
	case Error::InvalidOffset:        return "invalid offset";
	case Error::InvalidSize:          return "size must not be zero";
	case Error::MemoryAccess:         return "invalid guest memory access";
	case Error::MemoryAddSealsFailed: return "failed to set seals on shm region";
	case Error::MemoryCreationFailed: return "failed to create shm region";
	case Error::MemoryMappingFailed:  return "failed to map guest memory";
	case Error::MemoryNotAligned:     return "shm regions must be page aligned";
	case Error::MemoryRegionOverlap:  return "memory regions overlap";
	case Error::MemoryRegionTooLarge: return "memory region size is too large";
	case Error::ShortRead:            return "incomplete read";
	case Error::ShortWrite:           return "incomplete write";
	case Error::VolatileMemoryAccess: return "volatile memory access out of bounds";
	}
	return "unknown guest memory error";
}

GuestMemory::GuestMemory(region_list_t regions)
	: m_regions(std::make_shared<const region_list_t>(std::move(regions)))
{
}

GuestMemory GuestMemory::New(std::span<const range_t> ranges, const MemoryOptions& options)
{
	/* Validate the whole layout before allocating anything. */
	const uint64_t page_mask = host_page_size() - 1;
	uint64_t total_size = 0;
	std::optional<GuestAddress> prev_end = GuestAddress{0};
	for (size_t i = 0; i < ranges.size(); i++)
	{
		const auto& [base, size] = ranges[i];
		if (UNLIKELY(size == 0)) {
			memory_exception(Error::InvalidSize, "Memory range size must not be zero", base.offset(), size);
		}
		if (UNLIKELY(size & page_mask)) {
			memory_exception(Error::MemoryNotAligned, "Memory range size is not page aligned", base.offset(), size);
		}
		if (i > 0 && (!prev_end || *prev_end > base)) {
			memory_exception(Error::MemoryRegionOverlap, "Memory ranges overlap", base.offset(), size);
		}
		if (UNLIKELY(size > std::numeric_limits<size_t>::max()
			|| __builtin_add_overflow(total_size, size, &total_size))) {
			memory_exception(Error::MemoryRegionTooLarge, "Memory range size is too large", base.offset(), size);
		}
		prev_end = base.checked_add(size);
	}

	auto shm = std::make_shared<SharedMemory>(SharedMemory::New(options.shm_name, total_size));
	if (options.seal_shm) {
		shm->add_size_seals();
	}

	region_list_t regions;
	regions.reserve(ranges.size());
	uint64_t offset = 0;
	for (const auto& [base, size] : ranges)
	{
		regions.push_back(MemoryRegion::new_from_shm(size, base, offset, shm));
		offset += size;
	}

	GuestMemory mem { std::move(regions) };
	const auto policy = options.policy();
	if (policy.use_hugepages || policy.lock_guest_memory) {
		mem.set_memory_policy(policy);
	}
	if (options.verbose) {
		mem.print_layout();
	}
	return mem;
}

GuestMemory GuestMemory::from_regions(region_list_t regions, const MemoryOptions& options)
{
	std::sort(regions.begin(), regions.end(),
		[] (const MemoryRegion& a, const MemoryRegion& b) {
			return a.start() < b.start();
		});

	for (size_t i = 1; i < regions.size(); i++)
	{
		const auto& prev = regions[i-1];
		const auto& region = regions[i];
		if (prev.end() > region.start()) {
			/* Report how far the region would have to move. */
			memory_exception(Error::MemoryRegionOverlap, "Memory regions overlap",
				region.start().offset(), prev.end().offset_from(region.start()));
		}
	}

	GuestMemory mem { std::move(regions) };
	const auto policy = options.policy();
	if (policy.use_hugepages || policy.lock_guest_memory) {
		mem.set_memory_policy(policy);
	}
	if (options.verbose) {
		mem.print_layout();
	}
	return mem;
}

const MemoryRegion* GuestMemory::find_region(GuestAddress addr) const noexcept
{
	for (const auto& region : *m_regions) {
		if (region.contains(addr))
			return &region;
	}
	return nullptr;
}

GuestAddress GuestMemory::end_addr() const noexcept
{
	const MemoryRegion* highest = nullptr;
	for (const auto& region : *m_regions) {
		if (highest == nullptr || region.start() > highest->start())
			highest = &region;
	}
	return (highest != nullptr) ? highest->end() : GuestAddress{0};
}

uint64_t GuestMemory::memory_size() const noexcept
{
	uint64_t total = 0;
	for (const auto& region : *m_regions) {
		total += region.size();
	}
	return total;
}

bool GuestMemory::address_in_range(GuestAddress addr) const noexcept
{
	return this->find_region(addr) != nullptr;
}

bool GuestMemory::range_overlap(GuestAddress start, GuestAddress end) const noexcept
{
	return std::any_of(m_regions->begin(), m_regions->end(),
		[&] (const MemoryRegion& region) {
			return region.start() < end && start < region.end();
		});
}

std::optional<GuestAddress> GuestMemory::checked_offset(GuestAddress addr, uint64_t offset) const noexcept
{
	auto result = addr.checked_add(offset);
	if (result && this->address_in_range(*result))
		return result;
	return std::nullopt;
}

bool GuestMemory::is_valid_range(GuestAddress start, uint64_t length) const noexcept
{
	if (length == 0)
		return false;
	/* Inclusive last byte of the range. */
	const auto last = start.checked_add(length - 1);
	if (!last)
		return false;
	return std::any_of(m_regions->begin(), m_regions->end(),
		[&] (const MemoryRegion& region) {
			return region.start() <= start && *last < region.end();
		});
}

size_t GuestMemory::write_at_addr(std::span<const uint8_t> buf, GuestAddress addr) const
{
	return access_in_region(addr,
		[buf] (const MemoryMapping& mapping, size_t offset) {
			return mapping.write_slice(buf, offset);
		});
}

void GuestMemory::write_all_at_addr(std::span<const uint8_t> buf, GuestAddress addr) const
{
	const size_t completed = this->write_at_addr(buf, addr);
	if (UNLIKELY(completed != buf.size())) {
		throw ShortTransferException(Error::ShortWrite,
			"Incomplete write to guest memory", addr.offset(), buf.size(), completed);
	}
}

size_t GuestMemory::read_at_addr(std::span<uint8_t> buf, GuestAddress addr) const
{
	return access_in_region(addr,
		[buf] (const MemoryMapping& mapping, size_t offset) {
			return mapping.read_slice(buf, offset);
		});
}

void GuestMemory::read_exact_at_addr(std::span<uint8_t> buf, GuestAddress addr) const
{
	const size_t completed = this->read_at_addr(buf, addr);
	if (UNLIKELY(completed != buf.size())) {
		throw ShortTransferException(Error::ShortRead,
			"Incomplete read from guest memory", addr.offset(), buf.size(), completed);
	}
}

VolatileSlice GuestMemory::get_slice_at_addr(GuestAddress addr, size_t len) const
{
	return do_in_region(addr,
		[&] (const MemoryMapping& mapping, size_t offset, uint64_t) {
			try {
				return mapping.get_slice(offset, len);
			} catch (const MappingException&) {
				throw MemoryException(Error::VolatileMemoryAccess,
					"Guest memory slice out of bounds", addr.offset(), len);
			}
		});
}

void GuestMemory::read_to_memory(GuestAddress addr, int src_fd, size_t count) const
{
	access_in_region(addr,
		[=] (const MemoryMapping& mapping, size_t offset) {
			mapping.read_to_memory(offset, src_fd, count);
		});
}

void GuestMemory::write_from_memory(GuestAddress addr, int dst_fd, size_t count) const
{
	access_in_region(addr,
		[=] (const MemoryMapping& mapping, size_t offset) {
			mapping.write_from_memory(offset, dst_fd, count);
		});
}

uint8_t* GuestMemory::get_host_address(GuestAddress addr) const
{
	return do_in_region(addr,
		[] (const MemoryMapping& mapping, size_t offset, uint64_t) {
			return mapping.as_ptr() + offset;
		});
}

uint8_t* GuestMemory::get_host_address_range(GuestAddress addr, size_t size) const
{
	if (UNLIKELY(size == 0)) {
		memory_exception(Error::InvalidSize, "Host address range size must not be zero", addr.offset(), size);
	}
	return do_in_region(addr,
		[&] (const MemoryMapping& mapping, size_t offset, uint64_t) {
			if (mapping.size() - offset < size) {
				memory_exception(Error::InvalidGuestAddress,
					"Host address range crosses the end of a region", addr.offset(), size);
			}
			return mapping.as_ptr() + offset;
		});
}

const BackingObject& GuestMemory::shm_region(GuestAddress addr) const
{
	const MemoryRegion* region = this->find_region(addr);
	if (UNLIKELY(region == nullptr)) {
		memory_exception(Error::InvalidGuestAddress, "Invalid guest address", addr.offset());
	}
	return region->shared_obj();
}

const BackingObject& GuestMemory::offset_region(uint64_t offset) const
{
	if (UNLIKELY(m_regions->empty())) {
		memory_exception(Error::InvalidOffset, "Invalid offset into empty guest memory", offset);
	}
	const auto addr = this->checked_offset(m_regions->front().start(), offset);
	if (UNLIKELY(!addr)) {
		memory_exception(Error::InvalidOffset, "Invalid offset into guest memory", offset);
	}
	return this->shm_region(*addr);
}

uint64_t GuestMemory::offset_from_base(GuestAddress addr) const
{
	const MemoryRegion* region = this->find_region(addr);
	if (UNLIKELY(region == nullptr)) {
		memory_exception(Error::InvalidGuestAddress, "Invalid guest address", addr.offset());
	}
	return region->obj_offset() + addr.offset_from(region->start());
}

std::vector<int> GuestMemory::as_raw_descriptors() const
{
	std::vector<int> fds;
	fds.reserve(m_regions->size());
	for (const auto& region : *m_regions) {
		fds.push_back(region.shared_obj().as_raw_descriptor());
	}
	return fds;
}

VolatileSlice GuestMemory::get_volatile_slice(MemRegion mem_range) const
{
	try {
		return this->get_slice_at_addr(GuestAddress{mem_range.offset}, mem_range.len);
	} catch (const MemoryException&) {
		memory_exception(Error::InvalidOffset, "Invalid offset for I/O memory region",
			mem_range.offset, mem_range.len);
	}
}

GUESTMEM_COLD()
void GuestMemory::print_layout() const
{
	printf("Guest memory: %zu regions, 0x%lX bytes, end 0x%lX\n",
		num_regions(), memory_size(), end_addr().offset());
	for (const auto& info : this->regions()) {
		printf("  [%zu] 0x%016lX-0x%016lX host=%p fd=%d offset=0x%lX (%s)\n",
			info.index, info.guest_addr.offset(), info.guest_addr.offset() + info.size,
			(void *)info.host_addr, info.shm.as_raw_descriptor(), info.shm_offset,
			info.shm.is_shm() ? "shm" : "file");
	}
}

__attribute__((cold, noreturn))
void GuestMemory::memory_exception(Error kind, const char* msg, uint64_t data, uint64_t size, int err)
{
	if constexpr (VERBOSE_GUEST_MEMORY) {
		fprintf(stderr, "GuestMemory: %s (%s) data=0x%lX size=0x%lX\n",
			msg, to_string(kind), data, size);
	}
	throw MemoryException(kind, msg, data, size, err);
}

} // guestmem
