
inline MemoryRegionInformation GuestMemory::RegionIterator::operator*() const noexcept
{
	const auto& region = (*m_regions)[m_index];
	return MemoryRegionInformation {
		.index = m_index,
		.guest_addr = region.start(),
		.size = region.size(),
		.host_addr = reinterpret_cast<uintptr_t>(region.mapping().as_ptr()),
		.shm = region.shared_obj(),
		.shm_offset = region.obj_offset(),
	};
}

inline GuestMemory::RegionRange GuestMemory::regions() const noexcept
{
	return RegionRange{m_regions};
}

template <typename F>
inline void GuestMemory::with_regions(F&& cb) const
{
	for (const auto& info : this->regions()) {
		cb(info);
	}
}

template <typename F>
inline auto GuestMemory::do_in_region(GuestAddress addr, F&& cb) const
{
	const MemoryRegion* region = this->find_region(addr);
	if (UNLIKELY(region == nullptr)) {
		memory_exception(Error::InvalidGuestAddress, "Invalid guest address", addr.offset());
	}
	return cb(region->mapping(), size_t(addr.offset_from(region->start())), region->obj_offset());
}

template <typename F>
inline auto GuestMemory::access_in_region(GuestAddress addr, F&& cb) const
{
	return do_in_region(addr,
		[&] (const MemoryMapping& mapping, size_t offset, uint64_t) {
			try {
				return cb(mapping, offset);
			} catch (const MappingException& e) {
				throw MemoryAccessException(addr.offset(), e);
			}
		});
}

template <typename T>
inline T GuestMemory::read_obj_from_addr(GuestAddress addr) const
{
	return access_in_region(addr,
		[] (const MemoryMapping& mapping, size_t offset) {
			return mapping.read_obj<T>(offset);
		});
}

template <typename T>
inline void GuestMemory::write_obj_at_addr(const T& value, GuestAddress addr) const
{
	access_in_region(addr,
		[&value] (const MemoryMapping& mapping, size_t offset) {
			mapping.write_obj<T>(value, offset);
		});
}

template <typename T>
inline VolatileRef<T> GuestMemory::get_ref_at_addr(GuestAddress addr) const
{
	auto slice = this->get_slice_at_addr(addr, sizeof(T));
	return VolatileRef<T>(slice.as_mut_ptr());
}
