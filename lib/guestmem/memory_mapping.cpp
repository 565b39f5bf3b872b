#include "memory_mapping.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <sys/mman.h>
#include <unistd.h>
#include <utility>

namespace guestmem {
static constexpr bool VERBOSE_MAPPING = false;

size_t host_page_size() noexcept
{
	static const size_t page_size = sysconf(_SC_PAGESIZE);
	return page_size;
}

const char* to_string(MappingError kind) noexcept
{
	switch (kind) {
	case MappingError::InvalidAddress:   return "requested memory out of range";
	case MappingError::InvalidOffset:    return "requested offset is out of range";
	case MappingError::InvalidRange:     return "requested memory range spans past the end of the region";
	case MappingError::NotPageAligned:   return "address is not page aligned";
	case MappingError::SystemCallFailed: return "mmap related system call failed";
	case MappingError::ReadToMemory:     return "failed to read from file to memory";
	case MappingError::WriteFromMemory:  return "failed to write from memory to file";
	}
	return "unknown mapping error";
}

MemoryMapping MemoryMapping::from_descriptor(int fd, size_t size, uint64_t offset)
{
	if (UNLIKELY(size == 0)) {
		mapping_exception(MappingError::InvalidRange, "Empty memory mapping", offset, size, 0);
	}
	if (UNLIKELY(offset & (host_page_size() - 1))) {
		mapping_exception(MappingError::NotPageAligned, "Mapping offset not page aligned", offset, size, 0);
	}
	if (UNLIKELY(offset + size < offset)) {
		mapping_exception(MappingError::InvalidOffset, "Mapping offset overflow", offset, size, 0);
	}
	void* ptr = mmap(NULL, size, PROT_READ | PROT_WRITE,
		MAP_SHARED | MAP_NORESERVE, fd, offset);
	if (ptr == MAP_FAILED) {
		mapping_exception(MappingError::SystemCallFailed, "Failed to map memory", offset, size, 0, errno);
	}
	if constexpr (VERBOSE_MAPPING) {
		fprintf(stderr, "MemoryMapping: fd=%d offset=0x%lX size=0x%zX at %p\n",
			fd, offset, size, ptr);
	}
	return MemoryMapping((uint8_t *)ptr, size);
}

MemoryMapping::MemoryMapping(MemoryMapping&& other) noexcept
	: m_ptr(std::exchange(other.m_ptr, nullptr)),
	  m_size(std::exchange(other.m_size, 0))
{
}
MemoryMapping& MemoryMapping::operator=(MemoryMapping&& other) noexcept
{
	if (this != &other) {
		if (this->m_ptr != nullptr)
			munmap(this->m_ptr, this->m_size);
		this->m_ptr = std::exchange(other.m_ptr, nullptr);
		this->m_size = std::exchange(other.m_size, 0);
	}
	return *this;
}
MemoryMapping::~MemoryMapping()
{
	if (this->m_ptr != nullptr) {
		munmap(this->m_ptr, this->m_size);
	}
}

size_t MemoryMapping::range_end(size_t offset, size_t count) const
{
	const size_t end = offset + count;
	if (UNLIKELY(end < offset)) {
		mapping_exception(MappingError::InvalidOffset, "Memory range overflow", offset, count, m_size);
	}
	if (UNLIKELY(end > m_size)) {
		mapping_exception(MappingError::InvalidRange, "Memory range past end of mapping", offset, count, m_size);
	}
	return end;
}

size_t MemoryMapping::write_slice(std::span<const uint8_t> buf, size_t offset) const
{
	if (UNLIKELY(offset > m_size)) {
		mapping_exception(MappingError::InvalidAddress, "Write offset outside mapping", offset, buf.size(), m_size);
	}
	const size_t bytes = std::min(m_size - offset, buf.size());
	if (bytes == 0)
		return 0;
	std::memcpy(&m_ptr[offset], buf.data(), bytes);
	return bytes;
}
size_t MemoryMapping::read_slice(std::span<uint8_t> buf, size_t offset) const
{
	if (UNLIKELY(offset > m_size)) {
		mapping_exception(MappingError::InvalidAddress, "Read offset outside mapping", offset, buf.size(), m_size);
	}
	const size_t bytes = std::min(m_size - offset, buf.size());
	if (bytes == 0)
		return 0;
	std::memcpy(buf.data(), &m_ptr[offset], bytes);
	return bytes;
}

VolatileSlice MemoryMapping::get_slice(size_t offset, size_t count) const
{
	range_end(offset, count);
	return VolatileSlice(&m_ptr[offset], count);
}

void MemoryMapping::read_to_memory(size_t offset, int src_fd, size_t count) const
{
	range_end(offset, count);
	uint8_t* dst = &m_ptr[offset];
	while (count != 0)
	{
		const ssize_t res = ::read(src_fd, dst, count);
		if (res < 0) {
			if (errno == EINTR)
				continue;
			mapping_exception(MappingError::ReadToMemory, "Read into memory failed",
				dst - m_ptr, count, m_size, errno);
		}
		if (res == 0) {
			mapping_exception(MappingError::ReadToMemory, "Unexpected end of file reading into memory",
				dst - m_ptr, count, m_size);
		}
		dst += res;
		count -= res;
	}
}

void MemoryMapping::write_from_memory(size_t offset, int dst_fd, size_t count) const
{
	range_end(offset, count);
	const uint8_t* src = &m_ptr[offset];
	while (count != 0)
	{
		const ssize_t res = ::write(dst_fd, src, count);
		if (res < 0) {
			if (errno == EINTR)
				continue;
			mapping_exception(MappingError::WriteFromMemory, "Write from memory failed",
				src - m_ptr, count, m_size, errno);
		}
		if (res == 0) {
			mapping_exception(MappingError::WriteFromMemory, "Zero-length write from memory",
				src - m_ptr, count, m_size);
		}
		src += res;
		count -= res;
	}
}

void MemoryMapping::remove_range(size_t offset, size_t count) const
{
	this->advise(offset, count, MADV_REMOVE);
}

void MemoryMapping::advise(size_t offset, size_t count, int advice) const
{
	range_end(offset, count);
	if (madvise(&m_ptr[offset], count, advice) != 0) {
		mapping_exception(MappingError::SystemCallFailed, "madvise() failed", offset, count, m_size, errno);
	}
}

void MemoryMapping::lock_on_fault() const
{
	if (mlock2(m_ptr, m_size, MLOCK_ONFAULT) != 0) {
		mapping_exception(MappingError::SystemCallFailed, "mlock2() failed", 0, m_size, m_size, errno);
	}
}

__attribute__((cold, noreturn))
void MemoryMapping::mapping_exception(MappingError kind, const char* msg,
	uint64_t offset, uint64_t count, uint64_t size, int err)
{
	throw MappingException(kind, msg, offset, count, size, err);
}

} // guestmem
