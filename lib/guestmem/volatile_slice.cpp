#include "volatile_slice.hpp"

#include <algorithm>

namespace guestmem {

VolatileSlice VolatileSlice::sub_slice(size_t offset, size_t count) const
{
	const size_t end = offset + count;
	if (UNLIKELY(end < offset)) {
		throw MappingException(MappingError::InvalidOffset, "Slice offset overflow", offset, count, m_size);
	}
	if (UNLIKELY(end > m_size)) {
		throw MappingException(MappingError::InvalidRange, "Slice out of bounds", offset, count, m_size);
	}
	return VolatileSlice(m_ptr + offset, count);
}
VolatileSlice VolatileSlice::offset(size_t count) const
{
	if (UNLIKELY(count > m_size)) {
		throw MappingException(MappingError::InvalidRange, "Slice out of bounds", count, 0, m_size);
	}
	return VolatileSlice(m_ptr + count, m_size - count);
}

/* An empty span may have a null data pointer, which memcpy does not accept. */
size_t VolatileSlice::copy_to(std::span<uint8_t> buf) const noexcept
{
	const size_t bytes = std::min(m_size, buf.size());
	if (bytes == 0)
		return 0;
	std::memcpy(buf.data(), m_ptr, bytes);
	return bytes;
}
size_t VolatileSlice::copy_from(std::span<const uint8_t> buf) const noexcept
{
	const size_t bytes = std::min(m_size, buf.size());
	if (bytes == 0)
		return 0;
	std::memcpy(m_ptr, buf.data(), bytes);
	return bytes;
}
void VolatileSlice::write_bytes(uint8_t value) const noexcept
{
	if (m_size != 0)
		std::memset(m_ptr, value, m_size);
}

} // guestmem
