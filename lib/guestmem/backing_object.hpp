#pragma once
#include "shared_memory.hpp"
#include <memory>
#include <variant>

namespace guestmem {

/* The host resource providing the bytes of one or more regions.
   Shared ownership: every region slicing the same object holds a
   reference, and the object lives until the last one is gone. */
struct BackingObject
{
	using shm_t  = std::shared_ptr<SharedMemory>;
	using file_t = std::shared_ptr<File>;

	BackingObject(shm_t shm) : m_obj(std::move(shm)) {}
	BackingObject(file_t file) : m_obj(std::move(file)) {}

	/* The descriptor is borrowed. Callers must not close it. */
	int as_raw_descriptor() const noexcept;

	bool is_shm() const noexcept { return std::holds_alternative<shm_t>(m_obj); }
	bool is_file() const noexcept { return std::holds_alternative<file_t>(m_obj); }
	/* Returns nullptr when the object is of the other kind. */
	const shm_t::element_type* shm() const noexcept;
	const file_t::element_type* file() const noexcept;
	/* Number of owners of the underlying resource. */
	long use_count() const noexcept;

	/* Identity is the underlying resource. */
	bool operator==(const BackingObject& other) const noexcept;

private:
	const void* resource() const noexcept;

	std::variant<shm_t, file_t> m_obj;
};

} // guestmem
