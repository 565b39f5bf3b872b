#pragma once

#ifndef LIKELY
#define LIKELY(x) __builtin_expect((x), 1)
#endif
#ifndef UNLIKELY
#define UNLIKELY(x) __builtin_expect((x), 0)
#endif

#define GUESTMEM_COLD()   __attribute__ ((cold))

#include <cstddef>
#include <cstdint>
#include <exception>
#include <string>
#include <type_traits>

namespace guestmem
{
	struct MemoryPolicy {
		/* Back guest memory with transparent hugepages. */
		bool use_hugepages = false;
		/* Keep guest memory resident once it has been touched. */
		bool lock_guest_memory = false;
	};

	struct MemoryOptions {
		/* Name given to the anonymous shared memory (memfd) object. */
		std::string shm_name = "guestmem";
		/* Prevent the shared memory object from growing or shrinking
		   once the guest layout has been created. */
		bool seal_shm = true;
		bool hugepages = false;
		bool lock_memory = false;
		/* Print the region layout after construction. */
		bool verbose = false;

		MemoryPolicy policy() const noexcept {
			return MemoryPolicy{ .use_hugepages = hugepages, .lock_guest_memory = lock_memory };
		}
	};

	enum class Error : uint8_t {
		InvalidGuestAddress,
		InvalidOffset,
		InvalidSize,
		MemoryAccess,
		MemoryAddSealsFailed,
		MemoryCreationFailed,
		MemoryMappingFailed,
		MemoryNotAligned,
		MemoryRegionOverlap,
		MemoryRegionTooLarge,
		ShortRead,
		ShortWrite,
		VolatileMemoryAccess,
	};
	extern const char* to_string(Error) noexcept;

	enum class MappingError : uint8_t {
		InvalidAddress,
		InvalidOffset,
		InvalidRange,
		NotPageAligned,
		SystemCallFailed,
		ReadToMemory,
		WriteFromMemory,
	};
	extern const char* to_string(MappingError) noexcept;

	/* Raised by MemoryMapping and VolatileSlice. The offset and count
	   are relative to the mapping (or slice), never guest addresses. */
	class MappingException : public std::exception {
	public:
		MappingException(MappingError kind, const char* msg,
			uint64_t offset = 0, uint64_t count = 0, uint64_t region_size = 0, int err = 0)
			: m_msg(msg), m_kind(kind), m_offset(offset), m_count(count),
			  m_region_size(region_size), m_errno(err) {}
		const char* what() const noexcept override {
			return m_msg;
		}
		auto kind() const noexcept { return m_kind; }
		auto offset() const noexcept { return m_offset; }
		auto count() const noexcept { return m_count; }
		auto region_size() const noexcept { return m_region_size; }
		int  error_number() const noexcept { return m_errno; }
	private:
		const char* m_msg;
		MappingError m_kind;
		uint64_t m_offset;
		uint64_t m_count;
		uint64_t m_region_size;
		int      m_errno;
	};

	class MemoryException : public std::exception {
	public:
		MemoryException(Error kind, const char* msg, uint64_t data = 0, uint64_t sz = 0, int err = 0)
			: m_msg(msg), m_kind(kind), m_data(data), m_size(sz), m_errno(err) {}
		const char* what() const noexcept override {
			return m_msg;
		}
		auto kind() const noexcept { return m_kind; }
		/* Guest address or offset involved, when there is one. */
		auto addr() const noexcept { return m_data; }
		auto data() const noexcept { return m_data; }
		auto size() const noexcept { return m_size; }
		int  error_number() const noexcept { return m_errno; }
	protected:
		const char* m_msg;
		Error    m_kind;
		uint64_t m_data;
		uint64_t m_size;
		int      m_errno;
	};

	/* Short read or short write from one of the "exact" / "all" operations.
	   Part of the transfer may already have happened. addr() is the guest
	   address of the transfer and size() the requested length. */
	class ShortTransferException : public MemoryException {
	public:
		ShortTransferException(Error kind, const char* msg, uint64_t guest_addr,
			size_t expected, size_t completed)
			: MemoryException{kind, msg, guest_addr, expected},
			  m_expected(expected), m_completed(completed) {}
		size_t expected() const noexcept { return m_expected; }
		size_t completed() const noexcept { return m_completed; }
	private:
		size_t m_expected;
		size_t m_completed;
	};

	/* A mapping-level bounds violation at a known guest address. */
	class MemoryAccessException : public MemoryException {
	public:
		MemoryAccessException(uint64_t guest_addr, const MappingException& cause)
			: MemoryException{Error::MemoryAccess, "Invalid guest memory access", guest_addr,
				cause.count(), cause.error_number()},
			  m_cause(cause) {}
		const MappingException& mapping_error() const noexcept { return m_cause; }
	private:
		MappingException m_cause;
	};
}
