#include <guestmem/guest_memory.hpp>
#include <cstdio>
#include <cstdlib>
#include <cstring>

static guestmem::GuestMemory* memory;

// In order to be able to inspect a coredump we want to
// crash on every ASAN error.
extern "C" void __asan_on_error()
{
	abort();
}
extern "C" void __msan_on_error()
{
	abort();
}

/* Host-side invariants that must hold after any sequence of
   guest-controlled requests. */
static void verify_access(guestmem::GuestAddress addr, uint64_t len)
{
	using namespace guestmem;
	const bool valid = memory->is_valid_range(addr, len);
	try {
		auto slice = memory->get_slice_at_addr(addr, len);
		if (!valid || slice.size() != len) {
			fprintf(stderr, "Slice at 0x%lX len 0x%lX escaped guest memory\n", addr.offset(), len);
			abort();
		}
		const uint8_t* host = memory->get_host_address_range(addr, len);
		if (host != slice.as_ptr())
			abort();
	} catch (const MemoryException& e) {
		if (valid) {
			fprintf(stderr, "Valid range 0x%lX len 0x%lX rejected: %s\n", addr.offset(), len, e.what());
			abort();
		}
	}
}

static void fuzz_guest_access(const uint8_t* data, size_t len)
{
	using namespace guestmem;
	while (len >= 17)
	{
		uint64_t addr, size;
		std::memcpy(&addr, data, 8);
		std::memcpy(&size, data + 8, 8);
		const uint8_t op = data[16];
		data += 17; len -= 17;
		/* Keep the transfers small, but the addresses wild. */
		size &= 0x3FFF;

		try {
			switch (op % 5) {
			case 0: {
				std::vector<uint8_t> buffer(size, op);
				memory->write_at_addr(buffer, GuestAddress{addr});
				} break;
			case 1: {
				std::vector<uint8_t> buffer(size);
				memory->read_exact_at_addr(buffer, GuestAddress{addr});
				} break;
			case 2:
				memory->write_obj_at_addr<uint64_t>(size, GuestAddress{addr});
				break;
			case 3:
				(void)memory->get_volatile_slice(MemRegion{ .offset = addr, .len = size });
				break;
			case 4:
				if (auto end = memory->checked_offset(GuestAddress{addr}, size)) {
					if (!memory->address_in_range(*end))
						abort();
				}
				break;
			}
		} catch (const MemoryException& e) {
			//printf(">>> Exception: %s\n", e.what());
		}
		if (size != 0)
			verify_access(GuestAddress{addr}, size);
	}
}

extern "C"
int LLVMFuzzerTestOneInput(const uint8_t* data, size_t len)
{
	using namespace guestmem;
	if (memory == nullptr) {
		const GuestMemory::range_t ranges[] = {
			{ GuestAddress{0x0}, 0x100000 },
			/* Hole from 1MB to 2MB */
			{ GuestAddress{0x200000}, 0x100000 },
		};
		memory = new GuestMemory { GuestMemory::New(ranges, { .shm_name = "guestmem_fuzz" }) };
	}
#if defined(FUZZ_GUEST_ACCESS)
	fuzz_guest_access(data, len);
#else
	#error "Unknown fuzzing mode"
#endif
	return 0;
}
