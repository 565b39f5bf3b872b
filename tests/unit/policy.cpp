#include <catch2/catch.hpp>

#include <guestmem/guest_memory.hpp>
using namespace guestmem;
using ranges_t = std::vector<GuestMemory::range_t>;

TEST_CASE("Removed ranges read back as zeroes", "[Policy]")
{
	const size_t page = host_page_size();
	auto gm = GuestMemory::New(ranges_t{{GuestAddress{0x0}, 0x10000}, {GuestAddress{0x40000}, 0x10000}});

	std::vector<uint8_t> data(0x10000, 0xCC);
	gm.write_all_at_addr(data, GuestAddress{0x40000});
	gm.remove_range(GuestAddress{0x40000 + page}, 2 * page);

	REQUIRE(gm.read_obj_from_addr<uint8_t>(GuestAddress{0x40000 + page - 1}) == 0xCC);
	REQUIRE(gm.read_obj_from_addr<uint8_t>(GuestAddress{0x40000 + page}) == 0);
	REQUIRE(gm.read_obj_from_addr<uint8_t>(GuestAddress{0x40000 + 3 * page - 1}) == 0);
	REQUIRE(gm.read_obj_from_addr<uint8_t>(GuestAddress{0x40000 + 3 * page}) == 0xCC);

	// The pages are usable again
	gm.write_obj_at_addr<uint32_t>(0x11223344, GuestAddress{0x40000 + page});
	REQUIRE(gm.read_obj_from_addr<uint32_t>(GuestAddress{0x40000 + page}) == 0x11223344);
}

TEST_CASE("Removed ranges must be inside one region", "[Policy]")
{
	auto gm = GuestMemory::New(ranges_t{{GuestAddress{0x0}, 0x10000}, {GuestAddress{0x10000}, 0x10000}});
	try {
		gm.remove_range(GuestAddress{0x8000}, 0x10000);
		FAIL("Expected invalid guest address");
	} catch (const MemoryException& e) {
		REQUIRE(e.kind() == Error::InvalidGuestAddress);
		REQUIRE(e.addr() == 0x8000);
		REQUIRE(e.size() == 0x10000);
	}
	REQUIRE_THROWS_AS(gm.remove_range(GuestAddress{0x20000}, 0x1000), MemoryException);
	REQUIRE_THROWS_AS(gm.remove_range(GuestAddress{0x0}, 0), MemoryException);
	// Unaligned starts are rejected by the kernel
	REQUIRE_THROWS_AS(gm.remove_range(GuestAddress{0x10}, 0x1000), MemoryAccessException);
}

TEST_CASE("Memory policies are advisory", "[Policy]")
{
	auto gm = GuestMemory::New(ranges_t{{GuestAddress{0x0}, 0x200000}});
	REQUIRE_NOTHROW(gm.set_memory_policy(MemoryPolicy{ .use_hugepages = true }));
	REQUIRE_NOTHROW(gm.set_memory_policy(MemoryPolicy{ .lock_guest_memory = true }));

	auto hp = GuestMemory::New(ranges_t{{GuestAddress{0x0}, 0x200000}}, {
		.hugepages = true,
		.lock_memory = true,
	});
	hp.write_obj_at_addr<uint64_t>(0x1234, GuestAddress{0x100000});
	REQUIRE(hp.read_obj_from_addr<uint64_t>(GuestAddress{0x100000}) == 0x1234);
}
