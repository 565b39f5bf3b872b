#include <catch2/catch.hpp>

#include <guestmem/guest_memory.hpp>
#include <cstdlib>
#include <fcntl.h>
#include <string>
#include <unistd.h>
using namespace guestmem;
using ranges_t = std::vector<GuestMemory::range_t>;

TEST_CASE("Regions can be mapped again from their descriptors", "[Export]")
{
	auto gm = GuestMemory::New(ranges_t{{GuestAddress{0x0}, 0x10000}, {GuestAddress{0x40000}, 0x20000}});
	for (size_t i = 0; i < 0x30000; i += 0x1000) {
		const uint64_t addr = (i < 0x10000) ? i : 0x40000 + (i - 0x10000);
		gm.write_obj_at_addr<uint64_t>(addr ^ 0xF00DF00D, GuestAddress{addr});
	}

	size_t count = 0;
	gm.with_regions([&] (const MemoryRegionInformation& info) {
		/* What a peer process would do with the descriptor */
		auto mapping = MemoryMapping::from_descriptor(
			info.shm.as_raw_descriptor(), info.size, info.shm_offset);
		REQUIRE(mapping.as_ptr() != (uint8_t *)info.host_addr);
		for (size_t off = 0; off < info.size; off += 0x1000) {
			const uint64_t addr = info.guest_addr.offset() + off;
			REQUIRE(mapping.read_obj<uint64_t>(off) == (addr ^ 0xF00DF00D));
		}
		/* Writes through the new mapping are seen by the guest */
		mapping.write_obj<uint32_t>(0x1234 + info.index, 0x8);
		count++;
	});
	REQUIRE(count == 2);
	REQUIRE(gm.read_obj_from_addr<uint32_t>(GuestAddress{0x8}) == 0x1234);
	REQUIRE(gm.read_obj_from_addr<uint32_t>(GuestAddress{0x40008}) == 0x1235);
}

TEST_CASE("Offsets into the backing object", "[Export]")
{
	auto gm = GuestMemory::New(ranges_t{{GuestAddress{0x10000}, 0x10000}, {GuestAddress{0x80000}, 0x10000}});
	REQUIRE(gm.offset_from_base(GuestAddress{0x10000}) == 0);
	REQUIRE(gm.offset_from_base(GuestAddress{0x10800}) == 0x800);
	REQUIRE(gm.offset_from_base(GuestAddress{0x80000}) == 0x10000);
	REQUIRE(gm.offset_from_base(GuestAddress{0x8FFFF}) == 0x1FFFF);
	REQUIRE_THROWS_AS(gm.offset_from_base(GuestAddress{0x20000}), MemoryException);

	for (const auto& info : gm.regions()) {
		REQUIRE(gm.offset_from_base(info.guest_addr) == info.shm_offset);
	}

	// Bytes written to the guest are at offset_from_base() in the shm
	const int fd = gm.shm_region(GuestAddress{0x80000}).as_raw_descriptor();
	gm.write_obj_at_addr<uint32_t>(0xA5A5A5A5, GuestAddress{0x80040});
	uint32_t value = 0;
	REQUIRE(pread(fd, &value, sizeof(value), gm.offset_from_base(GuestAddress{0x80040})) == (ssize_t)sizeof(value));
	REQUIRE(value == 0xA5A5A5A5);
}

TEST_CASE("Backing objects by address and offset", "[Export]")
{
	auto gm = GuestMemory::New(ranges_t{{GuestAddress{0x0}, 0x10000}, {GuestAddress{0x40000}, 0x10000}});
	const auto& obj = gm.shm_region(GuestAddress{0x100});
	REQUIRE(obj.is_shm());
	REQUIRE_FALSE(obj.is_file());
	REQUIRE(obj.file() == nullptr);
	REQUIRE(gm.shm_region(GuestAddress{0x40000}) == obj);
	REQUIRE_THROWS_AS(gm.shm_region(GuestAddress{0x20000}), MemoryException);

	// Offsets are relative to the start of the first region
	REQUIRE(gm.offset_region(0x100) == obj);
	REQUIRE(gm.offset_region(0x40000) == obj);
	try {
		gm.offset_region(0x20000);
		FAIL("Expected invalid offset");
	} catch (const MemoryException& e) {
		REQUIRE(e.kind() == Error::InvalidOffset);
		REQUIRE(e.addr() == 0x20000);
	}
	REQUIRE_THROWS_AS(gm.offset_region(UINT64_MAX), MemoryException);
}

TEST_CASE("Raw descriptors per region", "[Export]")
{
	auto gm = GuestMemory::New(ranges_t{
		{GuestAddress{0x0}, 0x10000},
		{GuestAddress{0x20000}, 0x10000},
		{GuestAddress{0x40000}, 0x10000},
	});
	const auto fds = gm.as_raw_descriptors();
	REQUIRE(fds.size() == 3);
	// One shared memory object backs every region
	REQUIRE(fds[0] >= 0);
	REQUIRE(fds[0] == fds[1]);
	REQUIRE(fds[1] == fds[2]);
	REQUIRE(fds[0] == gm.shm_region(GuestAddress{0x0}).as_raw_descriptor());
}

TEST_CASE("Backing objects live as long as their regions", "[Export]")
{
	auto gm = GuestMemory::New(ranges_t{{GuestAddress{0x0}, 0x10000}, {GuestAddress{0x40000}, 0x10000}});
	const auto& obj = gm.shm_region(GuestAddress{0x0});
	// Held by the two regions only
	REQUIRE(obj.use_count() == 2);

	BackingObject extra = obj;
	REQUIRE(extra.use_count() == 3);
	REQUIRE(extra == obj);

	auto other = GuestMemory::New(ranges_t{{GuestAddress{0x0}, 0x10000}});
	REQUIRE_FALSE(other.shm_region(GuestAddress{0x0}) == obj);

	// The descriptor stays open after the guest memory is gone
	const int fd = extra.as_raw_descriptor();
	gm = std::move(other);
	REQUIRE(extra.use_count() == 1);
	// Both handles remain usable and share one layout
	REQUIRE(other.num_regions() == 1);
	REQUIRE(gm.get_host_address(GuestAddress{0x0}) == other.get_host_address(GuestAddress{0x0}));
	REQUIRE(extra.shm()->size() == 0x20000);
	REQUIRE(fcntl(fd, F_GETFD) >= 0);
}

TEST_CASE("Handles stay valid after being moved from", "[Export]")
{
	auto gm = GuestMemory::New(ranges_t{{GuestAddress{0x0}, 0x10000}});
	GuestMemory moved = std::move(gm);
	REQUIRE(gm.address_in_range(GuestAddress{0x0}));
	REQUIRE(gm.num_regions() == 1);
	gm.write_obj_at_addr<uint32_t>(0x5A5A, GuestAddress{0x40});
	REQUIRE(moved.read_obj_from_addr<uint32_t>(GuestAddress{0x40}) == 0x5A5A);
}

static std::shared_ptr<File> temporary_file(uint64_t size)
{
	char path[] = "/tmp/guestmem_backing_XXXXXX";
	const int fd = mkstemp(path);
	REQUIRE(fd >= 0);
	unlink(path);
	auto file = std::make_shared<File>(File::Adopt(fd));
	file->set_size(size);
	return file;
}

TEST_CASE("File backed regions", "[Export]")
{
	auto file = temporary_file(0x3000);
	REQUIRE(file->size() == 0x3000);
	const char data[] = "persistent memory";
	REQUIRE(pwrite(file->as_raw_descriptor(), data, sizeof(data), 0x1000) == (ssize_t)sizeof(data));

	auto shm = std::make_shared<SharedMemory>(SharedMemory::New("ram", 0x10000));
	std::vector<MemoryRegion> regions;
	// Deliberately out of order
	regions.push_back(MemoryRegion::new_from_file(0x2000, GuestAddress{0x100000}, 0x1000, file));
	regions.push_back(MemoryRegion::new_from_shm(0x10000, GuestAddress{0x0}, 0, shm));

	auto gm = GuestMemory::from_regions(std::move(regions));
	REQUIRE(gm.num_regions() == 2);
	REQUIRE(gm.memory_size() == 0x12000);
	REQUIRE(gm.end_addr() == GuestAddress{0x102000});

	// Sorted by guest address
	std::vector<MemoryRegionInformation> infos;
	gm.with_regions([&] (const MemoryRegionInformation& info) { infos.push_back(info); });
	REQUIRE(infos.size() == 2);
	REQUIRE(infos[0].guest_addr == GuestAddress{0x0});
	REQUIRE(infos[0].shm.is_shm());
	REQUIRE(infos[1].guest_addr == GuestAddress{0x100000});
	REQUIRE(infos[1].shm.is_file());
	REQUIRE(infos[1].shm.file() == file.get());
	REQUIRE(infos[1].shm_offset == 0x1000);

	char result[sizeof(data)];
	gm.read_exact_at_addr({(uint8_t *)result, sizeof(result)}, GuestAddress{0x100000});
	REQUIRE(std::string(result) == data);
	REQUIRE(gm.offset_from_base(GuestAddress{0x100010}) == 0x1010);

	const auto fds = gm.as_raw_descriptors();
	REQUIRE(fds[0] == shm->as_raw_descriptor());
	REQUIRE(fds[1] == file->as_raw_descriptor());
}

TEST_CASE("Overlapping regions are rejected", "[Export]")
{
	auto shm = std::make_shared<SharedMemory>(SharedMemory::New("overlap", 0x20000));
	std::vector<MemoryRegion> regions;
	regions.push_back(MemoryRegion::new_from_shm(0x10000, GuestAddress{0x8000}, 0x10000, shm));
	regions.push_back(MemoryRegion::new_from_shm(0x10000, GuestAddress{0x0}, 0, shm));
	try {
		GuestMemory::from_regions(std::move(regions));
		FAIL("Expected overlap");
	} catch (const MemoryException& e) {
		REQUIRE(e.kind() == Error::MemoryRegionOverlap);
		REQUIRE(e.addr() == 0x8000);
		REQUIRE(e.size() == 0x8000);
	}

	// Adjacent regions are fine
	std::vector<MemoryRegion> adjacent;
	adjacent.push_back(MemoryRegion::new_from_shm(0x10000, GuestAddress{0x10000}, 0x10000, shm));
	adjacent.push_back(MemoryRegion::new_from_shm(0x10000, GuestAddress{0x0}, 0, shm));
	REQUIRE(GuestMemory::from_regions(std::move(adjacent)).num_regions() == 2);
}

TEST_CASE("Mappings must be page aligned", "[Export]")
{
	auto shm = std::make_shared<SharedMemory>(SharedMemory::New("unaligned", 0x10000));
	try {
		MemoryRegion::new_from_shm(0x1000, GuestAddress{0x0}, 0x800, shm);
		FAIL("Expected mapping failure");
	} catch (const MemoryException& e) {
		REQUIRE(e.kind() == Error::MemoryMappingFailed);
	}
	try {
		MemoryMapping::from_descriptor(shm->as_raw_descriptor(), 0, 0);
		FAIL("Expected empty mapping failure");
	} catch (const MappingException& e) {
		REQUIRE(e.kind() == MappingError::InvalidRange);
	}
	REQUIRE_THROWS_AS(MemoryMapping::from_descriptor(-1, 0x1000, 0), MappingException);
}
