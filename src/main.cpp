#include <guestmem/guest_memory.hpp>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#define DEFAULT_MEMORY_MB  64
#define MMIO_HOLE_START    0xC0000000ULL  /* 3GB */
#define MMIO_HOLE_END      0x100000000ULL /* 4GB */

struct Image {
	std::string filename;
	uint64_t addr;
};

static void usage(const char* prog)
{
	fprintf(stderr, "Usage: %s [--mem <MiB>] [--hugepages] [--load <file>@<addr>]...\n", prog);
	exit(1);
}

/* RAM below and above the MMIO hole, like a PC layout. */
static std::vector<guestmem::GuestMemory::range_t> pc_layout(uint64_t mem_size)
{
	using guestmem::GuestAddress;
	if (mem_size <= MMIO_HOLE_START) {
		return { { GuestAddress{0}, mem_size } };
	}
	return {
		{ GuestAddress{0}, MMIO_HOLE_START },
		{ GuestAddress{MMIO_HOLE_END}, mem_size - MMIO_HOLE_START },
	};
}

static void load_image(const guestmem::GuestMemory& mem, const Image& image)
{
	const auto file = guestmem::File::Open(image.filename, false);
	const uint64_t size = file.size();
	const guestmem::GuestAddress addr {image.addr};
	if (size == 0) {
		/* Nothing to copy, but the load address must still be RAM. */
		if (!mem.address_in_range(addr)) {
			throw guestmem::MemoryException(guestmem::Error::InvalidGuestAddress,
				"Empty image load address is outside guest memory", image.addr, size);
		}
		printf("Loaded %s (empty) at 0x%lX\n", image.filename.c_str(), image.addr);
		return;
	}
	/* Images must be contiguous in host memory. */
	if (!mem.is_valid_range(addr, size)) {
		throw guestmem::MemoryException(guestmem::Error::InvalidGuestAddress,
			"Image does not fit in guest memory", image.addr, size);
	}
	mem.read_to_memory(addr, file.as_raw_descriptor(), size);
	printf("Loaded %s (%lu bytes) at 0x%lX\n",
		image.filename.c_str(), size, image.addr);
}

int main(int argc, char** argv)
{
	uint64_t mem_mb = DEFAULT_MEMORY_MB;
	guestmem::MemoryOptions options {
		.shm_name = "guestmem_info",
		.verbose = false
	};
	std::vector<Image> images;

	for (int i = 1; i < argc; i++)
	{
		const std::string arg = argv[i];
		if (arg == "--mem" && i+1 < argc) {
			mem_mb = strtoull(argv[++i], nullptr, 0);
		} else if (arg == "--hugepages") {
			options.hugepages = true;
		} else if (arg == "--load" && i+1 < argc) {
			const std::string load = argv[++i];
			const auto at = load.rfind('@');
			if (at == std::string::npos)
				usage(argv[0]);
			images.push_back({load.substr(0, at), strtoull(load.c_str() + at + 1, nullptr, 0)});
		} else {
			usage(argv[0]);
		}
	}
	/* The size in bytes must fit in 64 bits. */
	if (mem_mb == 0 || mem_mb > (UINT64_MAX >> 20))
		usage(argv[0]);

	try {
		const auto ranges = pc_layout(mem_mb << 20);
		auto mem = guestmem::GuestMemory::New(ranges, options);

		for (const auto& image : images) {
			load_image(mem, image);
		}

		mem.print_layout();
		mem.with_regions([] (const guestmem::MemoryRegionInformation& info) {
			printf("  slot %zu: guest=0x%lX size=0x%zX fd=%d shm_offset=0x%lX\n",
				info.index, info.guest_addr.offset(), info.size,
				info.shm.as_raw_descriptor(), info.shm_offset);
		});
	} catch (const guestmem::ShortTransferException& e) {
		fprintf(stderr, "Error: %s (expected %zu, completed %zu)\n",
			e.what(), e.expected(), e.completed());
		return 1;
	} catch (const guestmem::MemoryException& e) {
		fprintf(stderr, "Error: %s (%s) addr=0x%lX size=0x%lX%s%s\n",
			e.what(), guestmem::to_string(e.kind()), e.addr(), e.size(),
			e.error_number() ? ": " : "", e.error_number() ? strerror(e.error_number()) : "");
		return 1;
	} catch (const std::exception& e) {
		fprintf(stderr, "Error: %s\n", e.what());
		return 1;
	}
	return 0;
}
