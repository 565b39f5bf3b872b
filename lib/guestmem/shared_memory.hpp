#pragma once
#include "common.hpp"
#include <string>
#include <string_view>

namespace guestmem {

/* Anonymous shared memory object (memfd). The descriptor can be
   passed to other processes, which may then map the same bytes. */
struct SharedMemory
{
	static SharedMemory New(std::string_view name, uint64_t size);

	int as_raw_descriptor() const noexcept { return m_fd; }
	uint64_t size() const noexcept { return m_size; }
	const std::string& name() const noexcept { return m_name; }

	/* Disallow any future change of size. */
	void add_size_seals();
	int get_seals() const;

	SharedMemory(SharedMemory&&) noexcept;
	SharedMemory& operator=(SharedMemory&&) noexcept;
	SharedMemory(const SharedMemory&) = delete;
	SharedMemory& operator=(const SharedMemory&) = delete;
	~SharedMemory();

private:
	SharedMemory(int fd, uint64_t size, std::string name);

	int m_fd = -1;
	uint64_t m_size = 0;
	std::string m_name;
};

/* An open file used as backing memory, eg. a firmware image
   or host-backed persistent memory. */
struct File
{
	static File Open(const std::string& path, bool writable = true);
	/* Takes ownership of an already open descriptor. */
	static File Adopt(int fd);

	int as_raw_descriptor() const noexcept { return m_fd; }
	uint64_t size() const;
	void set_size(uint64_t size);

	File(File&&) noexcept;
	File& operator=(File&&) noexcept;
	File(const File&) = delete;
	File& operator=(const File&) = delete;
	~File();

private:
	explicit File(int fd) : m_fd(fd) {}

	int m_fd = -1;
};

} // guestmem
