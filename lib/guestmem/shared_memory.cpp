#include "shared_memory.hpp"

#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

namespace guestmem {
static constexpr bool VERBOSE_SHM = false;

SharedMemory::SharedMemory(int fd, uint64_t size, std::string name)
	: m_fd(fd), m_size(size), m_name(std::move(name))
{
}
SharedMemory::SharedMemory(SharedMemory&& other) noexcept
	: m_fd(std::exchange(other.m_fd, -1)),
	  m_size(std::exchange(other.m_size, 0)),
	  m_name(std::move(other.m_name))
{
}
SharedMemory& SharedMemory::operator=(SharedMemory&& other) noexcept
{
	if (this != &other) {
		if (this->m_fd >= 0)
			close(this->m_fd);
		this->m_fd = std::exchange(other.m_fd, -1);
		this->m_size = std::exchange(other.m_size, 0);
		this->m_name = std::move(other.m_name);
	}
	return *this;
}
SharedMemory::~SharedMemory()
{
	if (this->m_fd >= 0) {
		close(this->m_fd);
	}
}

SharedMemory SharedMemory::New(std::string_view name, uint64_t size)
{
	std::string shm_name {name};
	const int fd = memfd_create(shm_name.c_str(), MFD_CLOEXEC | MFD_ALLOW_SEALING);
	if (fd < 0) {
		throw MemoryException(Error::MemoryCreationFailed,
			"Failed to create shared memory", 0, size, errno);
	}
	if (ftruncate(fd, size) != 0) {
		const int err = errno;
		close(fd);
		throw MemoryException(Error::MemoryCreationFailed,
			"Failed to set size of shared memory", 0, size, err);
	}
	if constexpr (VERBOSE_SHM) {
		fprintf(stderr, "SharedMemory: created '%s' fd=%d size=0x%lX\n",
			shm_name.c_str(), fd, size);
	}
	return SharedMemory(fd, size, std::move(shm_name));
}

void SharedMemory::add_size_seals()
{
	if (fcntl(this->m_fd, F_ADD_SEALS, F_SEAL_GROW | F_SEAL_SHRINK) != 0) {
		throw MemoryException(Error::MemoryAddSealsFailed,
			"Failed to set seals on shared memory", 0, this->m_size, errno);
	}
}
int SharedMemory::get_seals() const
{
	const int seals = fcntl(this->m_fd, F_GET_SEALS);
	if (seals < 0) {
		throw MemoryException(Error::MemoryAddSealsFailed,
			"Failed to get seals of shared memory", 0, this->m_size, errno);
	}
	return seals;
}

File File::Open(const std::string& path, bool writable)
{
	const int flags = (writable ? O_RDWR : O_RDONLY) | O_CLOEXEC;
	const int fd = open(path.c_str(), flags);
	if (fd < 0) {
		throw MemoryException(Error::MemoryCreationFailed,
			"Failed to open backing file", 0, 0, errno);
	}
	return File(fd);
}
File File::Adopt(int fd)
{
	if (fd < 0) {
		throw MemoryException(Error::MemoryCreationFailed,
			"Invalid backing file descriptor", 0, 0, EBADF);
	}
	return File(fd);
}
File::File(File&& other) noexcept
	: m_fd(std::exchange(other.m_fd, -1))
{
}
File& File::operator=(File&& other) noexcept
{
	if (this != &other) {
		if (this->m_fd >= 0)
			close(this->m_fd);
		this->m_fd = std::exchange(other.m_fd, -1);
	}
	return *this;
}
File::~File()
{
	if (this->m_fd >= 0) {
		close(this->m_fd);
	}
}

uint64_t File::size() const
{
	struct stat st;
	if (fstat(this->m_fd, &st) != 0) {
		throw MemoryException(Error::MemoryCreationFailed,
			"Failed to stat backing file", 0, 0, errno);
	}
	return st.st_size;
}
void File::set_size(uint64_t size)
{
	if (ftruncate(this->m_fd, size) != 0) {
		throw MemoryException(Error::MemoryCreationFailed,
			"Failed to set size of backing file", 0, size, errno);
	}
}

} // guestmem
