#include "backing_object.hpp"

namespace guestmem {

int BackingObject::as_raw_descriptor() const noexcept
{
	return std::visit([] (const auto& obj) {
		return obj->as_raw_descriptor();
	}, m_obj);
}

const SharedMemory* BackingObject::shm() const noexcept
{
	if (auto* obj = std::get_if<shm_t>(&m_obj))
		return obj->get();
	return nullptr;
}
const File* BackingObject::file() const noexcept
{
	if (auto* obj = std::get_if<file_t>(&m_obj))
		return obj->get();
	return nullptr;
}

long BackingObject::use_count() const noexcept
{
	return std::visit([] (const auto& obj) {
		return obj.use_count();
	}, m_obj);
}

const void* BackingObject::resource() const noexcept
{
	return std::visit([] (const auto& obj) -> const void* {
		return obj.get();
	}, m_obj);
}

bool BackingObject::operator==(const BackingObject& other) const noexcept
{
	return this->resource() == other.resource();
}

} // guestmem
