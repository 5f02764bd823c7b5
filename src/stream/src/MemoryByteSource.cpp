/**
 * @file MemoryByteSource.cpp
 * @brief In-memory byte source.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <plr/stream/MemoryByteSource.hpp>

#include <algorithm>
#include <cstring>
#include <format>

namespace plr::stream {

MemoryByteSource::MemoryByteSource(std::vector<core::byte> data, core::usize maxReadSize)
    : _data(std::move(data))
    , _maxReadSize(maxReadSize)
{
}

core::ExpectedVoid MemoryByteSource::open()
{
    _cursor = 0;
    _open = true;
    return {};
}

core::Expected<core::usize> MemoryByteSource::read(std::span<core::byte> buffer)
{
    if (!_open)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "memory source not opened");
    }

    core::usize count = std::min(buffer.size(), _data.size() - _cursor);
    if (_maxReadSize != 0)
        count = std::min(count, _maxReadSize);

    if (count > 0)
    {
        std::memcpy(buffer.data(), _data.data() + _cursor, count);
        _cursor += count;
    }
    return count;
}

void MemoryByteSource::close() noexcept
{
    _open = false;
}

std::string MemoryByteSource::describe() const
{
    return std::format("memory ({} bytes)", _data.size());
}

} // namespace plr::stream
