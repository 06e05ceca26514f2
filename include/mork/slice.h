/*
 * Slice objects based off of https://github.com/google/leveldb/blob/main/include/leveldb/slice.h.
 */

#ifndef MORK_SLICE_H
#define MORK_SLICE_H

#include <cassert>
#include <cstring>
#include <string>
#include <string_view>
#include "common.h"

namespace Mork {

class Slice {
public:
    constexpr Slice() noexcept = default;

    constexpr Slice(const Byte *data, Size size) noexcept
        : m_data {data},
          m_size {size}
    {
        assert(m_data != nullptr);
    }

    constexpr Slice(const Byte *data) noexcept
        : m_data {data}
    {
        assert(m_data != nullptr);

        m_size = std::char_traits<Byte>::length(m_data);
    }

    constexpr Slice(const std::string_view &rhs) noexcept
        : Slice {rhs.data(), rhs.size()}
    {}

    Slice(const std::string &rhs) noexcept
        : Slice {rhs.data(), rhs.size()}
    {}

    [[nodiscard]]
    constexpr auto is_empty() const noexcept -> bool
    {
        return m_size == 0;
    }

    [[nodiscard]]
    constexpr auto data() const noexcept -> const Byte *
    {
        return m_data;
    }

    [[nodiscard]]
    constexpr auto size() const noexcept -> Size
    {
        return m_size;
    }

    constexpr auto operator[](Size index) const noexcept -> const Byte &
    {
        assert(index < m_size);
        return m_data[index];
    }

    [[nodiscard]]
    constexpr auto range(Size offset, Size size) const noexcept -> Slice
    {
        assert(size <= m_size);
        assert(offset <= m_size);
        assert(offset + size <= m_size);

        return Slice {m_data + offset, size};
    }

    [[nodiscard]]
    constexpr auto range(Size offset) const noexcept -> Slice
    {
        assert(offset <= m_size);
        return range(offset, m_size - offset);
    }

    constexpr auto advance(Size n = 1) noexcept -> Slice
    {
        assert(n <= m_size);
        m_data += n;
        m_size -= n;
        return *this;
    }

    constexpr auto truncate(Size size) noexcept -> Slice
    {
        assert(size <= m_size);
        m_size = size;
        return *this;
    }

    [[nodiscard]]
    constexpr auto starts_with(Slice rhs) const noexcept -> bool
    {
        if (rhs.size() > m_size)
            return false;
        return std::char_traits<Byte>::compare(m_data, rhs.data(), rhs.size()) == 0;
    }

    [[nodiscard]]
    auto to_string() const noexcept -> std::string
    {
        return {m_data, m_size};
    }

    [[nodiscard]]
    constexpr auto to_view() const noexcept -> std::string_view
    {
        return {m_data, m_size};
    }

private:
    const Byte *m_data {""};
    Size m_size {};
};

inline auto operator==(Slice lhs, Slice rhs) noexcept -> bool
{
    return lhs.size() == rhs.size() && std::memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

inline auto operator!=(Slice lhs, Slice rhs) noexcept -> bool
{
    return !(lhs == rhs);
}

} // namespace Mork

#endif // MORK_SLICE_H
