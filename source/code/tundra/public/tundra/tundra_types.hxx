#pragma once
#include <inttypes.h>
#include <string_view>
#include <span>

namespace tundra
{

    using u8 = uint8_t;
    using u16 = uint16_t;
    using u32 = uint32_t;
    using u64 = uint64_t;

    using i32 = int32_t;

    //! \brief Patterns, queries and lexer input are plain ASCII byte strings.
    using String = std::string_view;

    template<typename T>
    using Span = std::span<T>;

    //! \brief Handle value used for 'no node' and 'no index' cases.
    static constexpr tundra::u32 Constant_InvalidIndex = 0xffff'ffff;

    constexpr bool is_ascii(char value) noexcept
    {
        return (static_cast<tundra::u8>(value) & 0x80) == 0;
    }

    constexpr bool is_ascii(tundra::String value) noexcept
    {
        for (char const ch : value)
        {
            if (is_ascii(ch) == false)
            {
                return false;
            }
        }
        return true;
    }

} // namespace tundra
