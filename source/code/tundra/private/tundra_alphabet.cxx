#include <tundra/tundra_alphabet.hxx>
#include <cassert>

namespace tundra
{

    namespace detail
    {

        static constexpr tundra::u8 Constant_NotAMember = 0xff;

    } // namespace detail

    Alphabet::Alphabet(tundra::String characters) noexcept
        : _size{ 0 }
        , _index_table{ }
        , _characters{ }
    {
        _index_table.fill(detail::Constant_NotAMember);

        for (char const ch : characters)
        {
            // Bytes above 0x7f can't be looked up by any valid query, we just skip them.
            if (tundra::is_ascii(ch) == false)
            {
                continue;
            }

            tundra::u8 const code = static_cast<tundra::u8>(ch);
            if (_index_table[code] == detail::Constant_NotAMember)
            {
                _index_table[code] = static_cast<tundra::u8>(_size);
                _characters[_size] = ch;
                _size += 1;
            }
        }
    }

    bool Alphabet::contains(char ch) const noexcept
    {
        return index_of(ch) != Constant_InvalidIndex;
    }

    auto Alphabet::index_of(char ch) const noexcept -> tundra::u32
    {
        if (tundra::is_ascii(ch) == false)
        {
            return Constant_InvalidIndex;
        }

        tundra::u8 const index = _index_table[static_cast<tundra::u8>(ch)];
        return index == detail::Constant_NotAMember ? Constant_InvalidIndex : tundra::u32{ index };
    }

    auto Alphabet::character(tundra::u32 index) const noexcept -> char
    {
        assert(index < _size);
        return _characters[index];
    }

} // namespace tundra
