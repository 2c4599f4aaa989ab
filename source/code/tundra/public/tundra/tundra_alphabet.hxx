#pragma once
#include <tundra/tundra_types.hxx>
#include <array>

namespace tundra
{

    //! \brief Immutable set of ASCII characters a table accepts.
    //!
    //! Every member gets a dense index in order of its first occurrence. Node edge rows are indexed
    //!   with this value, so the alphabet size is also the width of every row.
    class Alphabet
    {
    public:
        static constexpr tundra::u32 Constant_MaxCharacters = 128;

        explicit Alphabet(tundra::String characters) noexcept;

        auto size() const noexcept -> tundra::u32 { return _size; }
        bool empty() const noexcept { return _size == 0; }

        bool contains(char ch) const noexcept;

        //! \returns Dense index of the character or 'Constant_InvalidIndex' if it's not a member.
        auto index_of(char ch) const noexcept -> tundra::u32;

        //! \returns The character stored at the given dense index.
        auto character(tundra::u32 index) const noexcept -> char;

        auto characters() const noexcept -> tundra::String { return { _characters.data(), _size }; }

    private:
        tundra::u32 _size;
        std::array<tundra::u8, Constant_MaxCharacters> _index_table;
        std::array<char, Constant_MaxCharacters> _characters;
    };

} // namespace tundra
