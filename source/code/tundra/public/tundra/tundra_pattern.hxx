#pragma once
#include <tundra/tundra_alphabet.hxx>
#include <tundra/tundra_result.hxx>
#include <bitset>
#include <vector>

namespace tundra
{

    enum class AtomType : tundra::u8
    {
        Literal,
        Class,
    };

    //! \brief Single pattern element, a literal or a character class, optionally repeated one-or-more times.
    //!
    //! \note Members are stored as alphabet indices, not as characters.
    struct Atom
    {
        using Members = std::bitset<tundra::Alphabet::Constant_MaxCharacters>;

        tundra::AtomType type;
        bool repeated = false;
        Members members;

        bool accepts(tundra::u32 alphabet_index) const noexcept
        {
            return alphabet_index < members.size() && members.test(alphabet_index);
        }
    };

    struct PatternError
    {
        char character = '\0';
        tundra::u32 position = Constant_InvalidIndex;
    };

    //! \brief Parses the pattern syntax into atoms.
    //!
    //! Syntax: any alphabet character is a literal, '[...]' is a character class and
    //!   a '+' after a literal or class makes it repeat one or more times.
    //!
    //! \returns 'Success' or the error state, in which case 'out_error' points at the offending character.
    auto parse_pattern(
        tundra::String pattern,
        tundra::Alphabet const& alphabet,
        std::vector<tundra::Atom>& out_atoms,
        tundra::PatternError& out_error
    ) noexcept -> tundra::TableState;

} // namespace tundra
