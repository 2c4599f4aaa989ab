#include <tundra/tundra_pattern.hxx>

namespace tundra
{

    namespace detail
    {

        auto pattern_error(
            tundra::TableState state,
            tundra::String pattern,
            tundra::u32 position,
            tundra::PatternError& out_error
        ) noexcept -> tundra::TableState
        {
            out_error.position = position;
            out_error.character = position < pattern.size() ? pattern[position] : '\0';
            return state;
        }

        auto parse_pattern_class(
            tundra::String pattern,
            tundra::Alphabet const& alphabet,
            tundra::u32& inout_position,
            tundra::Atom& out_atom,
            tundra::PatternError& out_error
        ) noexcept -> tundra::TableState
        {
            tundra::u32 const open_position = inout_position;
            tundra::u32 position = open_position + 1;

            if (position < pattern.size() && pattern[position] == '+')
            {
                return pattern_error(TableState::Error_InvalidRange, pattern, position, out_error);
            }

            while (position < pattern.size() && pattern[position] != ']')
            {
                tundra::u32 const index = alphabet.index_of(pattern[position]);
                if (index == Constant_InvalidIndex)
                {
                    return pattern_error(TableState::Error_InvalidInput, pattern, position, out_error);
                }

                out_atom.members.set(index);
                position += 1;
            }

            // Unterminated '[abc' or empty '[]' class
            if (position == pattern.size() || out_atom.members.none())
            {
                return pattern_error(TableState::Error_InvalidRange, pattern, open_position, out_error);
            }

            inout_position = position + 1;
            return TableState::Success;
        }

    } // namespace detail

    auto parse_pattern(
        tundra::String pattern,
        tundra::Alphabet const& alphabet,
        std::vector<tundra::Atom>& out_atoms,
        tundra::PatternError& out_error
    ) noexcept -> tundra::TableState
    {
        for (tundra::u32 idx = 0; idx < pattern.size(); ++idx)
        {
            if (tundra::is_ascii(pattern[idx]) == false)
            {
                return detail::pattern_error(TableState::Error_InvalidString, pattern, idx, out_error);
            }
        }

        if (pattern.empty())
        {
            return detail::pattern_error(TableState::Error_InvalidRange, pattern, 0, out_error);
        }

        out_atoms.clear();

        tundra::u32 position = 0;
        while (position < pattern.size())
        {
            char const ch = pattern[position];

            // A '+' here never follows a completed atom, those are consumed below.
            if (ch == '+')
            {
                return detail::pattern_error(TableState::Error_InvalidRange, pattern, position, out_error);
            }

            tundra::Atom atom{ .type = AtomType::Literal };
            if (ch == '[')
            {
                atom.type = AtomType::Class;

                tundra::TableState const state = detail::parse_pattern_class(
                    pattern, alphabet, position, atom, out_error
                );
                if (tundra::has_error(state))
                {
                    return state;
                }
            }
            else
            {
                tundra::u32 const index = alphabet.index_of(ch);
                if (index == Constant_InvalidIndex)
                {
                    return detail::pattern_error(TableState::Error_InvalidInput, pattern, position, out_error);
                }

                atom.members.set(index);
                position += 1;
            }

            if (position < pattern.size() && pattern[position] == '+')
            {
                atom.repeated = true;
                position += 1;
            }

            out_atoms.push_back(atom);
        }

        return TableState::Success;
    }

} // namespace tundra
