#pragma once
#include <tundra/tundra_result.hxx>

namespace tundra
{

    //! \brief 1-based line and column of a token or error.
    struct TokenLocation
    {
        tundra::u32 line = 1;
        tundra::u32 column = 1;
    };

    //! \brief Single item produced by a lexer.
    //!
    //! For 'Token' the text is the matched part of the input and the value points into the table.
    //!   For 'Error_UnknownChar' the text holds only the rejected character, for 'Error_UnexpectedEnd' it
    //!   holds the characters read by the failed attempt. 'Done' has empty text.
    template<typename Value>
    struct LexerToken
    {
        tundra::LexerState state = LexerState::Done;
        Value const* value = nullptr;
        tundra::String text;

        //! \brief 0-based offset of the token (or error) in the input.
        tundra::u32 position = 0;
        tundra::TokenLocation location;

        constexpr bool has_error() const noexcept
        {
            return tundra::has_error(state);
        }

        constexpr auto character() const noexcept -> char
        {
            return text.empty() ? '\0' : text.front();
        }
    };

} // namespace tundra
