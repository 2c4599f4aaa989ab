#include <tundra/tundra_lexer.hxx>

namespace tundra
{

    auto advance_location(
        tundra::TokenLocation location,
        tundra::String text,
        tundra::LexerOptions const& options
    ) noexcept -> tundra::TokenLocation
    {
        for (char const ch : text)
        {
            if (ch == '\n')
            {
                location.line += 1;
                location.column = 1;
            }
            else
            {
                location.column += ch == '\t' ? options.tab_size : 1;
            }
        }
        return location;
    }

} // namespace tundra
