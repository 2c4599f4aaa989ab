#include <tundra/tundra_result.hxx>

namespace tundra
{

    auto to_string(tundra::TableState state) noexcept -> std::string_view
    {
        switch(state)
#define CASE(value, ...) case TableState::value: return #value #__VA_ARGS__ ""
        {
            CASE(Success);
            CASE(Error, ": Unknown");
            CASE(Error_InvalidString);
            CASE(Error_InvalidInput);
            CASE(Error_InvalidRange);
            CASE(Error_ValueAlreadyDefined);
            CASE(Error_PatternTooComplex);
            CASE(Error_UnknownChar);
#undef CASE
        }
        return "<?>";
    }

    auto to_string(tundra::LexerState state) noexcept -> std::string_view
    {
        switch(state)
#define CASE(value, ...) case LexerState::value: return #value #__VA_ARGS__ ""
        {
            CASE(Token);
            CASE(Done);
            CASE(Error, ": Unknown");
            CASE(Error_InvalidString);
            CASE(Error_UnknownChar);
            CASE(Error_UnexpectedEnd);
#undef CASE
        }
        return "<?>";
    }

} // namespace tundra
