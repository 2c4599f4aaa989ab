#include <tundra/tundra_format.hxx>

namespace tundra
{

    auto describe_character(char ch) noexcept -> std::string
    {
        switch (ch)
        {
        case '\n': return "\\n";
        case '\r': return "\\r";
        case '\t': return "\\t";
        case '\0': return "\\0";
        default:
            break;
        }

        tundra::u8 const code = static_cast<tundra::u8>(ch);
        if (code < 0x20 || code >= 0x7f)
        {
            return fmt::format("\\x{:02x}", code);
        }
        return std::string(1, ch);
    }

} // namespace tundra
