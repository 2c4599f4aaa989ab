#pragma once
#include <tundra/tundra_result.hxx>
#include <tundra/tundra_lexer.hxx>
#include <fmt/format.h>
#include <string>

namespace tundra
{

    //! \brief Printable form of a single character, control and non-ASCII bytes are escaped.
    auto describe_character(char ch) noexcept -> std::string;

    namespace detail
    {

        template<typename Value>
        auto describe_value(Value const& value) noexcept -> std::string
        {
            if constexpr (fmt::is_formattable<Value>::value)
            {
                return fmt::format("{}", value);
            }
            else
            {
                return "<value>";
            }
        }

    } // namespace detail

    template<typename Value>
    auto describe(tundra::TableResult<Value> const& result) noexcept -> std::string
    {
        switch (result._state)
        {
        case TableState::Success:
            return "Success";
        case TableState::Error_InvalidString:
            return fmt::format("Invalid string (non-ASCII byte at position {})", result._position);
        case TableState::Error_InvalidInput:
            return fmt::format(
                "Invalid input character: '{}' at position {}",
                tundra::describe_character(result._character),
                result._position
            );
        case TableState::Error_InvalidRange:
            return fmt::format(
                "Invalid range: unclosed or empty bracket, or '+' without an atom at position {}",
                result._position
            );
        case TableState::Error_ValueAlreadyDefined:
            return fmt::format(
                "Value already defined: current={}, requested={}",
                detail::describe_value(*result._current),
                detail::describe_value(*result._requested)
            );
        case TableState::Error_PatternTooComplex:
            return fmt::format(
                "Pattern too complex: needs more than {} distinct position sets",
                InsertionPlan::Constant_MaxPositionSets
            );
        default:
            return std::string{ result.error_string() };
        }
    }

    template<typename Value>
    auto describe(tundra::MatchResult<Value> const& result) noexcept -> std::string
    {
        switch (result._state)
        {
        case TableState::Success:
            return result.has_match()
                ? fmt::format("Match: {}", detail::describe_value(*result._value))
                : std::string{ "No match" };
        case TableState::Error_InvalidString:
            return fmt::format("Invalid string (non-ASCII byte at position {})", result._position);
        case TableState::Error_UnknownChar:
            return fmt::format(
                "Unknown character '{}' at position {}",
                tundra::describe_character(result._character),
                result._position
            );
        default:
            return std::string{ result.error_string() };
        }
    }

    template<typename Value>
    auto describe(tundra::LexerToken<Value> const& token) noexcept -> std::string
    {
        switch (token.state)
        {
        case LexerState::Token:
            return fmt::format(
                "{}:{}: '{}' -> {}",
                token.location.line,
                token.location.column,
                token.text,
                detail::describe_value(*token.value)
            );
        case LexerState::Done:
            return fmt::format("{}:{}: end of input", token.location.line, token.location.column);
        case LexerState::Error_UnknownChar:
            return fmt::format(
                "{}:{}: unknown character '{}' at position {}",
                token.location.line,
                token.location.column,
                tundra::describe_character(token.character()),
                token.position
            );
        case LexerState::Error_UnexpectedEnd:
            return fmt::format(
                "{}:{}: no pattern matches '{}' at position {}",
                token.location.line,
                token.location.column,
                token.text,
                token.position
            );
        default:
            return std::string{ to_string(token.state) };
        }
    }

    template<typename Value>
    auto describe(tundra::LexerResult<Value> const& result) noexcept -> std::string
    {
        if (result._state == LexerState::Error_InvalidString)
        {
            return fmt::format("Invalid string (non-ASCII byte at position {})", result._position);
        }
        return std::string{ result.error_string() };
    }

} // namespace tundra
