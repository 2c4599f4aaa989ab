#pragma once
#include <tundra/tundra_types.hxx>
#include <optional>
#include <utility>

namespace tundra
{

    enum class TableState : tundra::u32
    {
        Success = 0x0,
        Error = 0x8000'0000,

        // Pattern insertion errors
        Error_InvalidString = Error | 0x0001,
        Error_InvalidInput = Error | 0x0002,
        Error_InvalidRange = Error | 0x0003,
        Error_ValueAlreadyDefined = Error | 0x0004,
        Error_PatternTooComplex = Error | 0x0005,

        // Query errors
        Error_UnknownChar = Error | 0x0101,
    };

    enum class LexerState : tundra::u32
    {
        Token = 0x0,
        Done = 0x1,
        Error = 0x8000'0000,

        Error_InvalidString = Error | 0x0001,
        Error_UnknownChar = Error | 0x0101,
        Error_UnexpectedEnd = Error | 0x0102,
    };

    auto to_string(tundra::TableState state) noexcept -> std::string_view;

    auto to_string(tundra::LexerState state) noexcept -> std::string_view;

    constexpr bool has_error(tundra::TableState state) noexcept
    {
        return (static_cast<tundra::u32>(state) & static_cast<tundra::u32>(TableState::Error)) != 0;
    }

    constexpr bool has_error(tundra::LexerState state) noexcept
    {
        return (static_cast<tundra::u32>(state) & static_cast<tundra::u32>(LexerState::Error)) != 0;
    }

    //! \brief Outcome of inserting a pattern into a table.
    //!
    //! \note '_character' and '_position' describe the offending pattern character for 'Error_InvalidInput'.
    //!   '_current' and '_requested' are only set for 'Error_ValueAlreadyDefined'.
    template<typename Value>
    struct TableResult
    {
        constexpr TableResult(
            tundra::TableState state = TableState::Success
        ) noexcept
            : _state{ state }
        {
        }

        constexpr TableResult(
            tundra::TableState state,
            char character,
            tundra::u32 position
        ) noexcept
            : _state{ state }
            , _character{ character }
            , _position{ position }
        {
        }

        static auto value_already_defined(Value current, Value requested) noexcept -> TableResult
        {
            TableResult result{ TableState::Error_ValueAlreadyDefined };
            result._current.emplace(std::move(current));
            result._requested.emplace(std::move(requested));
            return result;
        }

        constexpr bool has_error() const noexcept
        {
            return tundra::has_error(_state);
        }

        constexpr operator tundra::TableState() const noexcept
        {
            return _state;
        }

        auto error_string() const noexcept -> std::string_view
        {
            return to_string(_state);
        }

        tundra::TableState _state;
        char _character = '\0';
        tundra::u32 _position = Constant_InvalidIndex;
        std::optional<Value> _current;
        std::optional<Value> _requested;
    };

    //! \brief Outcome of matching a single query string.
    //!
    //! A successful query without a match has a 'nullptr' value and is not an error.
    template<typename Value>
    struct MatchResult
    {
        constexpr MatchResult(
            Value const* value,
            tundra::TableState state = TableState::Success
        ) noexcept
            : _value{ value }
            , _state{ state }
        {
        }

        constexpr MatchResult(
            tundra::TableState state,
            char character = '\0',
            tundra::u32 position = Constant_InvalidIndex
        ) noexcept
            : _value{ nullptr }
            , _state{ state }
            , _character{ character }
            , _position{ position }
        {
        }

        constexpr bool has_error() const noexcept
        {
            return tundra::has_error(_state);
        }

        constexpr bool has_match() const noexcept
        {
            return _value != nullptr;
        }

        constexpr operator Value const*() const noexcept
        {
            return _value;
        }

        auto error_string() const noexcept -> std::string_view
        {
            return to_string(_state);
        }

        Value const* _value;
        tundra::TableState _state;
        char _character = '\0';
        tundra::u32 _position = Constant_InvalidIndex;
    };

} // namespace tundra
