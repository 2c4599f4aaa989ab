#pragma once
#include <tundra/tundra_token.hxx>
#include <tundra/tundra_generator.hxx>
#include <tundra/tundra_trie.hxx>
#include <unordered_set>
#include <vector>

namespace tundra
{

    template<typename Value>
    class Table;

    template<typename Value>
    using Lexer = tundra::detail::Generator<tundra::LexerToken<Value>>;

    struct LexerOptions
    {
        //! \brief Sets the size of tab characters when calculating the token column.
        //! \note This will ensure error messages will have a proper column value.
        tundra::u32 tab_size = 4;
    };

    template<typename Value>
    struct LexerResult
    {
        tundra::Lexer<Value> _lexer;
        tundra::LexerState _state = LexerState::Token;

        //! \brief Offset of the first non-ASCII byte for 'Error_InvalidString'.
        tundra::u32 _position = Constant_InvalidIndex;

        constexpr bool has_error() const noexcept
        {
            return tundra::has_error(_state);
        }

        auto error_string() const noexcept -> std::string_view
        {
            return to_string(_state);
        }
    };

    auto advance_location(
        tundra::TokenLocation location,
        tundra::String text,
        tundra::LexerOptions const& options
    ) noexcept -> tundra::TokenLocation;

    //! \brief Creates a longest-match tokenizer over the given input.
    //!
    //! Every token attempt walks the trie as far as the input allows, remembering the last terminal node
    //!   it passed. A dead end emits the token up to that mark and restarts right after it, without a
    //!   mark the lexer fails. The input needs to be ASCII, which is checked by 'Table::lexer'.
    //!
    //! Each (node, position) pair walked past the last mark of an attempt can not reach a terminal node
    //!   anymore. These pairs are remembered for the session and end later attempts early, so every pair
    //!   is walked at most once and the lexer runs in linear time.
    //!
    //! \note The lexer borrows the table and the input, both need to outlive it.
    template<typename Value>
    auto create_lexer(
        tundra::Table<Value> const& table,
        tundra::String input,
        tundra::LexerOptions options
    ) noexcept -> tundra::Lexer<Value>
    {
        tundra::Trie const& trie = table._trie;
        tundra::Alphabet const& alphabet = table.alphabet();
        tundra::u32 const input_size = tundra::u32(input.size());

        auto const walk_key = [](tundra::u32 node, tundra::u32 position) noexcept -> tundra::u64
        {
            return (tundra::u64(node) << 32) | position;
        };

        std::unordered_set<tundra::u64> dead_ends;
        std::vector<tundra::u64> walked_past_mark;

        tundra::u32 token_start = 0;
        tundra::TokenLocation token_location{ };

        while (token_start < input_size)
        {
            tundra::u32 node = Trie::Constant_Root;
            tundra::u32 position = token_start;
            tundra::u32 unknown_position = Constant_InvalidIndex;

            tundra::u32 mark_end = Constant_InvalidIndex;
            Value const* mark_value = nullptr;
            walked_past_mark.clear();

            while (position < input_size)
            {
                // Without a mark the attempt is the last one, it is walked in full to report the error.
                if (mark_end != Constant_InvalidIndex && dead_ends.contains(walk_key(node, position)))
                {
                    break;
                }

                tundra::u32 const alphabet_idx = alphabet.index_of(input[position]);
                if (alphabet_idx == Constant_InvalidIndex)
                {
                    unknown_position = position;
                    break;
                }

                tundra::u32 const next_node = trie.edge(node, alphabet_idx);
                if (next_node == Constant_InvalidIndex)
                {
                    break;
                }

                walked_past_mark.push_back(walk_key(node, position));
                node = next_node;
                position += 1;

                if (Value const* const value = table.value(node); value != nullptr)
                {
                    mark_end = position;
                    mark_value = value;
                    walked_past_mark.clear();
                }
            }

            if (mark_end != Constant_InvalidIndex)
            {
                tundra::String const text = input.substr(token_start, mark_end - token_start);

                co_yield tundra::LexerToken<Value>{
                    .state = LexerState::Token,
                    .value = mark_value,
                    .text = text,
                    .position = token_start,
                    .location = token_location
                };

                // Anything read past the mark is scanned again by the next attempt.
                dead_ends.insert(walk_key(node, position));
                dead_ends.insert(walked_past_mark.begin(), walked_past_mark.end());

                token_location = tundra::advance_location(token_location, text, options);
                token_start = mark_end;
            }
            else if (unknown_position != Constant_InvalidIndex)
            {
                co_return tundra::LexerToken<Value>{
                    .state = LexerState::Error_UnknownChar,
                    .text = input.substr(unknown_position, 1),
                    .position = unknown_position,
                    .location = tundra::advance_location(
                        token_location,
                        input.substr(token_start, unknown_position - token_start),
                        options
                    )
                };
            }
            else
            {
                tundra::u32 const attempt_end = position < input_size ? position + 1 : input_size;

                co_return tundra::LexerToken<Value>{
                    .state = LexerState::Error_UnexpectedEnd,
                    .text = input.substr(token_start, attempt_end - token_start),
                    .position = token_start,
                    .location = token_location
                };
            }
        }

        co_return tundra::LexerToken<Value>{
            .state = LexerState::Done,
            .position = input_size,
            .location = token_location
        };
    }

} // namespace tundra
