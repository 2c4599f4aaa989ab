#pragma once
#include <tundra/tundra_alphabet.hxx>
#include <tundra/tundra_pattern.hxx>
#include <tundra/tundra_trie.hxx>
#include <tundra/tundra_lexer.hxx>
#include <optional>
#include <vector>

namespace tundra
{

    //! \brief Set of patterns over a fixed alphabet, each pattern associated with a value.
    //!
    //! The table is filled with 'add' and then only read. Reads never modify it, so a filled table can be
    //!   used by any number of 'get' calls and lexers at the same time.
    //!
    //! \note 'Value' needs to be copy constructible, nodes cloned during an insertion keep a copy of it.
    template<typename Value>
    class Table
    {
    public:
        explicit Table(tundra::String alphabet) noexcept;

        //! \brief Inserts the pattern, a failed insertion leaves the table unchanged.
        auto add(
            tundra::String pattern,
            Value value
        ) noexcept -> tundra::TableResult<Value>;

        //! \brief Matches the whole query string against the stored patterns.
        auto get(tundra::String query) const noexcept -> tundra::MatchResult<Value>;

        //! \brief Creates a tokenizer over the input, fails if the input is not ASCII.
        auto lexer(
            tundra::String input,
            tundra::LexerOptions options = { }
        ) const noexcept -> tundra::LexerResult<Value>;

        auto alphabet() const noexcept -> tundra::Alphabet const& { return _alphabet; }
        auto node_count() const noexcept -> tundra::u32 { return _trie.node_count(); }

    private:
        template<typename LexerValue>
        friend auto create_lexer(
            tundra::Table<LexerValue> const& table,
            tundra::String input,
            tundra::LexerOptions options
        ) noexcept -> tundra::Lexer<LexerValue>;

        //! \returns The value stored on the node or 'nullptr' for non-terminal nodes.
        auto value(tundra::u32 node) const noexcept -> Value const*;

        tundra::Alphabet _alphabet;
        tundra::Trie _trie;
        std::vector<std::optional<Value>> _values;
    };

    template<typename Value>
    inline Table<Value>::Table(tundra::String alphabet) noexcept
        : _alphabet{ alphabet }
        , _trie{ _alphabet.size() }
        , _values(1)
    {
    }

    template<typename Value>
    inline auto Table<Value>::add(
        tundra::String pattern,
        Value value
    ) noexcept -> tundra::TableResult<Value>
    {
        std::vector<tundra::Atom> atoms;
        tundra::PatternError pattern_error;

        tundra::TableState const state = tundra::parse_pattern(pattern, _alphabet, atoms, pattern_error);
        if (tundra::has_error(state))
        {
            return TableResult<Value>{ state, pattern_error.character, pattern_error.position };
        }

        tundra::InsertionPlan plan;
        if (tundra::TableState const plan_state = _trie.plan_insertion(atoms, plan); tundra::has_error(plan_state))
        {
            return TableResult<Value>{ plan_state };
        }

        for (tundra::InsertionPlan::Node const& planned : plan.nodes)
        {
            if (planned.accepting && planned.origin != Constant_InvalidIndex && _values[planned.origin].has_value())
            {
                return TableResult<Value>::value_already_defined(*_values[planned.origin], std::move(value));
            }
        }

        std::vector<tundra::u32> handles;
        std::vector<tundra::u32> released;
        _trie.apply(plan, handles, released);
        _values.resize(_trie.capacity());

        // Cloned nodes take over the value of their origin, released slots are only cleared afterwards.
        for (tundra::u32 planned_idx = 1; planned_idx < plan.nodes.size(); ++planned_idx)
        {
            tundra::InsertionPlan::Node const& planned = plan.nodes[planned_idx];
            tundra::u32 const node = handles[planned_idx];

            if (planned.accepting)
            {
                _values[node].emplace(value);
            }
            else if (node != planned.origin && planned.origin != Constant_InvalidIndex && _values[planned.origin].has_value())
            {
                _values[node].emplace(*_values[planned.origin]);
            }
        }

        for (tundra::u32 const node : released)
        {
            _values[node].reset();
        }

        return TableResult<Value>{ TableState::Success };
    }

    template<typename Value>
    inline auto Table<Value>::get(tundra::String query) const noexcept -> tundra::MatchResult<Value>
    {
        for (tundra::u32 idx = 0; idx < query.size(); ++idx)
        {
            if (tundra::is_ascii(query[idx]) == false)
            {
                return MatchResult<Value>{ TableState::Error_InvalidString, query[idx], idx };
            }
        }

        tundra::u32 node = Trie::Constant_Root;
        for (tundra::u32 idx = 0; idx < query.size(); ++idx)
        {
            tundra::u32 const alphabet_idx = _alphabet.index_of(query[idx]);
            if (alphabet_idx == Constant_InvalidIndex)
            {
                return MatchResult<Value>{ TableState::Error_UnknownChar, query[idx], idx };
            }

            node = _trie.edge(node, alphabet_idx);
            if (node == Constant_InvalidIndex)
            {
                return MatchResult<Value>{ nullptr };
            }
        }

        return MatchResult<Value>{ value(node) };
    }

    template<typename Value>
    inline auto Table<Value>::lexer(
        tundra::String input,
        tundra::LexerOptions options
    ) const noexcept -> tundra::LexerResult<Value>
    {
        for (tundra::u32 idx = 0; idx < input.size(); ++idx)
        {
            if (tundra::is_ascii(input[idx]) == false)
            {
                return LexerResult<Value>{ ._state = LexerState::Error_InvalidString, ._position = idx };
            }
        }

        return LexerResult<Value>{ ._lexer = tundra::create_lexer(*this, input, options) };
    }

    template<typename Value>
    inline auto Table<Value>::value(tundra::u32 node) const noexcept -> Value const*
    {
        std::optional<Value> const& slot = _values[node];
        return slot.has_value() ? &*slot : nullptr;
    }

} // namespace tundra
