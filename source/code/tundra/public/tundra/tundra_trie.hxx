#pragma once
#include <tundra/tundra_pattern.hxx>
#include <tundra/tundra_result.hxx>
#include <vector>

namespace tundra
{

    //! \brief Nodes and edges a pattern insertion will produce, computed without touching the trie.
    //!
    //! Each planned node stands for a set of pattern positions combined with the existing node reached
    //!   by the same input (its 'origin'). Planned node '0' always replaces the root.
    struct InsertionPlan
    {
        //! \brief Set on an edge target when it refers to a planned node instead of an existing one.
        static constexpr tundra::u32 Constant_PlannedNode = 0x8000'0000;

        //! \brief Upper limit of distinct pattern position sets a single pattern may expand to.
        //!
        //! Patterns where a repeated atom overlaps what follows it need one state per combination of open
        //!   positions, which grows exponentially for inputs like '[ab]+a[ab][ab]...'.
        static constexpr tundra::u32 Constant_MaxPositionSets = 4096;

        struct Node
        {
            tundra::u32 origin;
            bool accepting;
        };

        std::vector<Node> nodes;
        std::vector<tundra::u32> edges;
    };

    //! \brief Automaton graph stored as a node arena with one dense edge row per node.
    //!
    //! Nodes are referenced by index, the root is always '0'. An edge pointing back to its own node is a
    //!   self-loop, so a self-loop and a forward edge can never exist for the same character.
    //!
    //! Released nodes are kept in a free list and reused by later insertions, 'node_count' only counts
    //!   live nodes while 'capacity' is the size of the arena.
    class Trie
    {
    public:
        static constexpr tundra::u32 Constant_Root = 0;

        explicit Trie(tundra::u32 row_width) noexcept;

        auto row_width() const noexcept -> tundra::u32 { return _row_width; }
        auto node_count() const noexcept -> tundra::u32 { return _node_count; }
        auto capacity() const noexcept -> tundra::u32 { return tundra::u32(_references.size()); }

        //! \returns The child reached with the given alphabet index or 'Constant_InvalidIndex'.
        auto edge(tundra::u32 node, tundra::u32 alphabet_index) const noexcept -> tundra::u32
        {
            return _edges[node * _row_width + alphabet_index];
        }

        //! \returns Alphabet indices for which the node transitions to itself.
        auto self_loop(tundra::u32 node) const noexcept -> tundra::Atom::Members;

        //! \brief Builds the plan for inserting the atom sequence, the trie is not modified.
        //!
        //! \returns 'Error_PatternTooComplex' if the pattern needs more than
        //!   'InsertionPlan::Constant_MaxPositionSets' position sets, 'Success' otherwise.
        auto plan_insertion(
            tundra::Span<tundra::Atom const> atoms,
            tundra::InsertionPlan& out_plan
        ) const noexcept -> tundra::TableState;

        //! \brief Applies a plan to the trie.
        //!
        //! A planned node takes over its origin in place when every edge entering the origin is rewritten
        //!   to it by the same plan. Otherwise it is cloned into a free slot, so paths not described by the
        //!   pattern keep their old structure. Nodes left without incoming edges are released.
        //!
        //! \param[out] out_handles The node handle of every planned node.
        //! \param[out] out_released Handles of released nodes, these may be reused by later insertions.
        void apply(
            tundra::InsertionPlan const& plan,
            std::vector<tundra::u32>& out_handles,
            std::vector<tundra::u32>& out_released
        ) noexcept;

    private:
        auto allocate_node() noexcept -> tundra::u32;
        void release_node(tundra::u32 node, std::vector<tundra::u32>& out_released) noexcept;

    private:
        tundra::u32 _row_width;
        tundra::u32 _node_count;
        std::vector<tundra::u32> _edges;

        //! \brief Number of edges entering each node from other nodes, 'Constant_InvalidIndex' for free slots.
        std::vector<tundra::u32> _references;
        std::vector<tundra::u32> _free_nodes;
    };

} // namespace tundra
