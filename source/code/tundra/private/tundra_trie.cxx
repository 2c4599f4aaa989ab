#include <tundra/tundra_trie.hxx>
#include <algorithm>
#include <cassert>
#include <map>
#include <set>

namespace tundra
{

    namespace detail
    {

        using PatternPositions = std::vector<tundra::u32>;
        using PlanKey = std::pair<PatternPositions, tundra::u32>;

        //! \brief Pattern positions reachable after reading the character with the given index.
        //!
        //! Position 'P' means atoms [0, P) were consumed. A repeated atom 'P - 1' keeps us at 'P'.
        auto step_positions(
            tundra::Span<tundra::Atom const> atoms,
            detail::PatternPositions const& positions,
            tundra::u32 alphabet_index
        ) noexcept -> detail::PatternPositions
        {
            detail::PatternPositions result;
            for (tundra::u32 const position : positions)
            {
                if (position < atoms.size() && atoms[position].accepts(alphabet_index))
                {
                    result.push_back(position + 1);
                }
                if (position > 0 && atoms[position - 1].repeated && atoms[position - 1].accepts(alphabet_index))
                {
                    result.push_back(position);
                }
            }

            std::sort(result.begin(), result.end());
            result.erase(std::unique(result.begin(), result.end()), result.end());
            return result;
        }

    } // namespace detail

    Trie::Trie(tundra::u32 row_width) noexcept
        : _row_width{ row_width }
        , _node_count{ 1 }
        , _edges(row_width, Constant_InvalidIndex)
        , _references(1, 0)
    {
    }

    auto Trie::self_loop(tundra::u32 node) const noexcept -> tundra::Atom::Members
    {
        tundra::Atom::Members result;
        for (tundra::u32 idx = 0; idx < _row_width; ++idx)
        {
            if (edge(node, idx) == node)
            {
                result.set(idx);
            }
        }
        return result;
    }

    auto Trie::plan_insertion(
        tundra::Span<tundra::Atom const> atoms,
        tundra::InsertionPlan& out_plan
    ) const noexcept -> tundra::TableState
    {
        out_plan.nodes.clear();
        out_plan.edges.clear();

        tundra::u32 const final_position = tundra::u32(atoms.size());

        std::map<detail::PlanKey, tundra::u32> known_nodes;
        std::vector<detail::PlanKey> node_keys;
        std::set<detail::PatternPositions> position_sets;

        auto const find_or_plan = [&](detail::PatternPositions positions, tundra::u32 origin) noexcept -> tundra::u32
        {
            detail::PlanKey key{ std::move(positions), origin };

            auto const it = known_nodes.find(key);
            if (it != known_nodes.end())
            {
                return it->second;
            }

            tundra::u32 const planned_idx = tundra::u32(out_plan.nodes.size());
            bool const accepting = std::binary_search(key.first.begin(), key.first.end(), final_position);

            out_plan.nodes.push_back({ .origin = origin, .accepting = accepting });
            out_plan.edges.resize(out_plan.edges.size() + _row_width, Constant_InvalidIndex);
            position_sets.insert(key.first);
            known_nodes.emplace(key, planned_idx);
            node_keys.push_back(std::move(key));
            return planned_idx;
        };

        find_or_plan({ 0 }, Constant_Root);

        // New nodes get appended while we iterate, the loop ends once every one of them got its edge row.
        for (tundra::u32 planned_idx = 0; planned_idx < out_plan.nodes.size(); ++planned_idx)
        {
            if (position_sets.size() > InsertionPlan::Constant_MaxPositionSets)
            {
                out_plan.nodes.clear();
                out_plan.edges.clear();
                return TableState::Error_PatternTooComplex;
            }

            detail::PatternPositions const positions = node_keys[planned_idx].first;
            tundra::u32 const origin = node_keys[planned_idx].second;

            for (tundra::u32 alphabet_idx = 0; alphabet_idx < _row_width; ++alphabet_idx)
            {
                tundra::u32 const origin_target = origin == Constant_InvalidIndex
                    ? Constant_InvalidIndex
                    : edge(origin, alphabet_idx);

                detail::PatternPositions next_positions = detail::step_positions(atoms, positions, alphabet_idx);

                tundra::u32 target = origin_target;
                if (next_positions.empty() == false)
                {
                    target = find_or_plan(std::move(next_positions), origin_target) | InsertionPlan::Constant_PlannedNode;
                }

                out_plan.edges[planned_idx * _row_width + alphabet_idx] = target;
            }
        }

        return TableState::Success;
    }

    void Trie::apply(
        tundra::InsertionPlan const& plan,
        std::vector<tundra::u32>& out_handles,
        std::vector<tundra::u32>& out_released
    ) noexcept
    {
        assert(plan.nodes.empty() == false);

        tundra::u32 const planned_count = tundra::u32(plan.nodes.size());
        out_handles.assign(planned_count, Constant_InvalidIndex);
        out_released.clear();

        auto const planned_target = [&plan, this](tundra::u32 planned_idx, tundra::u32 alphabet_idx) noexcept -> tundra::u32
        {
            tundra::u32 const target = plan.edges[planned_idx * _row_width + alphabet_idx];
            if (target == Constant_InvalidIndex || (target & InsertionPlan::Constant_PlannedNode) == 0)
            {
                return Constant_InvalidIndex;
            }
            return target & ~InsertionPlan::Constant_PlannedNode;
        };

        // Without self-loops the plan is acyclic, so handles are decided parents first.
        std::vector<tundra::u32> pending(planned_count, 0);
        std::vector<tundra::u32> redirected(planned_count, 0);
        for (tundra::u32 planned_idx = 0; planned_idx < planned_count; ++planned_idx)
        {
            for (tundra::u32 alphabet_idx = 0; alphabet_idx < _row_width; ++alphabet_idx)
            {
                tundra::u32 const target = planned_target(planned_idx, alphabet_idx);
                if (target != Constant_InvalidIndex && target != planned_idx)
                {
                    pending[target] += 1;
                }
            }
        }

        std::vector<tundra::u32> ready{ 0 };
        ready.reserve(planned_count);
        out_handles[0] = Constant_Root;

        for (tundra::u32 ready_idx = 0; ready_idx < ready.size(); ++ready_idx)
        {
            tundra::u32 const planned_idx = ready[ready_idx];
            tundra::u32 const origin = plan.nodes[planned_idx].origin;

            // The origin can be rewritten only if no edge outside of this plan still enters it.
            if (planned_idx != 0)
            {
                bool const reuse_origin = origin != Constant_InvalidIndex
                    && redirected[planned_idx] == _references[origin]
                    && self_loop(origin).none();

                out_handles[planned_idx] = reuse_origin ? origin : allocate_node();
            }

            bool const in_place = out_handles[planned_idx] == origin;
            for (tundra::u32 alphabet_idx = 0; alphabet_idx < _row_width; ++alphabet_idx)
            {
                tundra::u32 const target = planned_target(planned_idx, alphabet_idx);
                if (target == Constant_InvalidIndex || target == planned_idx)
                {
                    continue;
                }

                if (in_place)
                {
                    redirected[target] += 1;
                }

                pending[target] -= 1;
                if (pending[target] == 0)
                {
                    ready.push_back(target);
                }
            }
        }

        std::vector<tundra::u32> orphan_candidates;
        for (tundra::u32 planned_idx = 0; planned_idx < planned_count; ++planned_idx)
        {
            tundra::u32 const node = out_handles[planned_idx];
            bool const in_place = node == plan.nodes[planned_idx].origin;

            for (tundra::u32 alphabet_idx = 0; alphabet_idx < _row_width; ++alphabet_idx)
            {
                tundra::u32 const target_idx = planned_target(planned_idx, alphabet_idx);
                tundra::u32 const target = target_idx == Constant_InvalidIndex
                    ? plan.edges[planned_idx * _row_width + alphabet_idx]
                    : out_handles[target_idx];

                tundra::u32& slot = _edges[node * _row_width + alphabet_idx];
                if (in_place && slot != Constant_InvalidIndex && slot != node)
                {
                    _references[slot] -= 1;
                    orphan_candidates.push_back(slot);
                }
                if (target != Constant_InvalidIndex && target != node)
                {
                    _references[target] += 1;
                }
                slot = target;
            }
        }

        for (tundra::u32 const candidate : orphan_candidates)
        {
            if (_references[candidate] == 0)
            {
                release_node(candidate, out_released);
            }
        }
    }

    auto Trie::allocate_node() noexcept -> tundra::u32
    {
        tundra::u32 node = Constant_InvalidIndex;
        if (_free_nodes.empty() == false)
        {
            node = _free_nodes.back();
            _free_nodes.pop_back();
        }
        else
        {
            node = capacity();
            _edges.resize(_edges.size() + _row_width, Constant_InvalidIndex);
            _references.push_back(0);
        }

        _references[node] = 0;
        _node_count += 1;
        return node;
    }

    void Trie::release_node(tundra::u32 node, std::vector<tundra::u32>& out_released) noexcept
    {
        std::vector<tundra::u32> stack{ node };
        while (stack.empty() == false)
        {
            tundra::u32 const released = stack.back();
            stack.pop_back();

            for (tundra::u32 alphabet_idx = 0; alphabet_idx < _row_width; ++alphabet_idx)
            {
                tundra::u32& slot = _edges[released * _row_width + alphabet_idx];
                if (slot != Constant_InvalidIndex && slot != released)
                {
                    _references[slot] -= 1;
                    if (_references[slot] == 0)
                    {
                        stack.push_back(slot);
                    }
                }
                slot = Constant_InvalidIndex;
            }

            _references[released] = Constant_InvalidIndex;
            _free_nodes.push_back(released);
            _node_count -= 1;
            out_released.push_back(released);
        }
    }

} // namespace tundra
