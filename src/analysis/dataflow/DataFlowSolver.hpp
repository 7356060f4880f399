//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: analysis/dataflow/DataFlowSolver.hpp
// Purpose: Declares the worklist driver shared by every dataflow analysis.
// Key invariants: States are keyed by (canonical anchor, state type). A state
//                 change re-enqueues the points recorded in the dependency
//                 table and the subscribers' points for that anchor; states
//                 never call back into analyses themselves.
// Ownership/Lifetime: The solver owns loaded analyses and all states. The
//                     Context must outlive the solver.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "analysis/dataflow/AnalysisState.hpp"
#include "ir/Context.hpp"
#include "support/diag_expected.hpp"
#include "support/options.hpp"

#include <deque>
#include <memory>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace strata::analysis::dataflow
{

class DataFlowSolver;

/// @brief Operation whose nested IR an analysis run covers.
/// @details Passed explicitly into every initialize and visit call.
struct AnalysisScope
{
    ir::OpId top;

    /// @brief Report whether @p op is @c top or nested inside it.
    bool contains(const ir::Context &ctx, ir::OpId op) const
    {
        return ctx.isAncestor(top, op);
    }
};

/// @brief Order in which an analysis walks program points.
enum class Direction
{
    Forward,
    Backward
};

/// @brief One analysis driven by the solver.
class DataFlowAnalysis
{
  public:
    virtual ~DataFlowAnalysis() = default;

    /// @brief Name used in traces.
    virtual const char *debugName() const = 0;

    virtual Direction direction() const
    {
        return Direction::Forward;
    }

    /// @brief Seed states and worklist entries for @p scope.
    virtual support::Expected<void> initialize(const AnalysisScope &scope, DataFlowSolver &solver) = 0;

    /// @brief Recompute the states owned by this analysis at @p point.
    virtual support::Expected<void> visit(const AnalysisScope &scope,
                                          const ir::ProgramPoint &point,
                                          DataFlowSolver &solver) = 0;
};

/// @brief Worklist driver and owner of every analysis state.
class DataFlowSolver
{
  public:
    explicit DataFlowSolver(const ir::Context &ctx, support::AnalysisOptions options = {});

    DataFlowSolver(const DataFlowSolver &) = delete;
    DataFlowSolver &operator=(const DataFlowSolver &) = delete;

    const ir::Context &context() const
    {
        return ctx_;
    }

    const support::AnalysisOptions &options() const
    {
        return options_;
    }

    /// @brief Construct and register an analysis; analyses initialize in load order.
    template <typename A, typename... Args> A &load(Args &&...args)
    {
        auto analysis = std::make_unique<A>(std::forward<Args>(args)...);
        A &ref = *analysis;
        analyses_.push_back(std::move(analysis));
        return ref;
    }

    /// @brief Initialize every loaded analysis on @p top and run to a fixpoint.
    /// @return The first error reported by an analysis, if any.
    [[nodiscard]] support::Expected<void> initializeAndRun(ir::OpId top);

    /// @brief State of type @p S at @p anchor, created on first access.
    template <typename S> S &getOrCreate(const LatticeAnchor &anchor)
    {
        LatticeAnchor key = canonicalAnchor(ctx_, anchor);
        StateKey sk{key, std::type_index(typeid(S))};
        auto it = states_.find(sk);
        if (it == states_.end())
            it = states_.emplace(sk, std::make_unique<S>(key)).first;
        return static_cast<S &>(*it->second);
    }

    /// @brief State of type @p S at @p anchor, or nullptr when never created.
    template <typename S> const S *lookup(const LatticeAnchor &anchor) const
    {
        auto it = states_.find(StateKey{canonicalAnchor(ctx_, anchor), std::type_index(typeid(S))});
        if (it == states_.end())
            return nullptr;
        return static_cast<const S *>(it->second.get());
    }

    /// @brief State at @p anchor, recording that @p analysis must revisit
    ///        @p dependent whenever it changes.
    template <typename S>
    S &require(const LatticeAnchor &anchor, const ir::ProgramPoint &dependent, DataFlowAnalysis *analysis)
    {
        S &state = getOrCreate<S>(anchor);
        addDependency(&state, dependent, analysis);
        return state;
    }

    void addDependency(AnalysisState *state, const ir::ProgramPoint &dependent, DataFlowAnalysis *analysis);

    /// @brief Re-run @p analysis over every point @p state's anchor governs
    ///        whenever @p state changes.
    void subscribe(AnalysisState *state, DataFlowAnalysis *analysis);

    /// @brief Notify dependents and subscribers when @p changed says so.
    void propagateIfChanged(AnalysisState *state, ChangeResult changed);

    /// @brief Schedule @p analysis to visit @p point.
    void enqueue(const ir::ProgramPoint &point, DataFlowAnalysis *analysis);

    /// @brief Schedule @p analysis on every point of @p block in its direction.
    void enqueueBlock(ir::BlockId block, DataFlowAnalysis *analysis);

  private:
    struct StateKey
    {
        LatticeAnchor anchor;
        std::type_index type;

        friend bool operator==(const StateKey &, const StateKey &) = default;
    };

    struct StateKeyHash
    {
        std::size_t operator()(const StateKey &key) const noexcept
        {
            return LatticeAnchorHash{}(key.anchor) * 31 + key.type.hash_code();
        }
    };

    struct WorkItem
    {
        ir::ProgramPoint point;
        DataFlowAnalysis *analysis = nullptr;

        friend bool operator==(const WorkItem &, const WorkItem &) = default;
    };

    struct WorkItemHash
    {
        std::size_t operator()(const WorkItem &item) const noexcept
        {
            return ir::ProgramPointHash{}(item.point) ^ std::hash<const void *>{}(item.analysis);
        }
    };

    void enqueueSubscriber(const LatticeAnchor &anchor, DataFlowAnalysis *analysis);

    const ir::Context &ctx_;
    support::AnalysisOptions options_;
    std::vector<std::unique_ptr<DataFlowAnalysis>> analyses_;
    std::unordered_map<StateKey, std::unique_ptr<AnalysisState>, StateKeyHash> states_;
    std::unordered_map<const AnalysisState *, std::vector<WorkItem>> dependents_;
    std::unordered_map<const AnalysisState *, std::vector<DataFlowAnalysis *>> subscribers_;
    std::deque<WorkItem> worklist_;
    std::unordered_set<WorkItem, WorkItemHash> queued_;
};

} // namespace strata::analysis::dataflow
