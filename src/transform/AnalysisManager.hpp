//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the analysis manager, which caches analysis results per
// operation and drops them once a transform reports that it did not preserve
// them.
//
// Caching and Invalidation Model:
// - Registration: each analysis registers a compute function keyed by one of
//   the identifiers in AnalysisIDs.hpp. The built-in analyses (dominance,
//   loops, liveness) are registered on construction.
// - On-demand computation: a request for an (id, op) pair computes the result
//   once; later requests return the cached object.
// - Preservation-based invalidation: after a transform rewrites an op, every
//   cached result for that op, its ancestors and its descendants that the
//   PreservedAnalyses summary does not name is discarded.
//
//===----------------------------------------------------------------------===//
#pragma once

#include "ir/Context.hpp"
#include "support/diag_expected.hpp"
#include "support/options.hpp"

#include <cassert>
#include <functional>
#include <memory>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace strata::transform
{

class AnalysisManager;

/// @brief Outcome reported by a transform to its caller.
enum class PassStatus
{
    Unchanged,
    Changed
};

/// @brief Summary of the analyses a transform left valid.
class PreservedAnalyses
{
  public:
    /// @brief Every cached analysis remains valid.
    static PreservedAnalyses all();

    /// @brief No cached analysis remains valid.
    static PreservedAnalyses none();

    /// @brief Mark analysis @p id as preserved.
    /// @return Reference to this object for method chaining.
    PreservedAnalyses &preserve(const std::string &id);

    bool preservesAll() const
    {
        return preserveAll_;
    }

    bool isPreserved(const std::string &id) const;

    /// @brief True when any analysis at all is preserved.
    bool hasPreservations() const
    {
        return preserveAll_ || !preserved_.empty();
    }

  private:
    bool preserveAll_ = false;
    std::unordered_set<std::string> preserved_;
};

namespace detail
{
struct AnalysisRecord
{
    std::function<support::Expected<std::shared_ptr<void>>(AnalysisManager &, ir::OpId)> compute;
    std::type_index type{typeid(void)};
};
} // namespace detail

class AnalysisRegistry
{
  public:
    /// @brief Register @p fn as the producer of analysis @p id.
    template <typename Result>
    void registerAnalysis(const std::string &id,
                          std::function<support::Expected<std::shared_ptr<Result>>(AnalysisManager &, ir::OpId)> fn)
    {
        analyses_[id] = detail::AnalysisRecord{
            [fn = std::move(fn)](AnalysisManager &am, ir::OpId op) -> support::Expected<std::shared_ptr<void>>
            {
                auto result = fn(am, op);
                if (!result)
                    return result.error();
                return std::shared_ptr<void>(result.takeValue());
            },
            std::type_index(typeid(Result))};
    }

    const detail::AnalysisRecord *find(const std::string &id) const
    {
        auto it = analyses_.find(id);
        return it == analyses_.end() ? nullptr : &it->second;
    }

  private:
    std::unordered_map<std::string, detail::AnalysisRecord> analyses_;
};

struct AnalysisCounts
{
    std::size_t computations = 0;
};

/// @brief Computes and caches analysis results for the ops of one Context.
class AnalysisManager
{
  public:
    /// @brief Construct a manager with the built-in analyses registered.
    explicit AnalysisManager(const ir::Context &ctx, support::AnalysisOptions options = {});

    AnalysisManager(const AnalysisManager &) = delete;
    AnalysisManager &operator=(const AnalysisManager &) = delete;

    /// @brief Retrieve or compute analysis @p id of @p op.
    /// @tparam Result Type the analysis was registered with.
    /// @return Pointer to the cached result, or the error of its computation.
    template <typename Result> support::Expected<Result *> getResult(const std::string &id, ir::OpId op)
    {
        const detail::AnalysisRecord *record = registry_.find(id);
        assert(record && "unknown analysis");
        assert(record->type == std::type_index(typeid(Result)) && "analysis result type mismatch");

        std::shared_ptr<void> &cache = cache_[id][op];
        if (!cache)
        {
            auto computed = record->compute(*this, op);
            if (!computed)
            {
                cache_[id].erase(op);
                return computed.error();
            }
            cache_[id][op] = computed.takeValue();
            ++counts_.computations;
        }
        return static_cast<Result *>(cache_[id][op].get());
    }

    /// @brief True when analysis @p id of @p op is currently cached.
    bool isCached(const std::string &id, ir::OpId op) const;

    /// @brief Drop results for @p op, its ancestors and its descendants that
    ///        @p preserved does not keep.
    void invalidate(const PreservedAnalyses &preserved, ir::OpId op);

    AnalysisRegistry &registry()
    {
        return registry_;
    }

    const ir::Context &context() const
    {
        return ctx_;
    }

    const support::AnalysisOptions &options() const
    {
        return options_;
    }

    /// @brief Snapshot analysis computation counts for diagnostics.
    AnalysisCounts counts() const
    {
        return counts_;
    }

  private:
    const ir::Context &ctx_;
    support::AnalysisOptions options_;
    AnalysisRegistry registry_;
    std::unordered_map<std::string, std::unordered_map<ir::OpId, std::shared_ptr<void>>> cache_;
    AnalysisCounts counts_{};
};

} // namespace strata::transform
