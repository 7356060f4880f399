//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: analysis/DominatorTree.hpp
// Purpose: Dominator and post-dominator trees over the blocks of a region,
//          built with Semi-NCA and maintained incrementally.
// Key invariants: Tree node n describes block n - 1; node 0 is the virtual
//                 root of a post-dominator tree and holds an invalid block.
//                 DFS in/out numbers are meaningful only while
//                 dfsNumbersValid() holds.
// Ownership/Lifetime: The tree owns its node arena and borrows the Context.
//                     Incremental updates must be applied after the
//                     corresponding CFG change has been made to the IR.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/Context.hpp"
#include "support/diag_expected.hpp"
#include "support/options.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <vector>

namespace strata::analysis
{

/// @brief Strength of DominatorTreeBase::verify.
enum class DomTreeVerificationLevel
{
    Fast,  ///< Compare against a fresh tree and check roots, levels and DFS numbers.
    Basic, ///< Fast plus the parent property.
    Full   ///< Basic plus the sibling property.
};

/// @brief Node of a dominator tree.
struct DomTreeNode
{
    ir::BlockId block;             ///< Invalid for the post-dominator virtual root.
    uint32_t idom = UINT32_MAX;    ///< Immediate dominator node, or kNoNode at the root.
    std::vector<uint32_t> children;
    unsigned level = 0;
    mutable unsigned dfsIn = ~0u;
    mutable unsigned dfsOut = ~0u;

    bool isLeaf() const
    {
        return children.empty();
    }
};

namespace detail
{
template <bool IsPostDom> struct SemiNCAInfo;
} // namespace detail

/// @brief Dominator tree of a region; post-dominators when @p IsPostDom.
template <bool IsPostDom> class DominatorTreeBase
{
  public:
    using NodeId = uint32_t;
    static constexpr NodeId kNoNode = UINT32_MAX;

    /// @brief Build the tree of @p region.
    /// @return The tree, or an EmptyRegion diagnostic when @p region has no blocks.
    static support::Expected<DominatorTreeBase> build(const ir::Context &ctx,
                                                      ir::RegionId region,
                                                      const support::AnalysisOptions &options = {});

    static constexpr bool isPostDominator()
    {
        return IsPostDom;
    }

    ir::RegionId region() const
    {
        return region_;
    }

    /// @brief Entry block, or the exit blocks chosen as post-dominator roots.
    const std::vector<ir::BlockId> &roots() const
    {
        return roots_;
    }

    //===------------------------------------------------------------------===//
    // Nodes
    //===------------------------------------------------------------------===//

    /// @brief Node describing @p block, or kNoNode when it is not in the tree.
    /// @details An invalid block id names the virtual root.
    NodeId nodeFor(ir::BlockId block) const;

    const DomTreeNode &node(NodeId id) const
    {
        return *nodes_[id];
    }

    NodeId rootNode() const
    {
        return rootNode_;
    }

    /// @brief Immediate dominator of @p block; invalid at the root or for the virtual root.
    ir::BlockId idom(ir::BlockId block) const;

    bool isReachableFromEntry(ir::BlockId block) const
    {
        return nodeFor(block) != kNoNode;
    }

    //===------------------------------------------------------------------===//
    // Queries
    //===------------------------------------------------------------------===//

    /// @brief True when every path from the root to @p b passes through @p a.
    /// @details Unreachable blocks are dominated by every block and dominate none.
    bool dominates(ir::BlockId a, ir::BlockId b) const;

    bool properlyDominates(ir::BlockId a, ir::BlockId b) const
    {
        return a != b && dominates(a, b);
    }

    /// @brief Deepest block dominating both @p a and @p b.
    /// @return Invalid when only the post-dominator virtual root qualifies.
    ir::BlockId findNearestCommonDominator(ir::BlockId a, ir::BlockId b) const;

    /// @brief @p root followed by every block it dominates.
    std::vector<ir::BlockId> getDescendants(ir::BlockId root) const;

    std::vector<ir::BlockId> preorder() const;
    std::vector<ir::BlockId> postorder() const;
    std::vector<ir::BlockId> reversePostorder() const;

    /// @brief Assign DFS in/out numbers so dominance queries become O(1).
    void updateDFSNumbers() const;

    bool dfsNumbersValid() const
    {
        return dfsInfoValid_;
    }

    //===------------------------------------------------------------------===//
    // Updates
    //===------------------------------------------------------------------===//

    /// @brief Rebuild the whole tree from the current CFG.
    void recalculate();

    /// @brief Account for a new CFG edge @p from -> @p to.
    void insertEdge(ir::BlockId from, ir::BlockId to);

    /// @brief Account for a removed CFG edge @p from -> @p to.
    void deleteEdge(ir::BlockId from, ir::BlockId to);

    /// @brief Add @p block to the tree as a child of @p idom.
    void addNewBlock(ir::BlockId block, ir::BlockId idom);

    void changeImmediateDominator(ir::BlockId block, ir::BlockId newIdom);

    /// @brief Update the tree after @p newBlock was inserted with a single successor.
    void splitBlock(ir::BlockId newBlock);

    /// @brief Remove leaf node @p block from the tree.
    void eraseNode(ir::BlockId block);

    //===------------------------------------------------------------------===//
    // Diagnostics
    //===------------------------------------------------------------------===//

    /// @brief Check the tree against the current CFG.
    /// @return False on the first violated property; details go to the domtree trace.
    bool verify(DomTreeVerificationLevel level = DomTreeVerificationLevel::Full) const;

    void print(std::ostream &os) const;

  private:
    friend struct detail::SemiNCAInfo<IsPostDom>;

    DominatorTreeBase(const ir::Context &ctx, ir::RegionId region, const support::AnalysisOptions &options)
        : ctx_(&ctx), region_(region), slowQueryThreshold_(options.slowQueryThreshold)
    {
    }

    static NodeId toNode(ir::BlockId block)
    {
        return block.isValid() ? block.index + 1 : 0;
    }

    static ir::BlockId toBlock(NodeId node)
    {
        return node == 0 ? ir::BlockId() : ir::BlockId(node - 1);
    }

    bool hasNode(NodeId id) const
    {
        return id < nodes_.size() && nodes_[id].has_value();
    }

    NodeId createNode(NodeId id, NodeId idom);
    void setIDom(NodeId id, NodeId newIdom);
    bool dominatesNode(NodeId a, NodeId b) const;
    NodeId findNCD(NodeId a, NodeId b) const;

    const ir::Context *ctx_;
    ir::RegionId region_;
    std::vector<ir::BlockId> roots_;
    std::vector<std::optional<DomTreeNode>> nodes_;
    NodeId rootNode_ = kNoNode;
    unsigned slowQueryThreshold_;
    mutable bool dfsInfoValid_ = false;
    mutable unsigned slowQueries_ = 0;
};

extern template class DominatorTreeBase<false>;
extern template class DominatorTreeBase<true>;

using DominatorTree = DominatorTreeBase<false>;
using PostDominatorTree = DominatorTreeBase<true>;

} // namespace strata::analysis
