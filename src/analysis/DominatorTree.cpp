//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: analysis/DominatorTree.cpp
// Purpose: Semi-NCA construction, incremental edge insertion and deletion,
//          and verification of dominator and post-dominator trees.
// Key invariants: Construction numbers nodes in DFS order starting at 1;
//                 slot 0 of numToNode is a placeholder. Post-dominator walks
//                 start from a virtual root numbered 1 that all roots attach
//                 to.
// Ownership/Lifetime: SemiNCAInfo is a scratch structure living for a single
//                     construction or update.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "analysis/DominatorTree.hpp"

#include "analysis/CFG.hpp"
#include "support/trace.hpp"

#include <algorithm>
#include <cassert>
#include <queue>
#include <unordered_map>
#include <unordered_set>

using namespace strata::ir;
using strata::support::TraceTopic;

namespace strata::analysis
{
namespace detail
{

/// @brief Scratch state for Semi-NCA and the incremental update algorithms.
template <bool IsPostDom> struct SemiNCAInfo
{
    using Tree = DominatorTreeBase<IsPostDom>;
    using NodeId = typename Tree::NodeId;
    static constexpr NodeId kNone = Tree::kNoNode;

    struct InfoRec
    {
        unsigned dfsNum = 0;
        unsigned parent = 0;
        unsigned semi = 0;
        unsigned label = 0;
        NodeId idom = kNone;
        std::vector<unsigned> reverseChildren;
    };

    explicit SemiNCAInfo(const Tree &tree) : dt(tree) {}

    const Tree &dt;
    std::vector<NodeId> numToNode{kNone};
    std::unordered_map<NodeId, InfoRec> nodeToInfo;

    void clear()
    {
        numToNode = {kNone};
        nodeToInfo.clear();
    }

    bool visited(NodeId n) const
    {
        auto it = nodeToInfo.find(n);
        return it != nodeToInfo.end() && it->second.dfsNum != 0;
    }

    /// CFG neighbours of @p n, successors unless @p Inverse, in reverse
    /// order so that popping a DFS stack visits them front to back.
    template <bool Inverse> std::vector<NodeId> getChildren(NodeId n) const
    {
        std::vector<NodeId> out;
        if (n == 0)
            return out;
        const BlockId b = Tree::toBlock(n);
        std::vector<BlockId> blocks =
            Inverse ? analysis::predecessors(*dt.ctx_, b) : analysis::successors(*dt.ctx_, b);
        for (auto it = blocks.rbegin(); it != blocks.rend(); ++it)
            out.push_back(Tree::toNode(*it));
        return out;
    }

    static bool hasForwardSuccessors(const Tree &tree, BlockId b)
    {
        return !analysis::successors(*tree.ctx_, b).empty();
    }

    static bool alwaysDescend(NodeId, NodeId)
    {
        return true;
    }

    //===------------------------------------------------------------------===//
    // Construction
    //===------------------------------------------------------------------===//

    /// Depth-first walk from @p v numbering nodes after @p lastNum. Edges for
    /// which @p condition fails are recorded as reverse children but not
    /// followed. @p IsReverse walks against the tree's natural direction.
    template <bool IsReverse = false, typename DescendCondition>
    unsigned runDFS(NodeId v,
                    unsigned lastNum,
                    DescendCondition condition,
                    unsigned attachToNum,
                    const std::vector<std::size_t> *succOrder = nullptr)
    {
        std::vector<NodeId> worklist{v};
        nodeToInfo[v].parent = attachToNum;
        while (!worklist.empty())
        {
            const NodeId bb = worklist.back();
            worklist.pop_back();
            InfoRec &bbInfo = nodeToInfo[bb];
            if (bbInfo.dfsNum != 0)
                continue;
            bbInfo.dfsNum = bbInfo.semi = bbInfo.label = ++lastNum;
            numToNode.push_back(bb);

            constexpr bool direction = IsReverse != IsPostDom;
            std::vector<NodeId> succs = getChildren<direction>(bb);
            if (succOrder && succs.size() > 1)
                std::sort(succs.begin(),
                          succs.end(),
                          [succOrder](NodeId a, NodeId b) { return (*succOrder)[a] < (*succOrder)[b]; });

            for (const NodeId succ : succs)
            {
                InfoRec &succInfo = nodeToInfo[succ];
                if (succInfo.dfsNum != 0)
                {
                    if (succ != bb)
                        succInfo.reverseChildren.push_back(lastNum);
                    continue;
                }
                if (!condition(bb, succ))
                    continue;
                worklist.push_back(succ);
                succInfo.parent = lastNum;
                succInfo.reverseChildren.push_back(lastNum);
            }
        }
        return lastNum;
    }

    /// Find the label with the minimal semidominator on the path from @p v to
    /// its virtual forest root, compressing the path on the way.
    unsigned eval(unsigned v,
                  unsigned lastLinked,
                  std::vector<InfoRec *> &stack,
                  const std::vector<InfoRec *> &numToInfo)
    {
        InfoRec *vInfo = numToInfo[v];
        if (vInfo->parent < lastLinked)
            return vInfo->label;

        assert(stack.empty());
        do
        {
            stack.push_back(vInfo);
            vInfo = numToInfo[vInfo->parent];
        } while (vInfo->parent >= lastLinked);

        const InfoRec *pInfo = vInfo;
        const InfoRec *pLabelInfo = numToInfo[pInfo->label];
        do
        {
            vInfo = stack.back();
            stack.pop_back();
            vInfo->parent = pInfo->parent;
            const InfoRec *vLabelInfo = numToInfo[vInfo->label];
            if (pLabelInfo->semi < vLabelInfo->semi)
                vInfo->label = pInfo->label;
            else
                pLabelInfo = vLabelInfo;
            pInfo = vInfo;
        } while (!stack.empty());
        return vInfo->label;
    }

    void runSemiNCA()
    {
        const auto nextDFSNum = static_cast<unsigned>(numToNode.size());
        std::vector<InfoRec *> numToInfo{nullptr};
        numToInfo.reserve(nextDFSNum);

        // Immediate dominators start as spanning tree parents.
        for (unsigned i = 1; i < nextDFSNum; ++i)
        {
            InfoRec &vInfo = nodeToInfo[numToNode[i]];
            vInfo.idom = numToNode[vInfo.parent];
            numToInfo.push_back(&vInfo);
        }

        // Semidominators, in reverse preorder.
        std::vector<InfoRec *> evalStack;
        for (unsigned i = nextDFSNum - 1; i >= 2; --i)
        {
            InfoRec &wInfo = *numToInfo[i];
            wInfo.semi = wInfo.parent;
            for (unsigned n : wInfo.reverseChildren)
            {
                const unsigned semiU = numToInfo[eval(n, i + 1, evalStack, numToInfo)]->semi;
                if (semiU < wInfo.semi)
                    wInfo.semi = semiU;
            }
        }

        // idom(w) = NCA(sdom(w), parent(w)), walking up the partial tree.
        for (unsigned i = 2; i < nextDFSNum; ++i)
        {
            InfoRec &wInfo = *numToInfo[i];
            const unsigned sDomNum = numToInfo[wInfo.semi]->dfsNum;
            NodeId candidate = wInfo.idom;
            while (true)
            {
                const InfoRec &candidateInfo = nodeToInfo.find(candidate)->second;
                if (candidateInfo.dfsNum <= sDomNum)
                    break;
                candidate = candidateInfo.idom;
            }
            wInfo.idom = candidate;
        }
    }

    void addVirtualRoot()
    {
        assert(IsPostDom && "only post-dominators have a virtual root");
        assert(numToNode.size() == 1 && "the virtual root must be numbered first");
        InfoRec &info = nodeToInfo[0];
        info.dfsNum = info.semi = info.label = 1;
        numToNode.push_back(0);
    }

    template <typename DescendCondition> void doFullDFSWalk(DescendCondition condition)
    {
        if constexpr (!IsPostDom)
        {
            assert(dt.roots_.size() == 1 && "dominators have a single root");
            runDFS(Tree::toNode(dt.roots_[0]), 0, condition, 0);
        }
        else
        {
            addVirtualRoot();
            unsigned num = 1;
            for (BlockId root : dt.roots_)
                num = runDFS(Tree::toNode(root), num, condition, 1);
        }
    }

    /// Roots of the tree: the entry block, or for post-dominators every exit
    /// block plus one representative per reverse-unreachable cycle.
    static std::vector<BlockId> findRoots(const Tree &tree)
    {
        const Context &ctx = *tree.ctx_;
        if constexpr (!IsPostDom)
        {
            return {ctx.entryBlock(tree.region_)};
        }
        else
        {
            SemiNCAInfo snca(tree);
            std::vector<BlockId> roots;
            const std::vector<BlockId> &blocks = ctx.region(tree.region_).blocks;

            snca.addVirtualRoot();
            unsigned num = 1;
            unsigned total = 0;
            for (BlockId b : blocks)
            {
                ++total;
                if (!hasForwardSuccessors(tree, b))
                {
                    roots.push_back(b);
                    num = snca.runDFS(Tree::toNode(b), num, alwaysDescend, 1);
                }
            }

            if (total + 1 != num)
            {
                // Infinite loops: pick the node furthest away along forward
                // edges, ordering successors by their position in the region.
                std::vector<std::size_t> succOrder(ctx.numBlocks() + 1, blocks.size());
                for (std::size_t i = 0; i < blocks.size(); ++i)
                    succOrder[Tree::toNode(blocks[i])] = i;

                for (BlockId b : blocks)
                {
                    if (snca.visited(Tree::toNode(b)))
                        continue;
                    const unsigned newNum =
                        snca.template runDFS<true>(Tree::toNode(b), num, alwaysDescend, num, &succOrder);
                    const NodeId furthest = snca.numToNode[newNum];
                    roots.push_back(Tree::toBlock(furthest));

                    for (unsigned i = newNum; i > num; --i)
                    {
                        snca.nodeToInfo.erase(snca.numToNode[i]);
                        snca.numToNode.pop_back();
                    }
                    num = snca.runDFS(furthest, num, alwaysDescend, 1);
                }
            }

            removeRedundantRoots(tree, roots);
            return roots;
        }
    }

    /// Drop non-trivial roots from which another root is forward-reachable.
    static void removeRedundantRoots(const Tree &tree, std::vector<BlockId> &roots)
    {
        for (std::size_t i = 0; i < roots.size(); ++i)
        {
            if (!hasForwardSuccessors(tree, roots[i]))
                continue;
            SemiNCAInfo snca(tree);
            const unsigned num = snca.template runDFS<true>(Tree::toNode(roots[i]), 0, alwaysDescend, 0);
            for (unsigned x = 2; x <= num; ++x)
            {
                const BlockId n = Tree::toBlock(snca.numToNode[x]);
                if (std::find(roots.begin(), roots.end(), n) != roots.end())
                {
                    std::swap(roots[i], roots.back());
                    roots.pop_back();
                    --i;
                    break;
                }
            }
        }
    }

    NodeId getNodeForBlock(Tree &tree, NodeId n)
    {
        if (tree.hasNode(n))
            return n;
        auto it = nodeToInfo.find(n);
        assert(it != nodeToInfo.end() && "block was not reached by the walk");
        const NodeId idomNode = getNodeForBlock(tree, it->second.idom);
        return tree.createNode(n, idomNode);
    }

    void attachNewSubtree(Tree &tree, NodeId attachTo)
    {
        nodeToInfo[numToNode[1]].idom = attachTo;
        for (std::size_t i = 1; i < numToNode.size(); ++i)
        {
            const NodeId w = numToNode[i];
            if (tree.hasNode(w))
                continue;
            const NodeId idomNode = getNodeForBlock(tree, nodeToInfo[w].idom);
            tree.createNode(w, idomNode);
        }
    }

    void reattachExistingSubtree(Tree &tree, NodeId attachTo)
    {
        nodeToInfo[numToNode[1]].idom = attachTo;
        for (std::size_t i = 1; i < numToNode.size(); ++i)
        {
            const NodeId n = numToNode[i];
            assert(tree.hasNode(n));
            tree.setIDom(n, nodeToInfo[n].idom);
        }
    }

    static void calculateFromScratch(Tree &tree)
    {
        support::trace(TraceTopic::DomTree)
            << (IsPostDom ? "post-dominator" : "dominator") << " tree: full rebuild of region "
            << tree.region_.index << '\n';

        tree.nodes_.clear();
        tree.rootNode_ = Tree::kNoNode;
        tree.dfsInfoValid_ = false;
        tree.slowQueries_ = 0;
        tree.roots_ = findRoots(tree);

        SemiNCAInfo snca(tree);
        snca.doFullDFSWalk(alwaysDescend);
        snca.runSemiNCA();
        if (tree.roots_.empty())
            return;

        const NodeId root = IsPostDom ? 0 : Tree::toNode(tree.roots_[0]);
        tree.rootNode_ = tree.createNode(root, kNone);
        snca.attachNewSubtree(tree, tree.rootNode_);
    }

    //===------------------------------------------------------------------===//
    // Insertion
    //===------------------------------------------------------------------===//

    static void insertEdge(Tree &tree, NodeId from, NodeId to)
    {
        if (!tree.hasNode(from))
        {
            // Edges out of unreachable blocks do not change forward dominance.
            if constexpr (!IsPostDom)
                return;
            // The unreachable block becomes a new root under the virtual root.
            tree.createNode(from, 0);
            tree.roots_.push_back(Tree::toBlock(from));
        }

        tree.dfsInfoValid_ = false;
        if (!tree.hasNode(to))
            insertUnreachable(tree, from, to);
        else
            insertReachable(tree, from, to);
    }

    /// After insertion a root with a new successor may no longer be a root.
    static bool updateRootsBeforeInsertion(Tree &tree, NodeId to)
    {
        static_assert(IsPostDom);
        if (tree.node(to).idom != 0)
            return false;
        const BlockId b = Tree::toBlock(to);
        if (std::find(tree.roots_.begin(), tree.roots_.end(), b) == tree.roots_.end())
            return false;
        support::trace(TraceTopic::DomTree)
            << "^bb" << b.index << " is no longer a root, rebuilding\n";
        calculateFromScratch(tree);
        return true;
    }

    static void updateRootsAfterUpdate(Tree &tree)
    {
        static_assert(IsPostDom);
        const bool onlyTrivial = std::none_of(tree.roots_.begin(),
                                              tree.roots_.end(),
                                              [&tree](BlockId r) { return hasForwardSuccessors(tree, r); });
        if (onlyTrivial)
            return;
        std::vector<BlockId> roots = findRoots(tree);
        if (!std::is_permutation(tree.roots_.begin(), tree.roots_.end(), roots.begin(), roots.end()))
            calculateFromScratch(tree);
    }

    /// Depth-based search of the nodes whose idom becomes NCD(from, to).
    static void insertReachable(Tree &tree, NodeId from, NodeId to)
    {
        if constexpr (IsPostDom)
        {
            if (updateRootsBeforeInsertion(tree, to))
                return;
        }

        const NodeId ncd = (from != 0 && to != 0) ? tree.findNCD(from, to) : 0;
        assert(ncd != kNone);
        const unsigned ncdLevel = tree.node(ncd).level;
        if (ncdLevel + 1 >= tree.node(to).level)
        {
            if constexpr (IsPostDom)
                updateRootsAfterUpdate(tree);
            return;
        }

        auto deeperFirst = [&tree](NodeId a, NodeId b) { return tree.node(a).level < tree.node(b).level; };
        std::priority_queue<NodeId, std::vector<NodeId>, decltype(deeperFirst)> bucket(deeperFirst);
        std::unordered_set<NodeId> seen;
        std::vector<NodeId> affected;
        std::vector<NodeId> unaffectedOnEveryLevel;

        SemiNCAInfo snca(tree);
        bucket.push(to);
        seen.insert(to);
        while (!bucket.empty())
        {
            NodeId tn = bucket.top();
            bucket.pop();
            affected.push_back(tn);
            const unsigned currentLevel = tree.node(tn).level;

            while (true)
            {
                for (const NodeId succ : snca.template getChildren<IsPostDom>(tn))
                {
                    assert(tree.hasNode(succ) && "unreachable successor at reachable insertion");
                    const unsigned succLevel = tree.node(succ).level;
                    if (succLevel <= ncdLevel + 1 || !seen.insert(succ).second)
                        continue;
                    if (succLevel > currentLevel)
                        unaffectedOnEveryLevel.push_back(succ);
                    else
                        bucket.push(succ);
                }
                if (unaffectedOnEveryLevel.empty())
                    break;
                tn = unaffectedOnEveryLevel.back();
                unaffectedOnEveryLevel.pop_back();
            }
        }

        for (const NodeId tn : affected)
            tree.setIDom(tn, ncd);

        if constexpr (IsPostDom)
            updateRootsAfterUpdate(tree);
    }

    static void insertUnreachable(Tree &tree, NodeId from, NodeId to)
    {
        std::vector<std::pair<NodeId, NodeId>> discoveredEdgesToReachable;
        auto unreachableDescender = [&tree, &discoveredEdgesToReachable](NodeId src, NodeId dst)
        {
            if (!tree.hasNode(dst))
                return true;
            discoveredEdgesToReachable.emplace_back(src, dst);
            return false;
        };

        SemiNCAInfo snca(tree);
        snca.runDFS(to, 0, unreachableDescender, 0);
        snca.runSemiNCA();
        snca.attachNewSubtree(tree, from);

        for (const auto &[src, dst] : discoveredEdgesToReachable)
            insertReachable(tree, src, dst);
    }

    //===------------------------------------------------------------------===//
    // Deletion
    //===------------------------------------------------------------------===//

    static void deleteEdge(Tree &tree, NodeId from, NodeId to)
    {
        if (!tree.hasNode(from) || !tree.hasNode(to))
            return;

        const NodeId ncd = tree.findNCD(from, to);
        if (to != ncd)
        {
            tree.dfsInfoValid_ = false;
            const NodeId toIDom = tree.node(to).idom;
            if (from != toIDom || hasProperSupport(tree, to))
                deleteReachable(tree, from, to);
            else
                deleteUnreachable(tree, to);
        }

        if constexpr (IsPostDom)
            updateRootsAfterUpdate(tree);
    }

    /// True when some other CFG predecessor still keeps @p tn reachable.
    static bool hasProperSupport(const Tree &tree, NodeId tn)
    {
        SemiNCAInfo snca(tree);
        for (const NodeId pred : snca.template getChildren<!IsPostDom>(tn))
        {
            if (!tree.hasNode(pred))
                continue;
            if (tree.findNCD(tn, pred) != tn)
                return true;
        }
        return false;
    }

    static void deleteReachable(Tree &tree, NodeId from, NodeId to)
    {
        const NodeId toIDom = tree.findNCD(from, to);
        assert(toIDom != kNone);
        const NodeId prevIDomSubTree = tree.node(toIDom).idom;
        if (prevIDomSubTree == kNone)
        {
            calculateFromScratch(tree);
            return;
        }

        const unsigned level = tree.node(toIDom).level;
        auto descendBelow = [level, &tree](NodeId, NodeId dst)
        { return tree.hasNode(dst) && tree.node(dst).level > level; };

        SemiNCAInfo snca(tree);
        snca.runDFS(toIDom, 0, descendBelow, 0);
        snca.runSemiNCA();
        snca.reattachExistingSubtree(tree, prevIDomSubTree);
    }

    static void deleteUnreachable(Tree &tree, NodeId to)
    {
        if constexpr (IsPostDom)
        {
            // The region above @p to became reverse-unreachable; it hangs off
            // the virtual root through a new root.
            tree.roots_.push_back(Tree::toBlock(to));
            insertReachable(tree, 0, to);
            return;
        }
        else
        {
            std::vector<NodeId> affectedQueue;
            const unsigned level = tree.node(to).level;
            auto descendAndCollect = [level, &affectedQueue, &tree](NodeId, NodeId dst)
            {
                assert(tree.hasNode(dst));
                if (tree.node(dst).level > level)
                    return true;
                if (std::find(affectedQueue.begin(), affectedQueue.end(), dst) == affectedQueue.end())
                    affectedQueue.push_back(dst);
                return false;
            };

            SemiNCAInfo snca(tree);
            const unsigned lastDFSNum = snca.runDFS(to, 0, descendAndCollect, 0);

            NodeId minNode = to;
            for (const NodeId n : affectedQueue)
            {
                const NodeId ncd = tree.findNCD(n, to);
                assert(ncd != kNone);
                if (ncd != n && tree.node(ncd).level < tree.node(minNode).level)
                    minNode = ncd;
            }

            if (tree.node(minNode).idom == kNone)
            {
                calculateFromScratch(tree);
                return;
            }

            // Children precede their parents in reverse preorder.
            for (unsigned i = lastDFSNum; i > 0; --i)
                eraseLeaf(tree, snca.numToNode[i]);

            if (minNode == to)
                return;

            const unsigned minLevel = tree.node(minNode).level;
            const NodeId prevIDom = tree.node(minNode).idom;
            snca.clear();
            auto descendBelow = [minLevel, &tree](NodeId, NodeId dst)
            { return tree.hasNode(dst) && tree.node(dst).level > minLevel; };
            snca.runDFS(minNode, 0, descendBelow, 0);
            snca.runSemiNCA();
            snca.reattachExistingSubtree(tree, prevIDom);
        }
    }

    static void eraseLeaf(Tree &tree, NodeId tn)
    {
        const DomTreeNode &n = tree.node(tn);
        assert(n.isLeaf() && "not a tree leaf");
        assert(n.idom != kNone);
        std::vector<NodeId> &siblings = tree.nodes_[n.idom]->children;
        auto it = std::find(siblings.begin(), siblings.end(), tn);
        assert(it != siblings.end());
        std::swap(*it, siblings.back());
        siblings.pop_back();
        tree.nodes_[tn].reset();
    }

    //===------------------------------------------------------------------===//
    // Verification
    //===------------------------------------------------------------------===//

    static std::ostream &report()
    {
        return support::trace(TraceTopic::DomTree);
    }

    bool verifyRoots() const
    {
        if constexpr (!IsPostDom)
        {
            if (dt.roots_.empty())
            {
                report() << "tree has no root\n";
                return false;
            }
            if (dt.roots_[0] != dt.ctx_->entryBlock(dt.region_))
            {
                report() << "tree root is not the region entry\n";
                return false;
            }
        }
        std::vector<BlockId> computed = findRoots(dt);
        if (!std::is_permutation(dt.roots_.begin(), dt.roots_.end(), computed.begin(), computed.end()))
        {
            report() << "tree roots differ from the roots of a fresh walk\n";
            return false;
        }
        return true;
    }

    bool verifyReachability()
    {
        clear();
        doFullDFSWalk(alwaysDescend);

        for (NodeId n = 0; n < dt.nodes_.size(); ++n)
        {
            if (!dt.hasNode(n) || (IsPostDom && n == 0))
                continue;
            if (!visited(n))
            {
                report() << "tree node ^bb" << Tree::toBlock(n).index << " not found by a CFG walk\n";
                return false;
            }
        }
        for (std::size_t i = 1; i < numToNode.size(); ++i)
        {
            const NodeId n = numToNode[i];
            if (n != 0 && !dt.hasNode(n))
            {
                report() << "CFG block ^bb" << Tree::toBlock(n).index << " missing from the tree\n";
                return false;
            }
        }
        return true;
    }

    bool verifyLevels() const
    {
        for (NodeId n = 0; n < dt.nodes_.size(); ++n)
        {
            if (!dt.hasNode(n))
                continue;
            const DomTreeNode &tn = dt.node(n);
            if (tn.idom == kNone && tn.level != 0)
            {
                report() << "node without an idom has a nonzero level\n";
                return false;
            }
            if (tn.idom != kNone && tn.level != dt.node(tn.idom).level + 1)
            {
                report() << "node ^bb" << tn.block.index << " has an inconsistent level\n";
                return false;
            }
        }
        return true;
    }

    bool verifyDFSNumbers() const
    {
        if (!dt.dfsInfoValid_)
            return true;
        if (dt.node(dt.rootNode_).dfsIn != 0)
        {
            report() << "DFS numbering does not start at the root\n";
            return false;
        }
        for (NodeId n = 0; n < dt.nodes_.size(); ++n)
        {
            if (!dt.hasNode(n))
                continue;
            const DomTreeNode &tn = dt.node(n);
            if (tn.isLeaf())
            {
                if (tn.dfsIn + 1 != tn.dfsOut)
                {
                    report() << "leaf DFS numbers are not adjacent\n";
                    return false;
                }
                continue;
            }
            std::vector<NodeId> children = tn.children;
            std::sort(children.begin(),
                      children.end(),
                      [this](NodeId a, NodeId b) { return dt.node(a).dfsIn < dt.node(b).dfsIn; });
            if (dt.node(children.front()).dfsIn != tn.dfsIn + 1 ||
                dt.node(children.back()).dfsOut + 1 != tn.dfsOut)
            {
                report() << "children do not cover their parent's DFS interval\n";
                return false;
            }
            for (std::size_t i = 0; i + 1 < children.size(); ++i)
            {
                if (dt.node(children[i]).dfsOut + 1 != dt.node(children[i + 1]).dfsIn)
                {
                    report() << "gap between sibling DFS intervals\n";
                    return false;
                }
            }
        }
        return true;
    }

    /// Removing a node from the CFG must make all its tree children unreachable.
    bool verifyParentProperty()
    {
        for (NodeId n = 0; n < dt.nodes_.size(); ++n)
        {
            if (!dt.hasNode(n) || n == 0 || dt.node(n).isLeaf())
                continue;
            clear();
            doFullDFSWalk([n](NodeId src, NodeId dst) { return src != n && dst != n; });
            for (const NodeId child : dt.node(n).children)
            {
                if (visited(child))
                {
                    report() << "child ^bb" << Tree::toBlock(child).index
                             << " reachable after its parent ^bb" << Tree::toBlock(n).index
                             << " is removed\n";
                    return false;
                }
            }
        }
        return true;
    }

    /// Removing a node from the CFG must leave its tree siblings reachable.
    bool verifySiblingProperty()
    {
        for (NodeId n = 0; n < dt.nodes_.size(); ++n)
        {
            if (!dt.hasNode(n) || n == 0 || dt.node(n).isLeaf())
                continue;
            for (const NodeId child : dt.node(n).children)
            {
                clear();
                doFullDFSWalk([child](NodeId src, NodeId dst) { return src != child && dst != child; });
                for (const NodeId sibling : dt.node(n).children)
                {
                    if (sibling == child)
                        continue;
                    if (!visited(sibling))
                    {
                        report() << "^bb" << Tree::toBlock(sibling).index
                                 << " unreachable when its sibling ^bb" << Tree::toBlock(child).index
                                 << " is removed\n";
                        return false;
                    }
                }
            }
        }
        return true;
    }

    bool isSameAsFreshTree() const
    {
        Tree fresh(*dt.ctx_, dt.region_, support::AnalysisOptions{});
        calculateFromScratch(fresh);

        if (!std::is_permutation(dt.roots_.begin(), dt.roots_.end(), fresh.roots_.begin(), fresh.roots_.end()))
        {
            report() << "roots differ from a freshly built tree\n";
            return false;
        }

        const std::size_t limit = std::max(dt.nodes_.size(), fresh.nodes_.size());
        for (NodeId n = 0; n < limit; ++n)
        {
            const bool mine = dt.hasNode(n);
            const bool theirs = fresh.hasNode(n);
            if (mine != theirs)
            {
                report() << "^bb" << Tree::toBlock(n).index << " presence differs from a fresh tree\n";
                return false;
            }
            if (!mine)
                continue;

            const DomTreeNode &a = dt.node(n);
            const DomTreeNode &b = fresh.node(n);
            if (a.level != b.level || a.children.size() != b.children.size() ||
                !std::is_permutation(a.children.begin(), a.children.end(), b.children.begin()))
            {
                report() << "^bb" << Tree::toBlock(n).index << " differs from a fresh tree\n";
                return false;
            }
        }
        return true;
    }
};

} // namespace detail

//===----------------------------------------------------------------------===//
// DominatorTreeBase
//===----------------------------------------------------------------------===//

template <bool IsPostDom>
support::Expected<DominatorTreeBase<IsPostDom>> DominatorTreeBase<IsPostDom>::build(
    const Context &ctx, RegionId region, const support::AnalysisOptions &options)
{
    if (ctx.region(region).blocks.empty())
        return support::makeError({},
                                  "cannot build a dominator tree for an empty region",
                                  support::ErrorCode::EmptyRegion);
    DominatorTreeBase tree(ctx, region, options);
    tree.recalculate();
    return std::move(tree);
}

template <bool IsPostDom> void DominatorTreeBase<IsPostDom>::recalculate()
{
    detail::SemiNCAInfo<IsPostDom>::calculateFromScratch(*this);
}

template <bool IsPostDom>
typename DominatorTreeBase<IsPostDom>::NodeId DominatorTreeBase<IsPostDom>::nodeFor(BlockId block) const
{
    const NodeId n = toNode(block);
    return hasNode(n) ? n : kNoNode;
}

template <bool IsPostDom> BlockId DominatorTreeBase<IsPostDom>::idom(BlockId block) const
{
    const NodeId n = nodeFor(block);
    if (n == kNoNode || nodes_[n]->idom == kNoNode)
        return BlockId();
    return nodes_[nodes_[n]->idom]->block;
}

template <bool IsPostDom>
typename DominatorTreeBase<IsPostDom>::NodeId DominatorTreeBase<IsPostDom>::createNode(NodeId id, NodeId idom)
{
    if (nodes_.size() <= id)
        nodes_.resize(id + 1);
    assert(!nodes_[id] && "node already exists");

    DomTreeNode node;
    node.block = toBlock(id);
    node.idom = idom;
    if (idom != kNoNode)
    {
        node.level = nodes_[idom]->level + 1;
        nodes_[idom]->children.push_back(id);
    }
    nodes_[id] = std::move(node);
    dfsInfoValid_ = false;
    return id;
}

template <bool IsPostDom> void DominatorTreeBase<IsPostDom>::setIDom(NodeId id, NodeId newIdom)
{
    DomTreeNode &node = *nodes_[id];
    assert(node.idom != kNoNode && "no immediate dominator");
    if (node.idom == newIdom)
        return;

    std::vector<NodeId> &siblings = nodes_[node.idom]->children;
    auto it = std::find(siblings.begin(), siblings.end(), id);
    assert(it != siblings.end() && "not in the immediate dominator's children");
    siblings.erase(it);

    node.idom = newIdom;
    nodes_[newIdom]->children.push_back(id);

    if (node.level == nodes_[newIdom]->level + 1)
        return;
    std::vector<NodeId> workStack{id};
    while (!workStack.empty())
    {
        DomTreeNode &cur = *nodes_[workStack.back()];
        workStack.pop_back();
        cur.level = nodes_[cur.idom]->level + 1;
        for (NodeId c : cur.children)
            if (nodes_[c]->level != cur.level + 1)
                workStack.push_back(c);
    }
}

template <bool IsPostDom>
typename DominatorTreeBase<IsPostDom>::NodeId DominatorTreeBase<IsPostDom>::findNCD(NodeId a, NodeId b) const
{
    assert(a != kNoNode && b != kNoNode && "blocks must be in the tree");
    while (a != b)
    {
        if (nodes_[a]->level < nodes_[b]->level)
            std::swap(a, b);
        a = nodes_[a]->idom;
        if (a == kNoNode)
            return kNoNode;
    }
    return a;
}

template <bool IsPostDom> bool DominatorTreeBase<IsPostDom>::dominatesNode(NodeId a, NodeId b) const
{
    if (a == b)
        return true;
    if (b == kNoNode)
        return true;
    if (a == kNoNode)
        return false;

    const DomTreeNode &na = *nodes_[a];
    const DomTreeNode &nb = *nodes_[b];
    if (nb.idom == a)
        return true;
    if (na.idom == b)
        return false;
    if (na.level >= nb.level)
        return false;

    auto dominatedBy = [&] { return nb.dfsIn >= na.dfsIn && nb.dfsOut <= na.dfsOut; };
    if (dfsInfoValid_)
        return dominatedBy();

    if (++slowQueries_ > slowQueryThreshold_)
    {
        updateDFSNumbers();
        return dominatedBy();
    }

    NodeId cur = b;
    while (cur != kNoNode && nodes_[cur]->level > na.level)
        cur = nodes_[cur]->idom;
    return cur == a;
}

template <bool IsPostDom> bool DominatorTreeBase<IsPostDom>::dominates(BlockId a, BlockId b) const
{
    if (a == b)
        return true;
    return dominatesNode(nodeFor(a), nodeFor(b));
}

template <bool IsPostDom>
BlockId DominatorTreeBase<IsPostDom>::findNearestCommonDominator(BlockId a, BlockId b) const
{
    if constexpr (!IsPostDom)
    {
        const BlockId entry = ctx_->entryBlock(region_);
        if (a == entry || b == entry)
            return entry;
    }
    const NodeId n = findNCD(nodeFor(a), nodeFor(b));
    return n == kNoNode ? BlockId() : nodes_[n]->block;
}

template <bool IsPostDom>
std::vector<BlockId> DominatorTreeBase<IsPostDom>::getDescendants(BlockId root) const
{
    std::vector<BlockId> result;
    const NodeId start = nodeFor(root);
    if (start == kNoNode)
        return result;
    std::vector<NodeId> worklist{start};
    while (!worklist.empty())
    {
        const DomTreeNode &n = *nodes_[worklist.back()];
        worklist.pop_back();
        if (n.block.isValid())
            result.push_back(n.block);
        worklist.insert(worklist.end(), n.children.rbegin(), n.children.rend());
    }
    return result;
}

template <bool IsPostDom> std::vector<BlockId> DominatorTreeBase<IsPostDom>::preorder() const
{
    if (rootNode_ == kNoNode)
        return {};
    return getDescendants(nodes_[rootNode_]->block);
}

template <bool IsPostDom> std::vector<BlockId> DominatorTreeBase<IsPostDom>::postorder() const
{
    std::vector<BlockId> result;
    if (rootNode_ == kNoNode)
        return result;
    std::vector<std::pair<NodeId, std::size_t>> stack{{rootNode_, 0}};
    while (!stack.empty())
    {
        auto &[n, next] = stack.back();
        const DomTreeNode &node = *nodes_[n];
        if (next < node.children.size())
        {
            const NodeId child = node.children[next++];
            stack.emplace_back(child, 0);
            continue;
        }
        if (node.block.isValid())
            result.push_back(node.block);
        stack.pop_back();
    }
    return result;
}

template <bool IsPostDom> std::vector<BlockId> DominatorTreeBase<IsPostDom>::reversePostorder() const
{
    std::vector<BlockId> po = postorder();
    return std::vector<BlockId>(po.rbegin(), po.rend());
}

template <bool IsPostDom> void DominatorTreeBase<IsPostDom>::updateDFSNumbers() const
{
    if (dfsInfoValid_)
    {
        slowQueries_ = 0;
        return;
    }
    if (rootNode_ == kNoNode)
        return;

    std::vector<std::pair<NodeId, std::size_t>> workStack{{rootNode_, 0}};
    unsigned dfsNum = 0;
    nodes_[rootNode_]->dfsIn = dfsNum++;
    while (!workStack.empty())
    {
        auto &[n, next] = workStack.back();
        const DomTreeNode &node = *nodes_[n];
        if (next == node.children.size())
        {
            node.dfsOut = dfsNum++;
            workStack.pop_back();
            continue;
        }
        const NodeId child = node.children[next++];
        nodes_[child]->dfsIn = dfsNum++;
        workStack.emplace_back(child, 0);
    }

    slowQueries_ = 0;
    dfsInfoValid_ = true;
}

template <bool IsPostDom> void DominatorTreeBase<IsPostDom>::insertEdge(BlockId from, BlockId to)
{
    if constexpr (IsPostDom)
        std::swap(from, to);
    support::trace(TraceTopic::DomTree) << "insert edge ^bb" << from.index << " -> ^bb" << to.index << '\n';
    detail::SemiNCAInfo<IsPostDom>::insertEdge(*this, toNode(from), toNode(to));
}

template <bool IsPostDom> void DominatorTreeBase<IsPostDom>::deleteEdge(BlockId from, BlockId to)
{
    if constexpr (IsPostDom)
        std::swap(from, to);
    support::trace(TraceTopic::DomTree) << "delete edge ^bb" << from.index << " -> ^bb" << to.index << '\n';
    detail::SemiNCAInfo<IsPostDom>::deleteEdge(*this, toNode(from), toNode(to));
}

template <bool IsPostDom> void DominatorTreeBase<IsPostDom>::addNewBlock(BlockId block, BlockId idom)
{
    assert(nodeFor(block) == kNoNode && "block already in the tree");
    const NodeId parent = nodeFor(idom);
    assert(parent != kNoNode && "immediate dominator is not in the tree");
    createNode(toNode(block), parent);
}

template <bool IsPostDom>
void DominatorTreeBase<IsPostDom>::changeImmediateDominator(BlockId block, BlockId newIdom)
{
    const NodeId n = nodeFor(block);
    const NodeId parent = nodeFor(newIdom);
    assert(n != kNoNode && parent != kNoNode && "blocks must be in the tree");
    dfsInfoValid_ = false;
    setIDom(n, parent);
}

template <bool IsPostDom> void DominatorTreeBase<IsPostDom>::splitBlock(BlockId newBlock)
{
    auto forward = [this](BlockId b) { return IsPostDom ? predecessors(*ctx_, b) : successors(*ctx_, b); };
    auto inverse = [this](BlockId b) { return IsPostDom ? successors(*ctx_, b) : predecessors(*ctx_, b); };

    const std::vector<BlockId> succs = forward(newBlock);
    assert(succs.size() == 1 && "split block must have a single successor");
    const BlockId succ = succs.front();
    const std::vector<BlockId> predBlocks = inverse(newBlock);
    assert(!predBlocks.empty() && "split block has no predecessors");

    bool newDominatesSucc = true;
    for (BlockId pred : inverse(succ))
    {
        if (pred != newBlock && !dominates(succ, pred) && isReachableFromEntry(pred))
        {
            newDominatesSucc = false;
            break;
        }
    }

    std::size_t i = 0;
    BlockId newIdom;
    bool found = false;
    for (; i < predBlocks.size(); ++i)
    {
        if (isReachableFromEntry(predBlocks[i]))
        {
            newIdom = predBlocks[i];
            found = true;
            break;
        }
    }
    // No reachable predecessor: the new block is unreachable as well.
    if (!found)
        return;

    for (++i; i < predBlocks.size(); ++i)
        if (isReachableFromEntry(predBlocks[i]))
            newIdom = findNearestCommonDominator(newIdom, predBlocks[i]);

    addNewBlock(newBlock, newIdom);
    if (newDominatesSucc)
        changeImmediateDominator(succ, newBlock);
}

template <bool IsPostDom> void DominatorTreeBase<IsPostDom>::eraseNode(BlockId block)
{
    const NodeId n = nodeFor(block);
    assert(n != kNoNode && "removing a block that is not in the tree");
    assert(nodes_[n]->isLeaf() && "removing a node that is not a leaf");
    dfsInfoValid_ = false;

    const NodeId parent = nodes_[n]->idom;
    if (parent != kNoNode)
    {
        std::vector<NodeId> &siblings = nodes_[parent]->children;
        siblings.erase(std::find(siblings.begin(), siblings.end(), n));
    }
    nodes_[n].reset();

    if constexpr (IsPostDom)
    {
        auto it = std::find(roots_.begin(), roots_.end(), block);
        if (it != roots_.end())
        {
            std::swap(*it, roots_.back());
            roots_.pop_back();
        }
    }
}

template <bool IsPostDom> bool DominatorTreeBase<IsPostDom>::verify(DomTreeVerificationLevel level) const
{
    detail::SemiNCAInfo<IsPostDom> snca(*this);
    if (!snca.isSameAsFreshTree())
        return false;
    if (!snca.verifyRoots() || !snca.verifyReachability() || !snca.verifyLevels() || !snca.verifyDFSNumbers())
        return false;
    if (level != DomTreeVerificationLevel::Fast && !snca.verifyParentProperty())
        return false;
    if (level == DomTreeVerificationLevel::Full && !snca.verifySiblingProperty())
        return false;
    return true;
}

template <bool IsPostDom> void DominatorTreeBase<IsPostDom>::print(std::ostream &os) const
{
    os << (IsPostDom ? "Inorder PostDominator Tree: " : "Inorder Dominator Tree: ");
    if (!dfsInfoValid_)
        os << "DFSNumbers invalid: " << slowQueries_ << " slow queries.";
    os << '\n';
    if (rootNode_ == kNoNode)
        return;

    std::vector<NodeId> stack{rootNode_};
    while (!stack.empty())
    {
        const DomTreeNode &n = *nodes_[stack.back()];
        stack.pop_back();
        os << std::string(2 * n.level, ' ') << '[' << n.level << "] ";
        if (n.block.isValid())
            os << "^bb" << n.block.index;
        else
            os << "<<exit node>>";
        os << " {" << static_cast<int>(n.dfsIn) << ',' << static_cast<int>(n.dfsOut) << "}\n";
        stack.insert(stack.end(), n.children.rbegin(), n.children.rend());
    }
}

template class DominatorTreeBase<false>;
template class DominatorTreeBase<true>;

} // namespace strata::analysis
