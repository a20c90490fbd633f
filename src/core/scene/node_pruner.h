#pragma once

#include "../gltf/gltf_model.h"
#include <vector>

namespace I3dmPack::Core::Scene {

/**
 * Strips every node that is neither the kept node nor one of its
 * ancestors. Used to drop the rest of the scene once the instancing data
 * of a node has been extracted.
 */
class NodePruner {
public:
    using ChildLists = std::vector<std::vector<int>>;

    /**
     * Prune a node list against a node table.
     *
     * Children are pruned first; a node stays when it is keptNodeId or still
     * has children afterwards. The kept node's own subtree is left as is.
     * Child lists of visited nodes in children are replaced by their pruned
     * version. Ids outside the table count as childless.
     *
     * @param children child lists indexed by node id, updated in place
     * @param nodes list to prune (a scene's root nodes)
     * @param keptNodeId node to keep
     * @return the pruned list
     */
    static std::vector<int> prune(ChildLists& children, const std::vector<int>& nodes, int keptNodeId);

    /**
     * Prune the default scene of a model and the children of its nodes.
     * Models without a resolvable scene are left untouched.
     */
    static void pruneScene(tinygltf::Model& model, int keptNodeId);
};

}
