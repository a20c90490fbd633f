#include "node_pruner.h"
#include "../gltf/asset_validator.h"

namespace I3dmPack::Core::Scene {

namespace {

std::vector<int> pruneList(NodePruner::ChildLists& children, const std::vector<int>& nodes,
                           int keptNodeId, std::vector<bool>& visiting) {
    std::vector<int> kept;
    kept.reserve(nodes.size());
    for (int nodeId : nodes) {
        if (nodeId == keptNodeId) {
            kept.push_back(nodeId);
            continue;
        }
        if (nodeId < 0 || nodeId >= static_cast<int>(children.size()) || visiting[nodeId]) {
            continue;
        }

        visiting[nodeId] = true;
        std::vector<int> remaining = pruneList(children, children[nodeId], keptNodeId, visiting);
        visiting[nodeId] = false;

        children[nodeId] = remaining;
        if (!remaining.empty()) {
            kept.push_back(nodeId);
        }
    }
    return kept;
}

}

std::vector<int> NodePruner::prune(ChildLists& children, const std::vector<int>& nodes, int keptNodeId) {
    std::vector<bool> visiting(children.size(), false);
    return pruneList(children, nodes, keptNodeId, visiting);
}

void NodePruner::pruneScene(tinygltf::Model& model, int keptNodeId) {
    int sceneId = Gltf::AssetValidator::resolveScene(model);
    if (sceneId < 0) {
        return;
    }

    ChildLists children;
    children.reserve(model.nodes.size());
    for (const auto& node : model.nodes) {
        children.push_back(node.children);
    }

    tinygltf::Scene& scene = model.scenes[sceneId];
    scene.nodes = prune(children, scene.nodes, keptNodeId);

    for (size_t i = 0; i < model.nodes.size(); ++i) {
        model.nodes[i].children = children[i];
    }
}

}
