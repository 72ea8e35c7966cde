#include "kiln/graph.hpp"

#include <algorithm>
#include <format>
#include <functional>

namespace kiln {

namespace {

void drop_from_index(Index &index, const std::string &file_path, const CanonicalId &id) {
    auto bucket = index.find(file_path);
    if (bucket == index.end())
        return;
    bucket->second.erase(id);
    if (bucket->second.empty())
        index.erase(bucket);
}

} // namespace

void apply_patch(Graph &graph, Index &index, const GraphPatch &patch) {
    for (const auto &file_path : patch.removed_modules) {
        if (auto bucket = index.find(file_path); bucket != index.end()) {
            for (const auto &id : bucket->second)
                graph.erase(id);
            index.erase(bucket);
        }
        // Nodes whose index entry went missing still belong to the module.
        std::erase_if(graph, [&](const auto &entry) { return entry.second.file_path == file_path; });
    }

    for (const auto &id : patch.removed_nodes) {
        auto it = graph.find(id);
        if (it == graph.end())
            continue;
        drop_from_index(index, it->second.file_path, id);
        graph.erase(it);
    }

    for (const auto &node : patch.upsert_nodes) {
        if (auto it = graph.find(node.id); it != graph.end() && it->second.file_path != node.file_path)
            drop_from_index(index, it->second.file_path, node.id);
        graph.insert_or_assign(node.id, node);
        index[node.file_path].insert(node.id);
    }
}

Index rebuild_index(const Graph &graph) {
    Index index;
    for (const auto &[id, node] : graph)
        index[node.file_path].insert(id);
    return index;
}

Result<void> check_index(const Graph &graph, const Index &index) {
    for (const auto &[id, node] : graph) {
        auto bucket = index.find(node.file_path);
        if (bucket == index.end() || !bucket->second.contains(id))
            return std::unexpected(std::format("node {} is missing from the index of {}", id, node.file_path));
    }
    for (const auto &[file_path, ids] : index) {
        if (ids.empty())
            return std::unexpected(std::format("empty index bucket for {}", file_path));
        for (const auto &id : ids) {
            auto it = graph.find(id);
            if (it == graph.end())
                return std::unexpected(std::format("index of {} names unknown node {}", file_path, id));
            if (it->second.file_path != file_path)
                return std::unexpected(
                    std::format("index of {} names {} which belongs to {}", file_path, id, it->second.file_path));
        }
    }
    return {};
}

std::optional<std::vector<CanonicalId>> find_cycle(const Graph &graph) {
    enum class STATUS : uint8_t { UNSTARTED, WORKING, FINISHED };

    std::map<CanonicalId, STATUS> status;
    std::vector<CanonicalId> stack;
    std::optional<std::vector<CanonicalId>> cycle;

    std::function<bool(const GraphNode &)> dfs = [&](const GraphNode &u) -> bool {
        status[u.id] = STATUS::WORKING;
        stack.push_back(u.id);
        for (const auto &dep : u.dependencies) {
            auto v = graph.find(dep);
            if (v == graph.end())
                continue;
            STATUS s = status.contains(dep) ? status[dep] : STATUS::UNSTARTED;
            if (s == STATUS::UNSTARTED) {
                if (dfs(v->second))
                    return true;
            } else if (s == STATUS::WORKING) {
                auto start = std::find(stack.begin(), stack.end(), dep);
                cycle = std::vector<CanonicalId>(start, stack.end());
                cycle->push_back(dep);
                return true;
            }
        }
        status[u.id] = STATUS::FINISHED;
        stack.pop_back();
        return false;
    };

    for (const auto &[id, node] : graph) {
        if (!status.contains(id) && dfs(node))
            return cycle;
    }
    return std::nullopt;
}

Result<std::vector<CanonicalId>> topo_sort(const Graph &graph) {
    if (auto cycle = find_cycle(graph))
        return std::unexpected(std::format("Cycle detected in the dependency graph at: {}", cycle->front()));

    std::set<CanonicalId> done;
    std::vector<CanonicalId> order;
    order.reserve(graph.size());

    std::function<void(const GraphNode &)> visit = [&](const GraphNode &u) {
        done.insert(u.id);
        for (const auto &dep : u.dependencies) {
            if (auto v = graph.find(dep); v != graph.end() && !done.contains(dep))
                visit(v->second);
        }
        order.push_back(u.id);
    };

    for (const auto &[id, node] : graph) {
        if (!done.contains(id))
            visit(node);
    }
    return order;
}

} // namespace kiln
