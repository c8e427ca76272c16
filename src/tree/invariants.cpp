#include <sapling/tree/invariants.h>

#include <algorithm>
#include <functional>
#include <map>
#include <sstream>
#include <utility>

namespace sapling::tree {

namespace {

using Check = std::function<bool(const Forest&, std::string& detail)>;

bool check_parallel_length(const Forest& forest, std::string& detail) {
    std::size_t nodes = forest.nodes().size();
    std::size_t children = forest.child_lists().size();
    std::size_t parents = forest.parent_lists().size();
    if (nodes == children && nodes == parents) return true;

    std::ostringstream oss;
    oss << "nodes=" << nodes << " children=" << children << " parents=" << parents;
    detail = oss.str();
    return false;
}

bool check_ids_in_range(const Forest& forest, std::string& detail) {
    std::size_t n = forest.nodes().size();
    auto scan = [&](const std::vector<std::vector<NodeId>>& lists, const char* what) {
        for (std::size_t id = 0; id < lists.size(); ++id) {
            for (NodeId other : lists[id]) {
                if (other >= n) {
                    std::ostringstream oss;
                    oss << what << " of " << id << " contains " << other
                        << " (size " << n << ")";
                    detail = oss.str();
                    return false;
                }
            }
        }
        return true;
    };
    return scan(forest.child_lists(), "children") && scan(forest.parent_lists(), "parents");
}

bool check_symmetry(const Forest& forest, std::string& detail) {
    // (parent, child) -> multiplicity, counted from each side.
    std::map<std::pair<NodeId, NodeId>, long> edges;
    const auto& children = forest.child_lists();
    const auto& parents = forest.parent_lists();
    for (NodeId p = 0; p < children.size(); ++p) {
        for (NodeId c : children[p]) ++edges[{p, c}];
    }
    for (NodeId c = 0; c < parents.size(); ++c) {
        for (NodeId p : parents[c]) --edges[{p, c}];
    }
    for (const auto& [edge, balance] : edges) {
        if (balance != 0) {
            std::ostringstream oss;
            oss << "edge " << edge.first << " -> " << edge.second << " is "
                << (balance > 0 ? "missing from the child's parents"
                                : "missing from the parent's children");
            detail = oss.str();
            return false;
        }
    }
    return true;
}

bool check_cache_clean(const Forest& forest, std::string& detail) {
    const auto& nodes = forest.nodes();
    for (NodeId id = 0; id < nodes.size(); ++id) {
        const NodeData& n = nodes[id];
        if (n.is_dirty && (n.main_size_layout_cache || n.other_layout_cache)) {
            detail = "node " + std::to_string(id) + " is dirty but holds a cache";
            return false;
        }
    }
    return true;
}

} // namespace

bool InvariantReport::all_passed() const {
    if (results.empty()) return false;
    return std::all_of(results.begin(), results.end(),
                       [](const InvariantResult& r) { return r.passed; });
}

std::size_t InvariantReport::pass_count() const {
    return static_cast<std::size_t>(std::count_if(
        results.begin(), results.end(), [](const InvariantResult& r) { return r.passed; }));
}

std::size_t InvariantReport::fail_count() const {
    return results.size() - pass_count();
}

const InvariantResult* InvariantReport::find(const std::string& name) const {
    for (const auto& r : results) {
        if (r.name == name) return &r;
    }
    return nullptr;
}

std::string InvariantReport::format_report() const {
    std::ostringstream oss;
    oss << "Forest invariants: " << pass_count() << "/" << results.size() << " passed\n";
    for (const auto& r : results) {
        oss << "  [" << (r.passed ? "PASS" : "FAIL") << "] " << r.name;
        if (!r.detail.empty()) {
            oss << ": " << r.detail;
        }
        oss << "\n";
    }
    return oss.str();
}

InvariantReport check_forest_invariants(const Forest& forest) {
    static const std::vector<std::pair<const char*, Check>> checks = {
        {"parallel-length", check_parallel_length},
        {"ids-in-range", check_ids_in_range},
        {"symmetry", check_symmetry},
        {"cache-clean", check_cache_clean},
    };

    InvariantReport report;
    for (const auto& [name, check] : checks) {
        InvariantResult r;
        r.name = name;
        r.passed = check(forest, r.detail);
        report.results.push_back(std::move(r));
    }
    return report;
}

} // namespace sapling::tree
