#pragma once
#include <sapling/tree/forest.h>

#include <cstddef>
#include <string>
#include <vector>

namespace sapling::tree {

struct InvariantResult {
    std::string name;
    bool passed = false;
    std::string detail;
};

struct InvariantReport {
    std::vector<InvariantResult> results;

    bool all_passed() const;
    std::size_t pass_count() const;
    std::size_t fail_count() const;
    const InvariantResult* find(const std::string& name) const;
    std::string format_report() const;
};

// Structural checks over a forest:
//   "parallel-length"  node, children and parents sequences agree in length
//   "ids-in-range"     every adjacency entry names a live node
//   "symmetry"         edge multiplicities match in both directions
//   "cache-clean"      no dirty node holds a cache
InvariantReport check_forest_invariants(const Forest& forest);

} // namespace sapling::tree
