#pragma once
#include "memory.hpp"
#include <string>
#include <vector>
#include <utility>

namespace memora {

// Decides whether two memories say the same thing.
class SimilarityCheck {
public:
    virtual ~SimilarityCheck() = default;

    virtual bool is_duplicate(const Memory& a, const Memory& b) const = 0;
};

// Jaccard similarity of the lowercase word sets, duplicate at or above
// the threshold. Two memories with no words at all are duplicates.
class TokenJaccard : public SimilarityCheck {
public:
    explicit TokenJaccard(double threshold = 0.9) : threshold_(threshold) {}

    bool is_duplicate(const Memory& a, const Memory& b) const override;

    double threshold() const { return threshold_; }

private:
    double threshold_;
};

double jaccard_similarity(const std::string& a, const std::string& b);

// Finds memories that contradict each other. What to do with a flagged
// pair is not decided here: consolidation logs and reports them.
class ConflictDetector {
public:
    virtual ~ConflictDetector() = default;

    // Index pairs into memories, each pair (i, j) with i < j.
    virtual std::vector<std::pair<size_t, size_t>> find_conflicts(
        const std::vector<Memory>& memories) const = 0;
};

struct ConsolidationReport {
    size_t examined = 0;
    size_t duplicates_removed = 0;
    size_t pruned = 0;
    std::vector<std::pair<std::string, std::string>> conflicts;  // memory id pairs
    size_t failures = 0;
};

} // namespace memora
