#include "similarity.hpp"
#include "util.hpp"
#include <set>

namespace memora {

double jaccard_similarity(const std::string& a, const std::string& b) {
    auto wa = tokenize(a);
    auto wb = tokenize(b);
    std::set<std::string> sa(wa.begin(), wa.end());
    std::set<std::string> sb(wb.begin(), wb.end());

    if (sa.empty() && sb.empty()) return 1.0;

    size_t common = 0;
    for (const auto& w : sa) {
        if (sb.count(w)) common++;
    }
    size_t total = sa.size() + sb.size() - common;
    return static_cast<double>(common) / static_cast<double>(total);
}

bool TokenJaccard::is_duplicate(const Memory& a, const Memory& b) const {
    return jaccard_similarity(a.content, b.content) >= threshold_;
}

} // namespace memora
