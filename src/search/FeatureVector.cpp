#include "search/FeatureVector.hpp"
#include <algorithm>
#include <cmath>

namespace clausefind {

const char* backend_name(Backend b) {
    return b == Backend::Dense ? "dense" : "sparse";
}

bool FeatureVector::is_zero() const {
    for (float x : dense) if (x != 0.0f) return false;
    for (const auto& kv : sparse) if (kv.second != 0.0f) return false;
    return true;
}

static double dot_sparse(
    const std::vector<std::pair<uint32_t, float>>& a,
    const std::vector<std::pair<uint32_t, float>>& b
) {
    size_t i = 0, j = 0;
    double s = 0.0;
    while (i < a.size() && j < b.size()) {
        if (a[i].first == b[j].first) {
            s += (double)a[i].second * (double)b[j].second;
            ++i; ++j;
        } else if (a[i].first < b[j].first) {
            ++i;
        } else {
            ++j;
        }
    }
    return s;
}

double dot(const FeatureVector& a, const FeatureVector& b) {
    double s = dot_sparse(a.sparse, b.sparse);
    if (a.dense.size() == b.dense.size()) {
        for (size_t i = 0; i < a.dense.size(); ++i) s += (double)a.dense[i] * (double)b.dense[i];
    }
    return s;
}

double magnitude(const FeatureVector& v) {
    double ss = 0.0;
    for (float x : v.dense) ss += (double)x * (double)x;
    for (const auto& kv : v.sparse) ss += (double)kv.second * (double)kv.second;
    return std::sqrt(ss);
}

double cosine(const FeatureVector& a, const FeatureVector& b) {
    if (!a.dense.empty() && !b.dense.empty() && a.dense.size() != b.dense.size()) return 0.0;

    const double na = magnitude(a);
    const double nb = magnitude(b);
    if (na == 0.0 || nb == 0.0) return 0.0;

    return std::clamp(dot(a, b) / (na * nb), -1.0, 1.0);
}

}  // namespace clausefind
