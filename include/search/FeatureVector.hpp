#pragma once
#include <cstdint>
#include <utility>
#include <vector>

namespace clausefind {

enum class Backend {
    Dense,   // sentence embeddings, cosine in [-1, 1]
    Sparse,  // tf-idf, non-negative weights, cosine in [0, 1]
};

const char* backend_name(Backend b);

// One of the two representations is populated, depending on the backend that
// produced it. An all-empty vector is the zero vector.
struct FeatureVector {
    std::vector<float> dense;
    std::vector<std::pair<uint32_t, float>> sparse;  // (term_id, weight), sorted by term_id, unique

    bool is_zero() const;
};

double dot(const FeatureVector& a, const FeatureVector& b);
double magnitude(const FeatureVector& v);

// 0 for a zero vector or mismatched dense dimensions; clamped to [-1, 1]
double cosine(const FeatureVector& a, const FeatureVector& b);

}  // namespace clausefind
