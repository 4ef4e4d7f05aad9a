#include "geometry.hpp"

#include "seqbatch.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>


//------------------------------------------------------------------------------
// GeometryFeaturizer

void ReplaceNonFinite(std::vector<float>& values)
{
    for (float& value : values) {
        if (!std::isfinite(value)) {
            value = 0.f;
        }
    }
}


//------------------------------------------------------------------------------
// ResidueGeometry

void ResidueGeometry::NodeFeatures(
    const StructureRecord& structure,
    std::vector<float>& nodes_out) const
{
    const uint32_t L = structure.Length;
    nodes_out.assign(static_cast<size_t>(L) * kNodeFeatures, 0.f);

    auto at = [L](const std::vector<float>& map, uint32_t row, uint32_t col) {
        return map[static_cast<size_t>(row) * L + col];
    };

    for (uint32_t i = 0; i < L; ++i) {
        float* node = nodes_out.data() + static_cast<size_t>(i) * kNodeFeatures;

        if (i > 0) {
            node[0] = at(structure.Omega, i - 1, i);
            node[1] = at(structure.Theta, i - 1, i);
            node[2] = at(structure.Theta, i, i - 1);
            node[3] = at(structure.Phi, i - 1, i);
            node[4] = at(structure.Phi, i, i - 1);
        }
        if (i + 1 < L) {
            node[5] = at(structure.Omega, i, i + 1);
            node[6] = at(structure.Theta, i, i + 1);
            node[7] = at(structure.Theta, i + 1, i);
            node[8] = at(structure.Phi, i, i + 1);
            node[9] = at(structure.Phi, i + 1, i);
        }
    }

    ReplaceNonFinite(nodes_out);
}

uint32_t ResidueGeometry::Neighbors(
    const StructureRecord& structure,
    uint32_t k,
    std::vector<int32_t>& neighbors_out) const
{
    const uint32_t L = structure.Length;
    const uint32_t count = std::min(k, L);
    neighbors_out.assign(static_cast<size_t>(L) * count, 0);

    std::vector<uint32_t> order(L);
    for (uint32_t i = 0; i < L; ++i) {
        const float* row = structure.Dist.data() + static_cast<size_t>(i) * L;

        std::iota(order.begin(), order.end(), 0);
        std::partial_sort(order.begin(), order.begin() + count, order.end(), [row](uint32_t a, uint32_t b) {
            const bool a_nan = std::isnan(row[a]);
            const bool b_nan = std::isnan(row[b]);
            if (a_nan != b_nan) {
                return b_nan;
            }
            if (!a_nan && row[a] != row[b]) {
                return row[a] < row[b];
            }
            return a < b;
        });

        for (uint32_t j = 0; j < count; ++j) {
            neighbors_out[static_cast<size_t>(i) * count + j] = static_cast<int32_t>(order[j]);
        }
    }

    return count;
}

void ResidueGeometry::EdgeFeatures(
    const StructureRecord& structure,
    const std::vector<int32_t>& neighbors,
    uint32_t k,
    std::vector<float>& edges_out) const
{
    const uint32_t L = structure.Length;
    edges_out.assign(static_cast<size_t>(L) * k * kEdgeFeatures, 0.f);

    for (uint32_t i = 0; i < L; ++i) {
        for (uint32_t j = 0; j < k; ++j) {
            const size_t n = static_cast<size_t>( neighbors[static_cast<size_t>(i) * k + j] );
            const size_t fw = static_cast<size_t>(i) * L + n;
            const size_t bw = n * L + i;

            float* edge = edges_out.data() + (static_cast<size_t>(i) * k + j) * kEdgeFeatures;
            edge[0] = structure.Dist[fw];
            edge[1] = structure.Omega[fw];
            edge[2] = structure.Theta[fw];
            edge[3] = structure.Theta[bw];
            edge[4] = structure.Phi[fw];
            edge[5] = structure.Phi[bw];
        }
    }
}

void ResidueGeometry::EdgeMask(
    const std::vector<float>& edges,
    uint32_t count,
    std::vector<float>& mask_out) const
{
    mask_out.assign(count, 0.f);
    for (uint32_t e = 0; e < count; ++e) {
        const float dist = edges[static_cast<size_t>(e) * kEdgeFeatures];
        mask_out[e] = std::isfinite(dist) ? 1.f : 0.f;
    }
}
