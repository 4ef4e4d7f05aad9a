#pragma once

#include <cstdint>
#include <vector>

#include "sequence_dataset.hpp"


//------------------------------------------------------------------------------
// GeometryFeaturizer

/*
    Converts inter-residue geometry maps into graph features.

    Shapes for a structure of length L with k neighbours per residue:
        nodes      : L x kNodeFeatures
        neighbors  : L x k  (k <= L)
        edges      : L x k x kEdgeFeatures
        edge mask  : L x k

    Outputs may contain NaN; the caller runs ReplaceNonFinite() on them.
*/
class GeometryFeaturizer {
public:
    virtual ~GeometryFeaturizer() = default;

    virtual void NodeFeatures(
        const StructureRecord& structure,
        std::vector<float>& nodes_out) const = 0;

    // Returns the neighbour count actually used, min(k, L)
    virtual uint32_t Neighbors(
        const StructureRecord& structure,
        uint32_t k,
        std::vector<int32_t>& neighbors_out) const = 0;

    virtual void EdgeFeatures(
        const StructureRecord& structure,
        const std::vector<int32_t>& neighbors,
        uint32_t k,
        std::vector<float>& edges_out) const = 0;

    virtual void EdgeMask(
        const std::vector<float>& edges,
        uint32_t count,
        std::vector<float>& mask_out) const = 0;
};

// Sets every NaN or infinite value to zero
void ReplaceNonFinite(std::vector<float>& values);


//------------------------------------------------------------------------------
// ResidueGeometry

/*
    Default featurizer.

    Node i carries omega(i-1,i), theta(i-1,i), theta(i,i-1), phi(i-1,i),
    phi(i,i-1), then the same five angles towards i+1.  Angles past either
    end of the chain are zero.

    Neighbours are the k smallest distances in each row, nearest first,
    with NaN distances sorted last.  Edges gather dist, omega, theta both
    ways and phi both ways at each neighbour.  An edge is valid when its
    distance is finite.
*/
class ResidueGeometry : public GeometryFeaturizer {
public:
    void NodeFeatures(
        const StructureRecord& structure,
        std::vector<float>& nodes_out) const override;

    uint32_t Neighbors(
        const StructureRecord& structure,
        uint32_t k,
        std::vector<int32_t>& neighbors_out) const override;

    void EdgeFeatures(
        const StructureRecord& structure,
        const std::vector<int32_t>& neighbors,
        uint32_t k,
        std::vector<float>& edges_out) const override;

    void EdgeMask(
        const std::vector<float>& edges,
        uint32_t count,
        std::vector<float>& mask_out) const override;
};
