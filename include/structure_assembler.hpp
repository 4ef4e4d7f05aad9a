#pragma once

#include <cstdint>
#include <vector>
#include <memory>
#include <random>

#include "collator.hpp"
#include "geometry.hpp"


//------------------------------------------------------------------------------
// StructureBatch

/*
    Graph tensors aligned with the collated sequences.

    The residue axis has one extra leading slot: row 0 lines up with the
    START token of src and is never filled.  Residue r of the sequence is
    stored at row r + 1.
*/
struct StructureBatch {
    BatchTensor<float> Nodes;         // (batch, L + 1, kNodeFeatures)
    BatchTensor<float> Edges;         // (batch, L + 1, k, kEdgeFeatures)
    BatchTensor<int32_t> Connections; // (batch, L + 1, k)
    BatchTensor<float> EdgeMask;      // (batch, L + 1, k, 1)
};


//------------------------------------------------------------------------------
// StructureAssembler

/*
    Adds structure features to a collated sequence batch.

    An example keeps all-zero tensors, including a zero edge mask, when it
    has no structure or when its structure is dropped (probability
    p_drop_structure).  Sequences shorter than n_connections only fill their
    first L neighbour slots.

    With the masked collator, empty sequences are skipped in both the
    sequence and structure tensors, so row r always refers to the same
    example in each.
*/
class StructureAssembler {
public:
    bool Initialize(
        std::shared_ptr<BatchCollator> collator,
        std::shared_ptr<const GeometryFeaturizer> geometry,
        double p_drop_structure = kDefaultStructureDrop,
        uint32_t n_connections = kDefaultConnections,
        uint64_t seed = 0);

    bool Prepare(
        const std::vector<SequenceRecord>& batch,
        CollatedBatch& sequences_out,
        StructureBatch& structure_out);

    // Examples in the last batch whose structure was written
    uint32_t GetFilledCount() const { return filled_count_; }

    uint32_t GetConnections() const { return n_connections_; }
    double GetDropProbability() const { return p_drop_; }

    BatchError GetLastError() const { return last_error_; }

private:
    std::shared_ptr<BatchCollator> collator_;
    std::shared_ptr<const GeometryFeaturizer> geometry_;

    double p_drop_ = kDefaultStructureDrop;
    uint32_t n_connections_ = kDefaultConnections;

    std::mt19937 rng_;

    uint32_t filled_count_ = 0;

    BatchError last_error_ = BatchError::None;

    // Writes one example's features into row `row` of the batch tensors
    void FillExample(
        uint32_t row,
        const StructureRecord& structure,
        StructureBatch& structure_out) const;
};
