#include "structure_assembler.hpp"

#include <algorithm>


//------------------------------------------------------------------------------
// StructureAssembler

bool StructureAssembler::Initialize(
    std::shared_ptr<BatchCollator> collator,
    std::shared_ptr<const GeometryFeaturizer> geometry,
    double p_drop_structure,
    uint32_t n_connections,
    uint64_t seed)
{
    last_error_ = BatchError::None;

    if (!collator || !geometry) {
        LOG_ERROR() << "StructureAssembler: collator and geometry are required";
        last_error_ = BatchError::InvalidArgument;
        return false;
    }
    if (p_drop_structure < 0.0 || p_drop_structure > 1.0) {
        LOG_ERROR() << "StructureAssembler: p_drop_structure=" << p_drop_structure << " is not a probability";
        last_error_ = BatchError::InvalidArgument;
        return false;
    }
    if (n_connections == 0) {
        LOG_ERROR() << "StructureAssembler: n_connections must be positive";
        last_error_ = BatchError::InvalidArgument;
        return false;
    }

    collator_ = collator;
    geometry_ = geometry;
    p_drop_ = p_drop_structure;
    n_connections_ = n_connections;

    std::seed_seq seq{seed};
    rng_.seed(seq);
    return true;
}

bool StructureAssembler::Prepare(
    const std::vector<SequenceRecord>& batch,
    CollatedBatch& sequences_out,
    StructureBatch& structure_out)
{
    last_error_ = BatchError::None;
    filled_count_ = 0;

    if (!collator_) {
        LOG_ERROR() << "StructureAssembler: not initialized";
        last_error_ = BatchError::InvalidArgument;
        return false;
    }

    // The masked collator drops empty sequences, so drop them here too and
    // keep structure rows aligned with the collated rows
    const std::vector<SequenceRecord>* records = &batch;
    std::vector<SequenceRecord> kept;
    if (collator_->GetConfig().Kind == CollatorKind::Masked) {
        kept.reserve(batch.size());
        for (const auto& record : batch) {
            if (!record.Sequence.empty()) {
                kept.push_back(record);
            }
        }
        records = &kept;
    }

    if (!collator_->Prepare(*records, sequences_out)) {
        last_error_ = collator_->GetLastError();
        return false;
    }

    uint32_t max_length = 0;
    for (const auto& record : *records) {
        max_length = std::max(max_length, static_cast<uint32_t>( record.Sequence.size() ));
    }

    const uint32_t n = static_cast<uint32_t>( records->size() );
    if (n != sequences_out.BatchSize()) {
        LOG_ERROR() << "StructureAssembler: " << sequences_out.BatchSize() << " collated rows for "
            << n << " structure rows";
        last_error_ = BatchError::LengthMismatch;
        return false;
    }

    const uint32_t rows = max_length + 1;
    const uint32_t k = n_connections_;

    structure_out.Nodes.Reset({ n, rows, static_cast<uint32_t>(kNodeFeatures) }, 0.f);
    structure_out.Edges.Reset({ n, rows, k, static_cast<uint32_t>(kEdgeFeatures) }, 0.f);
    structure_out.Connections.Reset({ n, rows, k }, 0);
    structure_out.EdgeMask.Reset({ n, rows, k, 1 }, 0.f);

    std::uniform_real_distribution<double> uniform(0.0, 1.0);

    for (uint32_t i = 0; i < n; ++i) {
        const SequenceRecord& record = (*records)[i];
        if (!record.Structure) {
            continue;
        }

        const StructureRecord& structure = *record.Structure;
        if (structure.Length != record.Sequence.size() || !structure.IsConsistent()) {
            LOG_ERROR() << "StructureAssembler: structure for batch row " << i << " has length "
                << structure.Length << " but the sequence has length " << record.Sequence.size();
            last_error_ = BatchError::LengthMismatch;
            return false;
        }

        if (uniform(rng_) < p_drop_) {
            continue;
        }

        FillExample(i, structure, structure_out);
        filled_count_++;
    }

    return true;
}

void StructureAssembler::FillExample(
    uint32_t row,
    const StructureRecord& structure,
    StructureBatch& structure_out) const
{
    const uint32_t L = structure.Length;
    const uint32_t k = n_connections_;

    std::vector<float> nodes, edges, mask;
    std::vector<int32_t> neighbors;

    geometry_->NodeFeatures(structure, nodes);
    const uint32_t nc = geometry_->Neighbors(structure, k, neighbors);
    geometry_->EdgeFeatures(structure, neighbors, nc, edges);
    geometry_->EdgeMask(edges, L * nc, mask);
    ReplaceNonFinite(nodes);
    ReplaceNonFinite(edges);

    float* node_row = structure_out.Nodes.Row(row);
    float* edge_row = structure_out.Edges.Row(row);
    int32_t* connection_row = structure_out.Connections.Row(row);
    float* mask_row = structure_out.EdgeMask.Row(row);

    // Residue r lands at position r + 1
    for (uint32_t r = 0; r < L; ++r) {
        const uint32_t pos = r + 1;

        std::copy(
            nodes.begin() + static_cast<size_t>(r) * kNodeFeatures,
            nodes.begin() + static_cast<size_t>(r + 1) * kNodeFeatures,
            node_row + static_cast<size_t>(pos) * kNodeFeatures);

        for (uint32_t j = 0; j < nc; ++j) {
            const size_t src = static_cast<size_t>(r) * nc + j;
            const size_t dst = static_cast<size_t>(pos) * k + j;

            std::copy(
                edges.begin() + src * kEdgeFeatures,
                edges.begin() + (src + 1) * kEdgeFeatures,
                edge_row + dst * kEdgeFeatures);
            connection_row[dst] = neighbors[src];
            mask_row[dst] = mask[src];
        }
    }
}
