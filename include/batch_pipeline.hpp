#pragma once

#include <cstdint>
#include <vector>
#include <memory>

#include "length_sampler.hpp"
#include "token_budget_batcher.hpp"
#include "structure_assembler.hpp"
#include "pipeline_config.hpp"


//------------------------------------------------------------------------------
// PipelineBatch

struct PipelineBatch {
    // Dataset indices in batch row order
    std::vector<uint32_t> Indices;

    CollatedBatch Sequences;

    // Filled only when the pipeline was started with structure enabled
    bool HasStructure = false;
    StructureBatch Structure;
};


//------------------------------------------------------------------------------
// BatchPipeline

/*
    sampler -> token budget batcher -> dataset fetch -> collator

    One step = one NextBatch() call.  Call BeginEpoch() before the first
    step of every epoch.

    This is not thread-safe so do not call methods from multiple threads.
*/
class BatchPipeline {
public:
    BatchPipeline() = default;

    // The batcher reads lengths_ through a pointer
    BatchPipeline(const BatchPipeline&) = delete;
    BatchPipeline& operator=(const BatchPipeline&) = delete;

    // The length table is read from the dataset here, once.
    // geometry may be null, in which case ResidueGeometry is used when the
    // config enables structure.
    bool Start(
        const PipelineConfig& config,
        std::shared_ptr<const SequenceDataset> dataset,
        std::shared_ptr<const GeometryFeaturizer> geometry = nullptr);

    // Reshuffles for the given epoch and rewinds to step 0
    void BeginEpoch(uint64_t epoch);

    // Returns false at the end of the epoch or on error.
    // GetLastError() is BatchError::None at a clean end of epoch.
    bool NextBatch(PipelineBatch& batch_out);

    uint32_t GetStep() const { return current_step_; }
    uint32_t GetTotalSteps() const { return total_steps_; }

    const std::vector<uint32_t>& GetLengthTable() const { return lengths_; }
    const LengthOrderingSampler& GetSampler() const { return sampler_; }

    BatchError GetLastError() const { return last_error_; }

private:
    PipelineConfig config_;
    std::shared_ptr<const SequenceDataset> dataset_;

    std::vector<uint32_t> lengths_;

    LengthOrderingSampler sampler_;
    TokenBudgetBatcher batcher_;

    std::shared_ptr<BatchCollator> collator_;
    std::shared_ptr<StructureAssembler> assembler_;

    // This shard's index stream for the current epoch
    std::vector<uint32_t> epoch_indices_;

    std::vector<SequenceRecord> records_;

    uint32_t current_step_ = 0;
    uint32_t total_steps_ = 0;

    bool started_ = false;
    BatchError last_error_ = BatchError::None;

    // Number of batches the batcher will emit for epoch_indices_
    void CalculateTotalSteps();
};
