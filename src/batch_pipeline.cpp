#include "batch_pipeline.hpp"

#include <algorithm>


//------------------------------------------------------------------------------
// BatchPipeline

bool BatchPipeline::Start(
    const PipelineConfig& config,
    std::shared_ptr<const SequenceDataset> dataset,
    std::shared_ptr<const GeometryFeaturizer> geometry)
{
    started_ = false;
    last_error_ = BatchError::None;

    if (!dataset) {
        LOG_ERROR() << "BatchPipeline: no dataset";
        last_error_ = BatchError::InvalidArgument;
        return false;
    }
    if (!config.Validate()) {
        last_error_ = BatchError::InvalidArgument;
        return false;
    }

    Logger::getInstance().SetLogLevel(config.Verbosity);

    config_ = config;
    dataset_ = dataset;

    if (!BuildLengthTable(*dataset_, lengths_)) {
        last_error_ = BatchError::InvalidArgument;
        return false;
    }

    if (!sampler_.Initialize(lengths_, config_.BucketSize, config_.NumShards, config_.ShardRank)) {
        last_error_ = sampler_.GetLastError();
        return false;
    }

    if (!batcher_.Initialize(MakeTableLookup(lengths_), config_.MaxTokens, config_.MaxBatch)) {
        last_error_ = batcher_.GetLastError();
        return false;
    }

    const Alphabet alphabet(config_.Alphabet);
    collator_ = std::make_shared<BatchCollator>();
    if (!collator_->Initialize(alphabet, config_.Collator)) {
        last_error_ = collator_->GetLastError();
        return false;
    }

    assembler_ = nullptr;
    if (config_.UseStructure) {
        if (!geometry) {
            geometry = std::make_shared<ResidueGeometry>();
        }
        assembler_ = std::make_shared<StructureAssembler>();
        if (!assembler_->Initialize(collator_, geometry, config_.PDropStructure, config_.NConnections, config_.Collator.Seed)) {
            last_error_ = assembler_->GetLastError();
            return false;
        }
    }

    LOG_INFO() << "BatchPipeline: " << lengths_.size() << " sequences, collator="
        << CollatorKindString(config_.Collator.Kind) << ", max_tokens=" << config_.MaxTokens
        << ", max_batch=" << config_.MaxBatch << ", shard " << config_.ShardRank << "/" << config_.NumShards
        << (assembler_ ? ", with structure" : "");

    started_ = true;
    BeginEpoch(0);
    return true;
}

void BatchPipeline::BeginEpoch(uint64_t epoch)
{
    if (!started_) {
        return;
    }

    last_error_ = BatchError::None;
    current_step_ = 0;

    sampler_.SetEpoch(epoch);
    sampler_.GetIndices(epoch_indices_);

    // Empty sequences have nothing to corrupt, so they never reach the
    // masked collator
    if (config_.Collator.Kind == CollatorKind::Masked) {
        const size_t before = epoch_indices_.size();
        epoch_indices_.erase(
            std::remove_if(epoch_indices_.begin(), epoch_indices_.end(), [this](uint32_t index) {
                return lengths_[index] == 0;
            }),
            epoch_indices_.end());
        if (epoch_indices_.size() != before) {
            LOG_DEBUG() << "BatchPipeline: skipped " << before - epoch_indices_.size() << " empty sequences";
        }
    }

    batcher_.Reset(MakeVectorSource(epoch_indices_));

    CalculateTotalSteps();

    LOG_DEBUG() << "BatchPipeline: epoch " << epoch << " has " << epoch_indices_.size()
        << " indices in " << total_steps_ << " steps";
}

void BatchPipeline::CalculateTotalSteps()
{
    TokenBudgetBatcher counter;
    if (!counter.Initialize(MakeTableLookup(lengths_), config_.MaxTokens, config_.MaxBatch)) {
        total_steps_ = 0;
        return;
    }
    counter.Reset(MakeVectorSource(epoch_indices_));

    total_steps_ = 0;
    std::vector<uint32_t> batch;
    while (counter.NextBatch(batch)) {
        total_steps_++;
    }

    if (counter.GetLastError() != BatchError::None) {
        LOG_WARN() << "BatchPipeline: epoch stops early at step " << total_steps_
            << " because a sequence exceeds max_tokens=" << config_.MaxTokens;
    }
}

bool BatchPipeline::NextBatch(PipelineBatch& batch_out)
{
    if (!started_) {
        LOG_ERROR() << "BatchPipeline: not started";
        last_error_ = BatchError::InvalidArgument;
        return false;
    }
    if (last_error_ != BatchError::None) {
        return false;
    }

    if (!batcher_.NextBatch(batch_out.Indices)) {
        last_error_ = batcher_.GetLastError();
        return false;
    }

    records_.resize(batch_out.Indices.size());
    for (size_t i = 0; i < batch_out.Indices.size(); ++i) {
        if (!dataset_->GetRecord(batch_out.Indices[i], records_[i])) {
            last_error_ = BatchError::InvalidArgument;
            return false;
        }
    }

    if (assembler_) {
        batch_out.HasStructure = true;
        if (!assembler_->Prepare(records_, batch_out.Sequences, batch_out.Structure)) {
            last_error_ = assembler_->GetLastError();
            return false;
        }
    } else {
        batch_out.HasStructure = false;
        if (!collator_->Prepare(records_, batch_out.Sequences)) {
            last_error_ = collator_->GetLastError();
            return false;
        }
    }

    current_step_++;
    return true;
}
