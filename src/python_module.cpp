#include "python_module.hpp"

#include "batch_pipeline.hpp"

#include <cstring>

//------------------------------------------------------------------------------
// PipelineHandle

struct PipelineHandle {
    BatchPipeline Pipeline;
    PipelineBatch Batch;
    bool HasBatch = false;
};

extern "C" {

//------------------------------------------------------------------------------
// Batch Pipeline

void* batch_pipeline_create(
    const char* config_path,
    const char* const* sequences,
    const char* const* ancestors,
    uint32_t count)
{
    if (!sequences && count > 0) {
        LOG_ERROR() << "batch_pipeline_create: no sequences";
        return nullptr;
    }

    PipelineConfig config;
    if (config_path && !config.ReadYamlFile(config_path)) {
        return nullptr;
    }

    std::shared_ptr<InMemoryDataset> dataset = std::make_shared<InMemoryDataset>();
    for (uint32_t i = 0; i < count; ++i) {
        SequenceRecord record;
        record.Sequence = sequences[i] ? sequences[i] : "";
        if (ancestors && ancestors[i]) {
            record.Ancestor = ancestors[i];
        }
        dataset->AddRecord(std::move(record));
    }

    // Structure needs geometry maps, which this interface does not carry
    config.UseStructure = false;

    PipelineHandle* handle = new PipelineHandle();
    if (!handle->Pipeline.Start(config, dataset)) {
        delete handle;
        return nullptr;
    }
    return handle;
}

void batch_pipeline_destroy(void* pipeline) {
    PipelineHandle* handle = static_cast<PipelineHandle*>(pipeline);
    if (!handle) {
        return;
    }
    delete handle;
}

uint32_t batch_pipeline_begin_epoch(void* pipeline, uint64_t epoch)
{
    PipelineHandle* handle = static_cast<PipelineHandle*>(pipeline);
    if (!handle) {
        return 0;
    }

    handle->HasBatch = false;
    handle->Pipeline.BeginEpoch(epoch);
    return handle->Pipeline.GetTotalSteps();
}

bool batch_pipeline_next(
    void* pipeline,
    uint32_t* batch_size,
    uint32_t* src_width,
    uint32_t* target_width,
    uint32_t* step,
    uint32_t* total_steps)
{
    PipelineHandle* handle = static_cast<PipelineHandle*>(pipeline);
    if (!handle || !batch_size || !src_width || !target_width) {
        return false;
    }

    handle->HasBatch = handle->Pipeline.NextBatch(handle->Batch);
    if (!handle->HasBatch) {
        return false;
    }

    const CollatedBatch& collated = handle->Batch.Sequences;
    *batch_size = collated.BatchSize();
    *src_width = collated.Src.Shape.size() > 1 ? collated.Src.Shape[1] : 0;
    *target_width = (collated.TensorCount > 1 && collated.Target.Shape.size() > 1) ? collated.Target.Shape[1] : 0;
    if (step) {
        *step = handle->Pipeline.GetStep();
    }
    if (total_steps) {
        *total_steps = handle->Pipeline.GetTotalSteps();
    }
    return true;
}

bool batch_pipeline_copy(
    void* pipeline,
    int32_t* src,
    int32_t* target,
    int32_t* mask)
{
    PipelineHandle* handle = static_cast<PipelineHandle*>(pipeline);
    if (!handle || !handle->HasBatch || !src) {
        return false;
    }

    const CollatedBatch& collated = handle->Batch.Sequences;
    memcpy(src, collated.Src.Data.data(), collated.Src.Data.size() * sizeof(int32_t));

    if (collated.TensorCount > 1) {
        if (target) {
            memcpy(target, collated.Target.Data.data(), collated.Target.Data.size() * sizeof(int32_t));
        }
        if (mask) {
            memcpy(mask, collated.Mask.Data.data(), collated.Mask.Data.size() * sizeof(int32_t));
        }
    }
    return true;
}

int batch_pipeline_last_error(void* pipeline)
{
    PipelineHandle* handle = static_cast<PipelineHandle*>(pipeline);
    if (!handle) {
        return static_cast<int>(BatchError::InvalidArgument);
    }
    return static_cast<int>(handle->Pipeline.GetLastError());
}

} // extern "C"
