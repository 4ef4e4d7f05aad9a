/*
    C interface for driving a BatchPipeline from Python through ctypes.

    Typical use per epoch:

        batch_pipeline_begin_epoch(p, epoch);
        while (batch_pipeline_next(p, &rows, &src_width, &target_width, &step, &total)) {
            allocate rows * src_width and rows * target_width int32 buffers
            batch_pipeline_copy(p, src, target, mask);
        }

    Structure tensors are not exposed here.
*/

#pragma once

#include <cstdint>

extern "C" {

// config_path may be null for defaults.  ancestors may be null.
// Returns null on failure.
void* batch_pipeline_create(
    const char* config_path,
    const char* const* sequences,
    const char* const* ancestors,
    uint32_t count);

void batch_pipeline_destroy(void* pipeline);

// Returns the number of steps in the epoch
uint32_t batch_pipeline_begin_epoch(void* pipeline, uint64_t epoch);

// Collates the next batch.  target_width is 0 for the simple collator.
bool batch_pipeline_next(
    void* pipeline,
    uint32_t* batch_size,
    uint32_t* src_width,
    uint32_t* target_width,
    uint32_t* step,
    uint32_t* total_steps);

// Copies the batch from the last successful batch_pipeline_next().
// target and mask are skipped when null or when the collator has no target.
bool batch_pipeline_copy(
    void* pipeline,
    int32_t* src,
    int32_t* target,
    int32_t* mask);

// BatchError of the last failed call, as an integer (0 = none)
int batch_pipeline_last_error(void* pipeline);

}
