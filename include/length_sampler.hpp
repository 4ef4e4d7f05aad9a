#pragma once

#include <cstdint>
#include <vector>

#include "tools.hpp"


//------------------------------------------------------------------------------
// LengthOrderingSampler

/*
    Produces an index order that keeps similar lengths close together.

    Indices are sorted by length once and cut into buckets of bucket_size.
    Each epoch every bucket is shuffled, then the bucket order is shuffled.
    Neighbouring indices therefore have similar lengths, but there is no
    length curriculum across the epoch.

    The stream is padded by wrapping around to a multiple of the shard
    count and shard r takes every num_shards-th index starting at r, so
    all shards get the same number of samples.

    The only input to the shuffle is the epoch number, so every rank that
    sets the same epoch sees the same global order.
*/
class LengthOrderingSampler {
public:
    // Returns false if bucket_size or num_shards is zero or the rank is out of range
    bool Initialize(
        const std::vector<uint32_t>& sequence_lengths,
        uint32_t bucket_size,
        uint32_t num_shards = 1,
        uint32_t shard_rank = 0);

    void SetEpoch(uint64_t epoch) { epoch_ = epoch; }
    uint64_t GetEpoch() const { return epoch_; }

    // Indices produced per epoch for this shard: ceil(N / num_shards)
    uint32_t GetSampleCount() const { return num_samples_; }

    // num_samples * num_shards
    uint32_t GetTotalSize() const { return total_size_; }

    uint32_t GetBucketCount() const { return static_cast<uint32_t>( bucket_starts_.size() ); }

    // Indices of bucket i in ascending length order, before any shuffle
    void GetBucket(uint32_t bucket_index, std::vector<uint32_t>& indices_out) const;

    // Replaces indices_out with this shard's stream for the current epoch
    void GetIndices(std::vector<uint32_t>& indices_out) const;

    BatchError GetLastError() const { return last_error_; }

private:
    uint32_t bucket_size_ = 0;
    uint32_t num_shards_ = 1;
    uint32_t shard_rank_ = 0;
    uint32_t num_samples_ = 0;
    uint32_t total_size_ = 0;

    uint64_t epoch_ = 0;

    // Dataset indices sorted by length, ties broken by index
    std::vector<uint32_t> sorted_;

    // Offset into sorted_ where each bucket begins
    std::vector<uint32_t> bucket_starts_;

    BatchError last_error_ = BatchError::None;
};
