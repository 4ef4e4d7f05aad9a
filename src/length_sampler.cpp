#include "length_sampler.hpp"

#include <algorithm>
#include <numeric>
#include <random>


//------------------------------------------------------------------------------
// LengthOrderingSampler

bool LengthOrderingSampler::Initialize(
    const std::vector<uint32_t>& sequence_lengths,
    uint32_t bucket_size,
    uint32_t num_shards,
    uint32_t shard_rank)
{
    last_error_ = BatchError::None;
    sorted_.clear();
    bucket_starts_.clear();
    num_samples_ = 0;
    total_size_ = 0;

    if (bucket_size == 0) {
        LOG_ERROR() << "LengthOrderingSampler: bucket_size must be positive";
        last_error_ = BatchError::InvalidArgument;
        return false;
    }
    if (num_shards == 0 || shard_rank >= num_shards) {
        LOG_ERROR() << "LengthOrderingSampler: invalid shard " << shard_rank << " of " << num_shards;
        last_error_ = BatchError::InvalidArgument;
        return false;
    }

    bucket_size_ = bucket_size;
    num_shards_ = num_shards;
    shard_rank_ = shard_rank;

    const uint32_t count = static_cast<uint32_t>( sequence_lengths.size() );

    sorted_.resize(count);
    std::iota(sorted_.begin(), sorted_.end(), 0);
    std::stable_sort(sorted_.begin(), sorted_.end(), [&sequence_lengths](uint32_t a, uint32_t b) {
        return sequence_lengths[a] < sequence_lengths[b];
    });

    for (uint32_t start = 0; start < count; start += bucket_size_) {
        bucket_starts_.push_back(start);
    }

    num_samples_ = (count + num_shards_ - 1) / num_shards_;
    total_size_ = num_samples_ * num_shards_;

    LOG_DEBUG() << "LengthOrderingSampler: " << count << " indices in " << bucket_starts_.size()
        << " buckets, " << num_samples_ << " samples for shard " << shard_rank_ << "/" << num_shards_;
    return true;
}

void LengthOrderingSampler::GetBucket(uint32_t bucket_index, std::vector<uint32_t>& indices_out) const
{
    indices_out.clear();
    if (bucket_index >= bucket_starts_.size()) {
        return;
    }

    const uint32_t start = bucket_starts_[bucket_index];
    const uint32_t end = std::min<uint32_t>(start + bucket_size_, static_cast<uint32_t>( sorted_.size() ));
    indices_out.assign(sorted_.begin() + start, sorted_.begin() + end);
}

void LengthOrderingSampler::GetIndices(std::vector<uint32_t>& indices_out) const
{
    indices_out.clear();
    if (sorted_.empty()) {
        return;
    }

    // Buckets are rebuilt from the sorted order so that the result depends
    // only on the epoch and not on which epochs ran before
    std::vector<uint32_t> shuffled = sorted_;

    std::seed_seq seed{epoch_};
    std::mt19937 rng(seed);

    const uint32_t bucket_count = static_cast<uint32_t>( bucket_starts_.size() );
    for (uint32_t i = 0; i < bucket_count; ++i) {
        const uint32_t start = bucket_starts_[i];
        const uint32_t end = std::min<uint32_t>(start + bucket_size_, static_cast<uint32_t>( shuffled.size() ));
        std::shuffle(shuffled.begin() + start, shuffled.begin() + end, rng);
    }

    std::vector<uint32_t> bucket_order(bucket_count);
    std::iota(bucket_order.begin(), bucket_order.end(), 0);
    std::shuffle(bucket_order.begin(), bucket_order.end(), rng);

    std::vector<uint32_t> flat;
    flat.reserve(total_size_);
    for (uint32_t bucket : bucket_order) {
        const uint32_t start = bucket_starts_[bucket];
        const uint32_t end = std::min<uint32_t>(start + bucket_size_, static_cast<uint32_t>( shuffled.size() ));
        flat.insert(flat.end(), shuffled.begin() + start, shuffled.begin() + end);
    }

    // Wrap around so every shard gets num_samples indices
    const uint32_t original_size = static_cast<uint32_t>( flat.size() );
    for (uint32_t i = 0; flat.size() < total_size_; ++i) {
        flat.push_back(flat[i % original_size]);
    }

    indices_out.reserve(num_samples_);
    for (uint32_t i = shard_rank_; i < total_size_; i += num_shards_) {
        indices_out.push_back(flat[i]);
    }
}
