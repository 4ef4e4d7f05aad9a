#include "token_budget_batcher.hpp"

#include <algorithm>


//------------------------------------------------------------------------------
// Stream contracts

IndexSource MakeVectorSource(const std::vector<uint32_t>& indices)
{
    std::shared_ptr<std::vector<uint32_t>> data = std::make_shared<std::vector<uint32_t>>(indices);
    std::shared_ptr<size_t> next = std::make_shared<size_t>(0);

    return [data, next](uint32_t& index_out) -> bool {
        if (*next >= data->size()) {
            return false;
        }
        index_out = (*data)[(*next)++];
        return true;
    };
}

LengthLookup MakeTableLookup(const std::vector<uint32_t>& lengths)
{
    const std::vector<uint32_t>* table = &lengths;
    return [table](uint32_t index) -> uint32_t {
        return (*table)[index];
    };
}


//------------------------------------------------------------------------------
// TokenBudgetBatcher

bool TokenBudgetBatcher::Initialize(
    LengthLookup lengths,
    uint32_t max_tokens,
    uint32_t max_batch)
{
    last_error_ = BatchError::None;

    if (!lengths) {
        LOG_ERROR() << "TokenBudgetBatcher: no length lookup";
        last_error_ = BatchError::InvalidArgument;
        return false;
    }
    if (max_tokens == 0 || max_batch == 0) {
        LOG_ERROR() << "TokenBudgetBatcher: max_tokens=" << max_tokens << " and max_batch=" << max_batch << " must be positive";
        last_error_ = BatchError::InvalidArgument;
        return false;
    }

    lengths_ = lengths;
    max_tokens_ = max_tokens;
    max_batch_ = max_batch;
    return true;
}

void TokenBudgetBatcher::Reset(IndexSource source)
{
    source_ = source;
    current_batch_.clear();
    current_max_length_ = 0;
    has_carry_ = false;
    exhausted_ = !source_;
    if (last_error_ != BatchError::InvalidArgument) {
        last_error_ = BatchError::None;
    }
}

bool TokenBudgetBatcher::StartBatch(uint32_t index)
{
    const uint32_t length = lengths_(index);
    if (length > max_tokens_) {
        LOG_ERROR() << "TokenBudgetBatcher: index " << index << " has length " << length
            << " which exceeds max_tokens=" << max_tokens_;
        last_error_ = BatchError::BudgetViolation;
        exhausted_ = true;
        return false;
    }

    current_batch_.push_back(index);
    current_max_length_ = length;
    return true;
}

void TokenBudgetBatcher::TakeBatch(std::vector<uint32_t>& batch_out)
{
    batch_out.swap(current_batch_);
    current_batch_.clear();
    current_max_length_ = 0;
}

bool TokenBudgetBatcher::NextBatch(std::vector<uint32_t>& batch_out)
{
    batch_out.clear();

    if (last_error_ != BatchError::None) {
        return false;
    }

    if (has_carry_) {
        has_carry_ = false;
        if (!StartBatch(carry_index_)) {
            return false;
        }
        if (current_batch_.size() >= max_batch_) {
            TakeBatch(batch_out);
            return true;
        }
    }

    uint32_t index = 0;
    while (!exhausted_ && source_(index)) {
        const uint32_t length = lengths_(index);
        const uint32_t candidate_max = std::max(current_max_length_, length);
        const uint64_t padded = static_cast<uint64_t>(current_batch_.size() + 1) * candidate_max;

        if (padded <= max_tokens_) {
            current_batch_.push_back(index);
            current_max_length_ = candidate_max;

            if (current_batch_.size() >= max_batch_) {
                TakeBatch(batch_out);
                return true;
            }
            continue;
        }

        if (current_batch_.empty()) {
            // Does not fit even on its own
            return StartBatch(index);
        }

        has_carry_ = true;
        carry_index_ = index;
        TakeBatch(batch_out);
        return true;
    }

    exhausted_ = true;

    if (current_batch_.empty()) {
        return false;
    }

    TakeBatch(batch_out);
    return true;
}
