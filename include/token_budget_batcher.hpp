#pragma once

#include <cstdint>
#include <vector>
#include <memory>
#include <functional>

#include "tools.hpp"


//------------------------------------------------------------------------------
// Stream contracts

// Pulls the next dataset index.  Returns false once the stream is exhausted.
using IndexSource = std::function<bool(uint32_t& index_out)>;

// Length of the sequence at a dataset index
using LengthLookup = std::function<uint32_t(uint32_t index)>;

// Source that replays a copy of the given indices
IndexSource MakeVectorSource(const std::vector<uint32_t>& indices);

// Lookup over a length table.  The table must outlive the lookup.
LengthLookup MakeTableLookup(const std::vector<uint32_t>& lengths);


//------------------------------------------------------------------------------
// TokenBudgetBatcher

/*
    Greedy single-pass packer.

    An index joins the pending batch if the padded size of the batch with it,
    (count + 1) * max(length), stays within max_tokens.  Otherwise the
    pending batch is emitted and a new one starts with that index.  A batch
    is also emitted as soon as it holds max_batch indices.

    This is not optimal bin packing: one long sequence raises the padded
    width for everything after it in the same batch.  The input order
    should already be roughly length sorted (see LengthOrderingSampler).

    Policies:
    + Empty batches are never emitted.
    + An index whose length alone exceeds max_tokens fails with
      BudgetViolation after the pending batch has been emitted.
    + A non-empty trailing batch is emitted when the source runs out.
*/
class TokenBudgetBatcher {
public:
    // Returns false if max_tokens or max_batch is zero
    bool Initialize(
        LengthLookup lengths,
        uint32_t max_tokens,
        uint32_t max_batch);

    // Starts over on a new stream
    void Reset(IndexSource source);

    // Returns false at the end of the stream or on error.
    // Check GetLastError() to tell the two apart.
    bool NextBatch(std::vector<uint32_t>& batch_out);

    BatchError GetLastError() const { return last_error_; }

    uint32_t GetMaxTokens() const { return max_tokens_; }
    uint32_t GetMaxBatch() const { return max_batch_; }

private:
    LengthLookup lengths_;
    IndexSource source_;

    uint32_t max_tokens_ = 0;
    uint32_t max_batch_ = 0;

    std::vector<uint32_t> current_batch_;
    uint32_t current_max_length_ = 0;

    // Index that did not fit the pending batch; it opens the next one
    bool has_carry_ = false;
    uint32_t carry_index_ = 0;

    bool exhausted_ = true;

    BatchError last_error_ = BatchError::None;

    // Places index into the pending batch, which must be empty
    bool StartBatch(uint32_t index);

    void TakeBatch(std::vector<uint32_t>& batch_out);
};
