#include <token_budget_batcher.hpp>

#include "tools.hpp"

#include <algorithm>
#include <random>

static std::vector<uint32_t> Iota(uint32_t count) {
    std::vector<uint32_t> indices(count);
    for (uint32_t i = 0; i < count; ++i) {
        indices[i] = i;
    }
    return indices;
}

bool testWorkedTrace() {
    const std::vector<uint32_t> lengths = {1, 1, 2, 3, 4, 5, 6, 9};

    TokenBudgetBatcher batcher;
    if (!batcher.Initialize(MakeTableLookup(lengths), 8, 10)) {
        LOG_ERROR() << "testWorkedTrace: initialize failed";
        return false;
    }
    batcher.Reset(MakeVectorSource(Iota(8)));

    // 4 * 3 = 12 > 8 closes the first batch before the length-3 item
    const std::vector<std::vector<uint32_t>> expected = {
        {0, 1, 2},
        {3, 4},
        {5},
        {6},
    };

    std::vector<uint32_t> batch;
    for (const auto& want : expected) {
        if (!batcher.NextBatch(batch) || batch != want) {
            LOG_ERROR() << "testWorkedTrace: batch mismatch, got size " << batch.size();
            return false;
        }
    }

    // The length-9 item cannot fit any batch
    if (batcher.NextBatch(batch) || batcher.GetLastError() != BatchError::BudgetViolation) {
        LOG_ERROR() << "testWorkedTrace: expected BudgetViolation";
        return false;
    }

    LOG_INFO() << "testWorkedTrace: passed";
    return true;
}

bool testBoundsHold() {
    std::mt19937 rng(1234);
    std::uniform_int_distribution<uint32_t> length_dist(0, 120);

    std::vector<uint32_t> lengths(500);
    for (auto& length : lengths) {
        length = length_dist(rng);
    }

    std::vector<uint32_t> order = Iota(500);
    std::shuffle(order.begin(), order.end(), rng);

    const uint32_t kMaxTokens = 400;
    const uint32_t kMaxBatch = 7;

    TokenBudgetBatcher batcher;
    if (!batcher.Initialize(MakeTableLookup(lengths), kMaxTokens, kMaxBatch)) {
        return false;
    }
    batcher.Reset(MakeVectorSource(order));

    std::vector<uint32_t> emitted;
    std::vector<uint32_t> batch;
    while (batcher.NextBatch(batch)) {
        if (batch.empty() || batch.size() > kMaxBatch) {
            LOG_ERROR() << "testBoundsHold: batch size " << batch.size();
            return false;
        }

        uint32_t longest = 0;
        for (uint32_t index : batch) {
            longest = std::max(longest, lengths[index]);
        }
        if (batch.size() * longest > kMaxTokens) {
            LOG_ERROR() << "testBoundsHold: batch of " << batch.size() << " x " << longest << " over budget";
            return false;
        }

        emitted.insert(emitted.end(), batch.begin(), batch.end());
    }

    if (batcher.GetLastError() != BatchError::None) {
        LOG_ERROR() << "testBoundsHold: unexpected error " << BatchErrorString(batcher.GetLastError());
        return false;
    }

    // Every index comes out once, in input order, including the trailing batch
    if (emitted != order) {
        LOG_ERROR() << "testBoundsHold: emitted order differs from input";
        return false;
    }

    LOG_INFO() << "testBoundsHold: passed";
    return true;
}

bool testMaxBatch() {
    const std::vector<uint32_t> lengths(10, 1);

    TokenBudgetBatcher batcher;
    if (!batcher.Initialize(MakeTableLookup(lengths), 1000, 4)) {
        return false;
    }
    batcher.Reset(MakeVectorSource(Iota(10)));

    std::vector<uint32_t> sizes;
    std::vector<uint32_t> batch;
    while (batcher.NextBatch(batch)) {
        sizes.push_back(static_cast<uint32_t>(batch.size()));
    }

    // Trailing partial batch is flushed
    if (sizes != std::vector<uint32_t>({4, 4, 2})) {
        LOG_ERROR() << "testMaxBatch: wrong batch sizes";
        return false;
    }

    LOG_INFO() << "testMaxBatch: passed";
    return true;
}

bool testSingleItemBatches() {
    // Every overflow starts a batch of one, which must close right away
    const std::vector<uint32_t> lengths = {2, 5, 3, 1};

    TokenBudgetBatcher batcher;
    if (!batcher.Initialize(MakeTableLookup(lengths), 100, 1)) {
        return false;
    }
    batcher.Reset(MakeVectorSource(Iota(4)));

    uint32_t count = 0;
    std::vector<uint32_t> batch;
    while (batcher.NextBatch(batch)) {
        if (batch.size() != 1 || batch[0] != count) {
            LOG_ERROR() << "testSingleItemBatches: expected [" << count << "]";
            return false;
        }
        count++;
    }

    if (count != 4) {
        LOG_ERROR() << "testSingleItemBatches: expected 4 batches, got " << count;
        return false;
    }

    LOG_INFO() << "testSingleItemBatches: passed";
    return true;
}

bool testFirstItemTooLong() {
    const std::vector<uint32_t> lengths = {50, 1};

    TokenBudgetBatcher batcher;
    if (!batcher.Initialize(MakeTableLookup(lengths), 10, 4)) {
        return false;
    }
    batcher.Reset(MakeVectorSource(Iota(2)));

    std::vector<uint32_t> batch;
    if (batcher.NextBatch(batch) || !batch.empty() ||
        batcher.GetLastError() != BatchError::BudgetViolation) {
        LOG_ERROR() << "testFirstItemTooLong: expected BudgetViolation with no batch";
        return false;
    }

    // Reset clears the error for the next stream
    batcher.Reset(MakeVectorSource(std::vector<uint32_t>({1})));
    if (!batcher.NextBatch(batch) || batch.size() != 1) {
        LOG_ERROR() << "testFirstItemTooLong: reset did not recover";
        return false;
    }

    if (batcher.Initialize(MakeTableLookup(lengths), 0, 4)) {
        LOG_ERROR() << "testFirstItemTooLong: zero max_tokens accepted";
        return false;
    }

    LOG_INFO() << "testFirstItemTooLong: passed";
    return true;
}

int main() {
    if (!testWorkedTrace()) {
        LOG_ERROR() << "testWorkedTrace failed";
        return -1;
    }

    if (!testBoundsHold()) {
        LOG_ERROR() << "testBoundsHold failed";
        return -1;
    }

    if (!testMaxBatch()) {
        LOG_ERROR() << "testMaxBatch failed";
        return -1;
    }

    if (!testSingleItemBatches()) {
        LOG_ERROR() << "testSingleItemBatches failed";
        return -1;
    }

    if (!testFirstItemTooLong()) {
        LOG_ERROR() << "testFirstItemTooLong failed";
        return -1;
    }

    LOG_INFO() << "All tests passed";
    return 0;
}
