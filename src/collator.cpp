#include "collator.hpp"

#include <algorithm>
#include <cmath>


//------------------------------------------------------------------------------
// SequenceCollator

bool SequenceCollator::TokenizeAll(
    const std::vector<std::string>& sequences,
    std::vector<std::vector<int32_t>>& rows_out)
{
    rows_out.clear();
    rows_out.resize(sequences.size());

    for (size_t i = 0; i < sequences.size(); ++i) {
        if (!alphabet_.Tokenize(sequences[i], rows_out[i])) {
            LOG_ERROR() << "SequenceCollator: failed to tokenize batch row " << i;
            last_error_ = BatchError::UnknownSymbol;
            return false;
        }
    }

    return true;
}

bool SequenceCollator::Stack(
    const std::vector<std::vector<int32_t>>& rows,
    bool pad,
    int32_t pad_value,
    BatchTensor<int32_t>& tensor_out)
{
    if (rows.empty()) {
        LOG_ERROR() << "SequenceCollator: empty batch";
        last_error_ = BatchError::EmptyBatch;
        return false;
    }

    if (!pad) {
        const size_t length = rows[0].size();
        for (size_t i = 1; i < rows.size(); ++i) {
            if (rows[i].size() != length) {
                LOG_ERROR() << "SequenceCollator: row " << i << " has length " << rows[i].size()
                    << " but row 0 has length " << length << " and padding is off";
                last_error_ = BatchError::LengthMismatch;
                return false;
            }
        }
    }

    // Equal rows leave nothing to pad, so both paths produce the same tensor
    PadRows(rows, pad_value, tensor_out);
    return true;
}

bool SequenceCollator::Collate(const std::vector<std::string>& sequences, BatchTensor<int32_t>& tokens_out)
{
    last_error_ = BatchError::None;

    if (pad_ && alphabet_.PadId() < 0) {
        LOG_ERROR() << "SequenceCollator: alphabet has no PAD symbol";
        last_error_ = BatchError::InvalidArgument;
        return false;
    }

    std::vector<std::vector<int32_t>> rows;
    if (!TokenizeAll(sequences, rows)) {
        return false;
    }

    return Stack(rows, pad_, alphabet_.PadId(), tokens_out);
}


//------------------------------------------------------------------------------
// CollatorConfig

const char* CollatorKindString(CollatorKind kind)
{
    switch (kind) {
        case CollatorKind::Simple: return "simple";
        case CollatorKind::NextToken: return "next_token";
        case CollatorKind::Masked: return "masked";
        case CollatorKind::AncestorConditioned: return "ancestor";
    }
    return "unknown";
}

bool ParseCollatorKind(const std::string& name, CollatorKind& kind_out)
{
    if (name == "simple") {
        kind_out = CollatorKind::Simple;
    } else if (name == "next_token") {
        kind_out = CollatorKind::NextToken;
    } else if (name == "masked") {
        kind_out = CollatorKind::Masked;
    } else if (name == "ancestor") {
        kind_out = CollatorKind::AncestorConditioned;
    } else {
        return false;
    }
    return true;
}


//------------------------------------------------------------------------------
// BatchCollator

bool BatchCollator::Fail(BatchError error)
{
    last_error_ = error;
    return false;
}

bool BatchCollator::Initialize(const Alphabet& alphabet, const CollatorConfig& config)
{
    last_error_ = BatchError::None;

    if (!alphabet.IsValid()) {
        LOG_ERROR() << "BatchCollator: invalid alphabet";
        return Fail(BatchError::InvalidArgument);
    }

    const bool padded = config.Kind != CollatorKind::Simple || config.Pad;
    if (padded && alphabet.PadId() < 0) {
        LOG_ERROR() << "BatchCollator: alphabet has no PAD symbol '" << SEQBATCH_PAD << "'";
        return Fail(BatchError::InvalidArgument);
    }

    switch (config.Kind) {
        case CollatorKind::Simple:
            break;
        case CollatorKind::NextToken:
        case CollatorKind::AncestorConditioned:
            if (alphabet.StartId() < 0 || alphabet.StopId() < 0) {
                LOG_ERROR() << "BatchCollator: " << CollatorKindString(config.Kind)
                    << " needs START '" << SEQBATCH_START << "' and STOP '" << SEQBATCH_STOP << "' in the alphabet";
                return Fail(BatchError::InvalidArgument);
            }
            break;
        case CollatorKind::Masked:
            if (alphabet.MaskId() < 0) {
                LOG_ERROR() << "BatchCollator: masked needs MASK '" << SEQBATCH_MASK << "' in the alphabet";
                return Fail(BatchError::InvalidArgument);
            }
            if (config.MaskFraction < 0.0 || config.MaskFraction > 1.0 ||
                config.KeepFraction < 0.0 || config.ReplaceFraction < 0.0 ||
                config.KeepFraction + config.ReplaceFraction > 1.0) {
                LOG_ERROR() << "BatchCollator: invalid mask fractions mask=" << config.MaskFraction
                    << " keep=" << config.KeepFraction << " replace=" << config.ReplaceFraction;
                return Fail(BatchError::InvalidArgument);
            }
            break;
    }

    config_ = config;
    base_ = SequenceCollator(alphabet, padded);

    replacements_.clear();
    for (const char* aa = SEQBATCH_ALL_AAS; *aa; ++aa) {
        if (alphabet.Contains(*aa)) {
            replacements_.push_back(*aa);
        }
    }

    Reseed(config.Seed);
    return true;
}

void BatchCollator::Reseed(uint64_t seed)
{
    std::seed_seq seq{seed};
    rng_.seed(seq);
}

bool BatchCollator::Prepare(const std::vector<SequenceRecord>& batch, CollatedBatch& batch_out)
{
    last_error_ = BatchError::None;
    batch_out = CollatedBatch();

    if (batch.empty()) {
        LOG_ERROR() << "BatchCollator: empty batch";
        return Fail(BatchError::EmptyBatch);
    }

    switch (config_.Kind) {
        case CollatorKind::Simple: return PrepareSimple(batch, batch_out);
        case CollatorKind::NextToken: return PrepareNextToken(batch, batch_out);
        case CollatorKind::Masked: return PrepareMasked(batch, batch_out);
        case CollatorKind::AncestorConditioned: return PrepareAncestor(batch, batch_out);
    }

    return Fail(BatchError::InvalidArgument);
}

bool BatchCollator::PrepareSimple(const std::vector<SequenceRecord>& batch, CollatedBatch& batch_out)
{
    std::vector<std::string> sequences;
    sequences.reserve(batch.size());
    for (const auto& record : batch) {
        sequences.push_back(record.Sequence);
    }

    if (!base_.Collate(sequences, batch_out.Src)) {
        return Fail(base_.GetLastError());
    }

    batch_out.TensorCount = 1;
    return true;
}

bool BatchCollator::TokenizeWithMask(
    const std::vector<std::string>& src,
    const std::vector<std::string>& target,
    CollatedBatch& batch_out)
{
    std::vector<std::vector<int32_t>> src_rows, target_rows;
    if (!base_.TokenizeAll(src, src_rows) || !base_.TokenizeAll(target, target_rows)) {
        return Fail(base_.GetLastError());
    }

    std::vector<std::vector<int32_t>> mask_rows(target_rows.size());
    for (size_t i = 0; i < target_rows.size(); ++i) {
        mask_rows[i].assign(target_rows[i].size(), 1);
    }

    const int32_t pad_id = GetAlphabet().PadId();
    if (!base_.Stack(src_rows, true, pad_id, batch_out.Src) ||
        !base_.Stack(target_rows, true, pad_id, batch_out.Target) ||
        !base_.Stack(mask_rows, true, 0, batch_out.Mask)) {
        return Fail(base_.GetLastError());
    }

    batch_out.TensorCount = 3;
    return true;
}

bool BatchCollator::PrepareNextToken(const std::vector<SequenceRecord>& batch, CollatedBatch& batch_out)
{
    std::vector<std::string> src, target;
    src.reserve(batch.size());
    target.reserve(batch.size());

    for (const auto& record : batch) {
        if (!config_.Backwards) {
            src.push_back(SEQBATCH_START + record.Sequence);
            target.push_back(record.Sequence + SEQBATCH_STOP);
        } else {
            const std::string reversed(record.Sequence.rbegin(), record.Sequence.rend());
            src.push_back(SEQBATCH_STOP + reversed);
            target.push_back(reversed + SEQBATCH_START);
        }
    }

    return TokenizeWithMask(src, target, batch_out);
}

bool BatchCollator::PrepareAncestor(const std::vector<SequenceRecord>& batch, CollatedBatch& batch_out)
{
    std::vector<std::string> src, target;
    src.reserve(batch.size());
    target.reserve(batch.size());

    for (const auto& record : batch) {
        std::string sequence = record.Sequence;
        std::string ancestor = record.Ancestor;
        if (config_.Backwards) {
            std::reverse(sequence.begin(), sequence.end());
            std::reverse(ancestor.begin(), ancestor.end());
        }

        src.push_back(SEQBATCH_START + sequence + SEQBATCH_STOP + ancestor);
        target.push_back(sequence + SEQBATCH_STOP + ancestor + SEQBATCH_STOP);
    }

    return TokenizeWithMask(src, target, batch_out);
}

void BatchCollator::Corrupt(std::string& sequence, std::vector<int32_t>& mask_out)
{
    const uint32_t length = static_cast<uint32_t>( sequence.size() );
    mask_out.assign(length, 0);

    // Round half up, with at least one position
    uint32_t count = static_cast<uint32_t>( std::floor(config_.MaskFraction * length + 0.5 + 1e-9) );
    count = std::max<uint32_t>(count, 1);
    count = std::min<uint32_t>(count, length);

    // Partial Fisher-Yates: the first count entries are a uniform sample
    std::vector<uint32_t> positions(length);
    for (uint32_t i = 0; i < length; ++i) {
        positions[i] = i;
    }
    for (uint32_t i = 0; i < count; ++i) {
        std::uniform_int_distribution<uint32_t> pick(i, length - 1);
        std::swap(positions[i], positions[pick(rng_)]);
    }

    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    const double replace_limit = config_.KeepFraction + config_.ReplaceFraction;

    std::string candidates;
    for (uint32_t i = 0; i < count; ++i) {
        const uint32_t position = positions[i];
        mask_out[position] = 1;

        const double p = uniform(rng_);
        if (p <= config_.KeepFraction) {
            continue;
        }

        if (p <= replace_limit) {
            const char original = sequence[position];
            candidates.clear();
            for (char aa : replacements_) {
                if (aa != original) {
                    candidates.push_back(aa);
                }
            }
            if (!candidates.empty()) {
                std::uniform_int_distribution<size_t> choose(0, candidates.size() - 1);
                sequence[position] = candidates[choose(rng_)];
            }
            continue;
        }

        sequence[position] = SEQBATCH_MASK;
    }
}

bool BatchCollator::PrepareMasked(const std::vector<SequenceRecord>& batch, CollatedBatch& batch_out)
{
    std::vector<std::string> src, target;
    std::vector<std::vector<int32_t>> mask_rows;
    src.reserve(batch.size());
    target.reserve(batch.size());
    mask_rows.reserve(batch.size());

    for (const auto& record : batch) {
        // Nothing to corrupt: drop from src, target and mask together
        if (record.Sequence.empty()) {
            continue;
        }

        target.push_back(record.Sequence);
        src.push_back(record.Sequence);
        mask_rows.emplace_back();
        Corrupt(src.back(), mask_rows.back());
    }

    if (target.empty()) {
        LOG_ERROR() << "BatchCollator: all " << batch.size() << " sequences in the masked batch are empty";
        return Fail(BatchError::EmptyBatch);
    }

    std::vector<std::vector<int32_t>> src_rows, target_rows;
    if (!base_.TokenizeAll(src, src_rows) || !base_.TokenizeAll(target, target_rows)) {
        return Fail(base_.GetLastError());
    }

    const int32_t pad_id = GetAlphabet().PadId();
    if (!base_.Stack(src_rows, true, pad_id, batch_out.Src) ||
        !base_.Stack(target_rows, true, pad_id, batch_out.Target) ||
        !base_.Stack(mask_rows, true, 0, batch_out.Mask)) {
        return Fail(base_.GetLastError());
    }

    batch_out.TensorCount = 3;
    return true;
}
