#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <random>

#include "alphabet.hpp"
#include "batch_tensor.hpp"
#include "sequence_dataset.hpp"
#include "tools.hpp"


//------------------------------------------------------------------------------
// SequenceCollator

/*
    Tokenizes a batch of sequences into one (batch, length) tensor.

    With pad set, rows are right-padded with the PAD id to the longest
    sequence in this batch.  Without it, every sequence must already have
    the same length.
*/
class SequenceCollator {
public:
    SequenceCollator() = default;
    SequenceCollator(const Alphabet& alphabet, bool pad)
        : alphabet_(alphabet)
        , pad_(pad)
    {
    }

    bool Collate(const std::vector<std::string>& sequences, BatchTensor<int32_t>& tokens_out);

    // Tokenizes every string.  Fails with UnknownSymbol.
    bool TokenizeAll(
        const std::vector<std::string>& sequences,
        std::vector<std::vector<int32_t>>& rows_out);

    // Pads with pad_value, or stacks equal rows if padding is off.
    // Fails with EmptyBatch or LengthMismatch.
    bool Stack(
        const std::vector<std::vector<int32_t>>& rows,
        bool pad,
        int32_t pad_value,
        BatchTensor<int32_t>& tensor_out);

    const Alphabet& GetAlphabet() const { return alphabet_; }
    bool GetPad() const { return pad_; }

    BatchError GetLastError() const { return last_error_; }

protected:
    Alphabet alphabet_;
    bool pad_ = false;

    BatchError last_error_ = BatchError::None;
};


//------------------------------------------------------------------------------
// CollatorConfig

enum class CollatorKind {
    // Tokens only
    Simple,

    // src = START + s, target = s + STOP
    NextToken,

    // src is a corrupted copy of target, mask marks the chosen positions
    Masked,

    // src = START + s + STOP + a, target = s + STOP + a + STOP
    AncestorConditioned,
};

const char* CollatorKindString(CollatorKind kind);

// Accepts "simple", "next_token", "masked" or "ancestor"
bool ParseCollatorKind(const std::string& name, CollatorKind& kind_out);

struct CollatorConfig {
    CollatorKind Kind = CollatorKind::NextToken;

    // Only used by Simple; the other kinds always pad
    bool Pad = true;

    // Reverse sequences (NextToken and AncestorConditioned)
    bool Backwards = false;

    // Seeds the corruption generator for Masked
    uint64_t Seed = 0;

    double MaskFraction = kDefaultMaskFraction;
    double KeepFraction = kDefaultKeepFraction;
    double ReplaceFraction = kDefaultReplaceFraction;
};


//------------------------------------------------------------------------------
// CollatedBatch

struct CollatedBatch {
    // Simple: 1 (Src only).  Other kinds: 3.
    uint32_t TensorCount = 0;

    BatchTensor<int32_t> Src;
    BatchTensor<int32_t> Target;

    // 1 where the loss applies, 0 on padding
    BatchTensor<int32_t> Mask;

    uint32_t BatchSize() const { return Src.Rows(); }
};


//------------------------------------------------------------------------------
// BatchCollator

/*
    Turns raw records into aligned src/target/mask tensors.
    The kind is picked by configuration.  All kinds share the tokenize and
    pad steps of SequenceCollator.

    Masked corruption draws from a generator owned by the collator, so two
    collators with the same seed corrupt the same batches the same way.
*/
class BatchCollator {
public:
    // Fails with InvalidArgument if the alphabet lacks a control symbol
    // the kind emits, or the mask fractions are out of range
    bool Initialize(const Alphabet& alphabet, const CollatorConfig& config);

    bool Prepare(const std::vector<SequenceRecord>& batch, CollatedBatch& batch_out);

    // Restarts the corruption generator
    void Reseed(uint64_t seed);

    const CollatorConfig& GetConfig() const { return config_; }
    const Alphabet& GetAlphabet() const { return base_.GetAlphabet(); }

    BatchError GetLastError() const { return last_error_; }

private:
    CollatorConfig config_;
    SequenceCollator base_;
    std::mt19937 rng_;

    // Amino acids of the alphabet that corruption may substitute in
    std::string replacements_;

    BatchError last_error_ = BatchError::None;

    bool PrepareSimple(const std::vector<SequenceRecord>& batch, CollatedBatch& batch_out);
    bool PrepareNextToken(const std::vector<SequenceRecord>& batch, CollatedBatch& batch_out);
    bool PrepareMasked(const std::vector<SequenceRecord>& batch, CollatedBatch& batch_out);
    bool PrepareAncestor(const std::vector<SequenceRecord>& batch, CollatedBatch& batch_out);

    // Corrupts one non-empty sequence in place, marking chosen positions
    void Corrupt(std::string& sequence, std::vector<int32_t>& mask_out);

    // Tokenizes and pads src and target, with a mask of ones over target
    bool TokenizeWithMask(
        const std::vector<std::string>& src,
        const std::vector<std::string>& target,
        CollatedBatch& batch_out);

    bool Fail(BatchError error);
};
