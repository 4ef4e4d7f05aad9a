#include <collator.hpp>

#include "tools.hpp"

static std::vector<SequenceRecord> MakeRecords(const std::vector<std::string>& sequences) {
    std::vector<SequenceRecord> records(sequences.size());
    for (size_t i = 0; i < sequences.size(); ++i) {
        records[i].Sequence = sequences[i];
    }
    return records;
}

// Decodes row `row` of a token tensor
static std::string RowString(const Alphabet& alphabet, const BatchTensor<int32_t>& tensor, uint32_t row) {
    std::string decoded;
    alphabet.Untokenize(tensor.Row(row), static_cast<uint32_t>(tensor.RowStride()), decoded);
    return decoded;
}

bool testSimplePadding() {
    Alphabet alphabet;
    SequenceCollator collator(alphabet, true);

    BatchTensor<int32_t> tokens;
    if (!collator.Collate({"ACD", "A", "KLMNP"}, tokens)) {
        LOG_ERROR() << "testSimplePadding: collate failed";
        return false;
    }

    if (tokens.Shape != std::vector<uint32_t>({3, 5})) {
        LOG_ERROR() << "testSimplePadding: expected shape (3, 5)";
        return false;
    }
    if (RowString(alphabet, tokens, 0) != "ACD--" ||
        RowString(alphabet, tokens, 1) != "A----" ||
        RowString(alphabet, tokens, 2) != "KLMNP") {
        LOG_ERROR() << "testSimplePadding: wrong padded rows";
        return false;
    }

    LOG_INFO() << "testSimplePadding: passed";
    return true;
}

bool testPadIdempotence() {
    Alphabet alphabet;
    SequenceCollator padded(alphabet, true);
    SequenceCollator stacked(alphabet, false);

    const std::vector<std::string> batch = {"ACDE", "FGHI", "KLMN"};

    BatchTensor<int32_t> a, b;
    if (!padded.Collate(batch, a) || !stacked.Collate(batch, b)) {
        LOG_ERROR() << "testPadIdempotence: collate failed";
        return false;
    }
    if (a.Shape != b.Shape || a.Data != b.Data) {
        LOG_ERROR() << "testPadIdempotence: padded and stacked outputs differ";
        return false;
    }

    if (stacked.Collate({"ACDE", "AC"}, b) || stacked.GetLastError() != BatchError::LengthMismatch) {
        LOG_ERROR() << "testPadIdempotence: expected LengthMismatch";
        return false;
    }

    if (padded.Collate({"AC", "A1"}, a) || padded.GetLastError() != BatchError::UnknownSymbol) {
        LOG_ERROR() << "testPadIdempotence: expected UnknownSymbol";
        return false;
    }

    if (padded.Collate({}, a) || padded.GetLastError() != BatchError::EmptyBatch) {
        LOG_ERROR() << "testPadIdempotence: expected EmptyBatch";
        return false;
    }

    LOG_INFO() << "testPadIdempotence: passed";
    return true;
}

bool testNextToken() {
    Alphabet alphabet;
    CollatorConfig config;
    config.Kind = CollatorKind::NextToken;

    BatchCollator collator;
    if (!collator.Initialize(alphabet, config)) {
        return false;
    }

    CollatedBatch batch;
    if (!collator.Prepare(MakeRecords({"ACD", "KL"}), batch) || batch.TensorCount != 3) {
        LOG_ERROR() << "testNextToken: prepare failed";
        return false;
    }

    if (RowString(alphabet, batch.Src, 0) != "@ACD" || RowString(alphabet, batch.Target, 0) != "ACD*" ||
        RowString(alphabet, batch.Src, 1) != "@KL-" || RowString(alphabet, batch.Target, 1) != "KL*-") {
        LOG_ERROR() << "testNextToken: wrong forward rows";
        return false;
    }

    const std::vector<int32_t> mask = {1, 1, 1, 1, 1, 1, 1, 0};
    if (batch.Mask.Data != mask) {
        LOG_ERROR() << "testNextToken: wrong mask";
        return false;
    }

    config.Backwards = true;
    if (!collator.Initialize(alphabet, config) || !collator.Prepare(MakeRecords({"ACD"}), batch)) {
        return false;
    }
    if (RowString(alphabet, batch.Src, 0) != "*DCA" || RowString(alphabet, batch.Target, 0) != "DCA@") {
        LOG_ERROR() << "testNextToken: wrong backward rows";
        return false;
    }

    LOG_INFO() << "testNextToken: passed";
    return true;
}

bool testAncestor() {
    Alphabet alphabet;
    CollatorConfig config;
    config.Kind = CollatorKind::AncestorConditioned;

    BatchCollator collator;
    if (!collator.Initialize(alphabet, config)) {
        return false;
    }

    std::vector<SequenceRecord> records = MakeRecords({"AC", "K"});
    records[0].Ancestor = "GH";
    records[1].Ancestor = "MNP";

    CollatedBatch batch;
    if (!collator.Prepare(records, batch)) {
        LOG_ERROR() << "testAncestor: prepare failed";
        return false;
    }

    if (RowString(alphabet, batch.Src, 0) != "@AC*GH" || RowString(alphabet, batch.Target, 0) != "AC*GH*" ||
        RowString(alphabet, batch.Src, 1) != "@K*MNP" || RowString(alphabet, batch.Target, 1) != "K*MNP*") {
        LOG_ERROR() << "testAncestor: wrong rows";
        return false;
    }

    config.Backwards = true;
    if (!collator.Initialize(alphabet, config) || !collator.Prepare(records, batch)) {
        return false;
    }
    if (RowString(alphabet, batch.Src, 0) != "@CA*HG" || RowString(alphabet, batch.Target, 0) != "CA*HG*") {
        LOG_ERROR() << "testAncestor: wrong backward rows";
        return false;
    }

    LOG_INFO() << "testAncestor: passed";
    return true;
}

bool testMaskedPolicy() {
    Alphabet alphabet;
    CollatorConfig config;
    config.Kind = CollatorKind::Masked;
    config.Seed = 7;

    BatchCollator collator;
    if (!collator.Initialize(alphabet, config)) {
        return false;
    }

    const std::vector<std::string> sequences = {"ACDEFGHIKL", "MNPQRSTVWY", "ACD"};

    for (int trial = 0; trial < 50; ++trial) {
        CollatedBatch batch;
        if (!collator.Prepare(MakeRecords(sequences), batch)) {
            LOG_ERROR() << "testMaskedPolicy: prepare failed";
            return false;
        }

        if (batch.Src.Shape != std::vector<uint32_t>({3, 10}) || batch.Mask.Shape != batch.Src.Shape) {
            LOG_ERROR() << "testMaskedPolicy: wrong shapes";
            return false;
        }

        for (uint32_t row = 0; row < 3; ++row) {
            // round(0.15 * 10) = 2, and round(0.45) = 0 is raised to 1
            const int32_t expected = row < 2 ? 2 : 1;
            const int32_t* mask = batch.Mask.Row(row);
            const int32_t* src = batch.Src.Row(row);
            const int32_t* target = batch.Target.Row(row);

            int32_t marked = 0;
            for (uint32_t i = 0; i < 10; ++i) {
                marked += mask[i];
                if (mask[i] == 0 && src[i] != target[i]) {
                    LOG_ERROR() << "testMaskedPolicy: unmarked position " << i << " was changed";
                    return false;
                }
                if (i >= sequences[row].size() && (mask[i] != 0 || src[i] != alphabet.PadId())) {
                    LOG_ERROR() << "testMaskedPolicy: padding is not clean";
                    return false;
                }
            }
            if (marked != expected) {
                LOG_ERROR() << "testMaskedPolicy: row " << row << " has " << marked << " marked positions";
                return false;
            }
            if (RowString(alphabet, batch.Target, row).substr(0, sequences[row].size()) != sequences[row]) {
                LOG_ERROR() << "testMaskedPolicy: target is not the original sequence";
                return false;
            }
        }
    }

    LOG_INFO() << "testMaskedPolicy: passed";
    return true;
}

bool testMaskedBranches() {
    Alphabet alphabet;
    CollatorConfig config;
    config.Kind = CollatorKind::Masked;
    config.MaskFraction = 1.0;

    BatchCollator collator;

    // keep = 1 leaves every chosen residue alone
    config.KeepFraction = 1.0;
    config.ReplaceFraction = 0.0;
    CollatedBatch batch;
    if (!collator.Initialize(alphabet, config) || !collator.Prepare(MakeRecords({"ACDEF"}), batch)) {
        return false;
    }
    if (batch.Src.Data != batch.Target.Data || batch.Mask.Data != std::vector<int32_t>(5, 1)) {
        LOG_ERROR() << "testMaskedBranches: keep branch changed residues";
        return false;
    }

    // keep = 0, replace = 0 masks everything
    config.KeepFraction = 0.0;
    if (!collator.Initialize(alphabet, config) || !collator.Prepare(MakeRecords({"ACDEF"}), batch)) {
        return false;
    }
    if (RowString(alphabet, batch.Src, 0) != "#####") {
        LOG_ERROR() << "testMaskedBranches: mask branch did not mask";
        return false;
    }

    // replace = 1 substitutes a different residue everywhere
    config.ReplaceFraction = 1.0;
    if (!collator.Initialize(alphabet, config) || !collator.Prepare(MakeRecords({"AAAAAAAA"}), batch)) {
        return false;
    }
    const std::string replaced = RowString(alphabet, batch.Src, 0);
    for (char c : replaced) {
        if (c == 'A' || c == SEQBATCH_MASK || std::string(SEQBATCH_ALL_AAS).find(c) == std::string::npos) {
            LOG_ERROR() << "testMaskedBranches: bad replacement '" << c << "'";
            return false;
        }
    }

    LOG_INFO() << "testMaskedBranches: passed";
    return true;
}

bool testMaskedEmptySequences() {
    Alphabet alphabet;
    CollatorConfig config;
    config.Kind = CollatorKind::Masked;

    BatchCollator collator;
    if (!collator.Initialize(alphabet, config)) {
        return false;
    }

    CollatedBatch batch;
    if (!collator.Prepare(MakeRecords({"ACDE", "", "KL"}), batch)) {
        LOG_ERROR() << "testMaskedEmptySequences: prepare failed";
        return false;
    }

    // The empty row is gone from all three tensors
    if (batch.Src.Rows() != 2 || batch.Target.Rows() != 2 || batch.Mask.Rows() != 2) {
        LOG_ERROR() << "testMaskedEmptySequences: src/target/mask out of sync";
        return false;
    }
    if (RowString(alphabet, batch.Target, 1) != "KL--") {
        LOG_ERROR() << "testMaskedEmptySequences: wrong surviving row";
        return false;
    }

    if (collator.Prepare(MakeRecords({"", ""}), batch) || collator.GetLastError() != BatchError::EmptyBatch) {
        LOG_ERROR() << "testMaskedEmptySequences: expected EmptyBatch";
        return false;
    }

    LOG_INFO() << "testMaskedEmptySequences: passed";
    return true;
}

bool testMaskedSeed() {
    Alphabet alphabet;
    CollatorConfig config;
    config.Kind = CollatorKind::Masked;
    config.Seed = 99;

    BatchCollator a, b;
    if (!a.Initialize(alphabet, config) || !b.Initialize(alphabet, config)) {
        return false;
    }

    const std::vector<SequenceRecord> records = MakeRecords({"MKTAYIAKQRQISFVKSHFSRQ", "ACDEFGHIKLMNPQRSTVWY"});
    for (int i = 0; i < 5; ++i) {
        CollatedBatch x, y;
        if (!a.Prepare(records, x) || !b.Prepare(records, y) ||
            x.Src.Data != y.Src.Data || x.Mask.Data != y.Mask.Data) {
            LOG_ERROR() << "testMaskedSeed: same seed diverged at batch " << i;
            return false;
        }
    }

    LOG_INFO() << "testMaskedSeed: passed";
    return true;
}

bool testMissingControlSymbols() {
    Alphabet trr(SEQBATCH_TRR_ALPHABET);
    BatchCollator collator;

    CollatorConfig config;
    config.Kind = CollatorKind::NextToken;
    if (collator.Initialize(trr, config) || collator.GetLastError() != BatchError::InvalidArgument) {
        LOG_ERROR() << "testMissingControlSymbols: next_token accepted an alphabet without START";
        return false;
    }

    config.Kind = CollatorKind::Masked;
    if (collator.Initialize(trr, config)) {
        LOG_ERROR() << "testMissingControlSymbols: masked accepted an alphabet without MASK";
        return false;
    }

    config.Kind = CollatorKind::Simple;
    CollatedBatch batch;
    if (!collator.Initialize(trr, config) || !collator.Prepare(MakeRecords({"ARN", "D"}), batch) ||
        batch.TensorCount != 1 || batch.Src.Shape != std::vector<uint32_t>({2, 3})) {
        LOG_ERROR() << "testMissingControlSymbols: simple collator failed on trRosetta alphabet";
        return false;
    }

    LOG_INFO() << "testMissingControlSymbols: passed";
    return true;
}

int main() {
    if (!testSimplePadding()) {
        LOG_ERROR() << "testSimplePadding failed";
        return -1;
    }

    if (!testPadIdempotence()) {
        LOG_ERROR() << "testPadIdempotence failed";
        return -1;
    }

    if (!testNextToken()) {
        LOG_ERROR() << "testNextToken failed";
        return -1;
    }

    if (!testAncestor()) {
        LOG_ERROR() << "testAncestor failed";
        return -1;
    }

    if (!testMaskedPolicy()) {
        LOG_ERROR() << "testMaskedPolicy failed";
        return -1;
    }

    if (!testMaskedBranches()) {
        LOG_ERROR() << "testMaskedBranches failed";
        return -1;
    }

    if (!testMaskedEmptySequences()) {
        LOG_ERROR() << "testMaskedEmptySequences failed";
        return -1;
    }

    if (!testMaskedSeed()) {
        LOG_ERROR() << "testMaskedSeed failed";
        return -1;
    }

    if (!testMissingControlSymbols()) {
        LOG_ERROR() << "testMissingControlSymbols failed";
        return -1;
    }

    LOG_INFO() << "All tests passed";
    return 0;
}
