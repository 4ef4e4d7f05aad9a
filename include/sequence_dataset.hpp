#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <memory>


//------------------------------------------------------------------------------
// StructureRecord

/*
    Inter-residue geometry for one sequence of length L, trRosetta style.
    Each map is L x L, row-major.  Entries may be NaN where the geometry is
    undefined (missing atoms, glycine CB, ...).
*/
struct StructureRecord {
    uint32_t Length = 0;

    std::vector<float> Dist;
    std::vector<float> Omega;
    std::vector<float> Theta;
    std::vector<float> Phi;

    // True if all four maps are Length x Length
    bool IsConsistent() const {
        const size_t n = static_cast<size_t>(Length) * Length;
        return Dist.size() == n && Omega.size() == n && Theta.size() == n && Phi.size() == n;
    }
};


//------------------------------------------------------------------------------
// SequenceRecord

struct SequenceRecord {
    std::string Sequence;

    // Only read by the ancestor-conditioned collator
    std::string Ancestor;

    // Null when the dataset has no structure for this sequence
    std::shared_ptr<const StructureRecord> Structure;
};


//------------------------------------------------------------------------------
// SequenceDataset

// Random access to records by dataset index
class SequenceDataset {
public:
    virtual ~SequenceDataset() = default;

    virtual uint32_t GetSize() const = 0;

    // Returns false if the index is out of range or the record cannot be read
    virtual bool GetRecord(uint32_t index, SequenceRecord& record_out) const = 0;
};

// Lengths of every sequence in the dataset, in index order.
// Returns false if any record cannot be read.
bool BuildLengthTable(const SequenceDataset& dataset, std::vector<uint32_t>& lengths_out);


//------------------------------------------------------------------------------
// InMemoryDataset

class InMemoryDataset : public SequenceDataset {
public:
    void AddRecord(SequenceRecord record) {
        records_.push_back(std::move(record));
    }
    void AddSequence(const std::string& sequence) {
        SequenceRecord record;
        record.Sequence = sequence;
        records_.push_back(std::move(record));
    }

    uint32_t GetSize() const override {
        return static_cast<uint32_t>( records_.size() );
    }
    bool GetRecord(uint32_t index, SequenceRecord& record_out) const override;

private:
    std::vector<SequenceRecord> records_;
};
