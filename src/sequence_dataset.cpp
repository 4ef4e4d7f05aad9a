#include "sequence_dataset.hpp"

#include "tools.hpp"


//------------------------------------------------------------------------------
// SequenceDataset

bool BuildLengthTable(const SequenceDataset& dataset, std::vector<uint32_t>& lengths_out)
{
    const uint32_t count = dataset.GetSize();
    lengths_out.clear();
    lengths_out.reserve(count);

    SequenceRecord record;
    for (uint32_t i = 0; i < count; ++i) {
        if (!dataset.GetRecord(i, record)) {
            LOG_ERROR() << "BuildLengthTable: failed to read record " << i;
            return false;
        }
        lengths_out.push_back(static_cast<uint32_t>( record.Sequence.size() ));
    }

    return true;
}


//------------------------------------------------------------------------------
// InMemoryDataset

bool InMemoryDataset::GetRecord(uint32_t index, SequenceRecord& record_out) const
{
    if (index >= records_.size()) {
        LOG_ERROR() << "InMemoryDataset: index " << index << " out of range for " << records_.size() << " records";
        return false;
    }
    record_out = records_[index];
    return true;
}
