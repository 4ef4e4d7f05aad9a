#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "seqbatch.hpp"


//------------------------------------------------------------------------------
// Alphabet

/*
    Ordered symbol set.  A symbol's position is its token id.

    The control ids are -1 when the alphabet does not carry that symbol,
    which is fine for collators that never emit it (SimpleCollator never
    needs START for example).
*/
class Alphabet {
public:
    Alphabet();
    explicit Alphabet(const std::string& symbols);

    // Returns false on an empty alphabet or repeated symbols
    bool IsValid() const { return is_valid_; }

    const std::string& GetSymbols() const { return symbols_; }
    uint32_t GetSize() const { return static_cast<uint32_t>( symbols_.size() ); }

    // Returns -1 if the symbol is absent
    int32_t GetId(char symbol) const {
        return ids_[static_cast<uint8_t>(symbol)];
    }
    bool Contains(char symbol) const {
        return GetId(symbol) >= 0;
    }

    int32_t PadId() const { return GetId(SEQBATCH_PAD); }
    int32_t StartId() const { return GetId(SEQBATCH_START); }
    int32_t StopId() const { return GetId(SEQBATCH_STOP); }
    int32_t MaskId() const { return GetId(SEQBATCH_MASK); }

    // Appends one id per symbol to tokens_out.
    // Returns false on the first symbol missing from the alphabet.
    bool Tokenize(const std::string& sequence, std::vector<int32_t>& tokens_out) const;

    // Returns false if any id is out of range
    bool Untokenize(const int32_t* tokens, uint32_t count, std::string& sequence_out) const;

private:
    std::string symbols_;
    int32_t ids_[256];
    bool is_valid_ = false;
};
