#include "alphabet.hpp"

#include "tools.hpp"


//------------------------------------------------------------------------------
// Alphabet

Alphabet::Alphabet()
    : Alphabet(SEQBATCH_PROTEIN_ALPHABET)
{
}

Alphabet::Alphabet(const std::string& symbols)
    : symbols_(symbols)
{
    for (int i = 0; i < 256; ++i) {
        ids_[i] = -1;
    }

    is_valid_ = !symbols_.empty();

    const int32_t count = static_cast<int32_t>( symbols_.size() );
    for (int32_t i = 0; i < count; ++i) {
        const uint8_t symbol = static_cast<uint8_t>(symbols_[i]);
        if (ids_[symbol] >= 0) {
            LOG_ERROR() << "Alphabet: repeated symbol '" << symbols_[i] << "'";
            is_valid_ = false;
            continue;
        }
        ids_[symbol] = i;
    }
}

bool Alphabet::Tokenize(const std::string& sequence, std::vector<int32_t>& tokens_out) const
{
    tokens_out.reserve(tokens_out.size() + sequence.size());

    for (char symbol : sequence) {
        const int32_t id = GetId(symbol);
        if (id < 0) {
            LOG_ERROR() << "Alphabet: unknown symbol '" << symbol << "' in sequence of length " << sequence.size();
            return false;
        }
        tokens_out.push_back(id);
    }

    return true;
}

bool Alphabet::Untokenize(const int32_t* tokens, uint32_t count, std::string& sequence_out) const
{
    sequence_out.clear();
    sequence_out.reserve(count);

    const int32_t size = static_cast<int32_t>( symbols_.size() );
    for (uint32_t i = 0; i < count; ++i) {
        const int32_t id = tokens[i];
        if (id < 0 || id >= size) {
            LOG_ERROR() << "Alphabet: token id " << id << " out of range";
            return false;
        }
        sequence_out.push_back(symbols_[id]);
    }

    return true;
}
