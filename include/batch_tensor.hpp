#pragma once

#include <cstdint>
#include <vector>
#include <algorithm>


//------------------------------------------------------------------------------
// BatchTensor

/*
    Dense row-major array handed to the training loop.
    Shape[0] is always the batch dimension.
*/
template<typename T>
struct BatchTensor {
    std::vector<uint32_t> Shape;
    std::vector<T> Data;

    // Resizes and fills every element with value
    void Reset(const std::vector<uint32_t>& shape, T value) {
        Shape = shape;
        size_t count = 1;
        for (uint32_t dim : Shape) {
            count *= dim;
        }
        Data.assign(count, value);
    }

    uint32_t Rows() const { return Shape.empty() ? 0 : Shape[0]; }

    // Elements per row (product of all but the first dimension)
    size_t RowStride() const {
        size_t stride = 1;
        for (size_t i = 1; i < Shape.size(); ++i) {
            stride *= Shape[i];
        }
        return stride;
    }

    T* Row(uint32_t row) { return Data.data() + row * RowStride(); }
    const T* Row(uint32_t row) const { return Data.data() + row * RowStride(); }
};

/*
    Stacks ragged rows into a (rows.size(), longest) tensor, filling the
    tail of shorter rows with pad_value.
*/
template<typename T>
void PadRows(const std::vector<std::vector<T>>& rows, T pad_value, BatchTensor<T>& tensor_out)
{
    size_t max_len = 0;
    for (const auto& row : rows) {
        max_len = std::max(max_len, row.size());
    }

    tensor_out.Reset({ static_cast<uint32_t>( rows.size() ), static_cast<uint32_t>( max_len ) }, pad_value);

    for (size_t i = 0; i < rows.size(); ++i) {
        std::copy(rows[i].begin(), rows[i].end(), tensor_out.Data.begin() + i * max_len);
    }
}
