#pragma once

#include <string>
#include <cstdint>


//------------------------------------------------------------------------------
// MappedFileReader

// Read-only view of a whole file.  Empty files open with GetSize() == 0.
class MappedFileReader {
public:
    ~MappedFileReader() {
        Close();
    }

    bool Open(const std::string& name);
    void Close();
    const char* GetData() const {
        return reinterpret_cast<const char*>(data_);
    }
    size_t GetSize() const {
        return size_;
    }

private:
    const void* data_ = nullptr;
    size_t size_ = 0;
};
