#include "mapped_file.hpp"

#include "tools.hpp"

#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>


//------------------------------------------------------------------------------
// MappedFileReader

bool MappedFileReader::Open(const std::string& name) {
    Close();

    int fd = open(name.c_str(), O_RDONLY);
    if (fd == -1) {
        LOG_ERROR() << "MappedFileReader: Failed to open file: " << name;
        return false;
    }

    struct stat sb;
    if (fstat(fd, &sb) == -1) {
        LOG_ERROR() << "MappedFileReader: Failed to stat file: " << name;
        close(fd);
        return false;
    }

    size_ = sb.st_size;
    if (size_ == 0) {
        close(fd);
        return true;
    }

    void* data = mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd, 0);

    // The mapping stays valid after the descriptor is closed
    close(fd);

    if (data == MAP_FAILED) {
        LOG_ERROR() << "MappedFileReader: Failed to map file: " << name;
        size_ = 0;
        return false;
    }

    data_ = data;
    return true;
}

void MappedFileReader::Close() {
    if (data_) {
        munmap((void*)data_, size_);
        data_ = nullptr;
    }
    size_ = 0;
}
