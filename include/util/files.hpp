#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace es::util {

// Write `contents` to a sibling temp file, fsync it, rename it over `target`
// and fsync the parent directory. Throws std::system_error.
void writeFileAtomic(const std::filesystem::path& target, std::string_view contents);

// Throws std::system_error.
std::string readFile(const std::filesystem::path& path);

// pread() exactly `len` bytes at `offset` into `out`. Returns false on a short read.
// Throws std::system_error on I/O errors.
bool readExactAt(const std::filesystem::path& path, uint64_t offset, size_t len, std::string& out);

}
