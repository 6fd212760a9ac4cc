#pragma once

#include <cstdint>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

/**
 * @brief Infrastructure component copying a file's bytes to a new location.
 */
class FileCopier
{
  public:
    /**
     * @brief Copy the full content of source to destination.
     *
     * The destination is created or truncated. A partially written
     * destination is left in place when the copy fails.
     *
     * @param[in] source Existing regular file to read
     * @param[in] destination File to create or overwrite
     * @param[out] bytesCopied Number of bytes written to destination
     * @param[out] errorCode Underlying I/O error when the copy fails
     * @return true on success, false on error
     */
    bool Copy(const fs::path& source, const fs::path& destination, std::uintmax_t& bytesCopied, std::error_code& errorCode) const;
};
