#pragma once

#include <filesystem>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

/**
 * @brief Infrastructure component for fingerprinting files with MD5.
 *
 * The digest is not cryptographically secure. It is a content signature for
 * naming copies, not a tamper check.
 */
class FileHasher
{
  public:
    /**
     * @brief Compute the MD5 fingerprint of the specified file.
     *
     * The file is streamed in fixed-size chunks, so memory use does not grow
     * with the file size.
     *
     * @param[in] filePath Path to the file to hash
     * @param[out] outputHash 32 character lowercase hex digest
     * @param[out] errorCode Underlying I/O error when hashing fails
     * @return true on success, false on error
     */
    bool Compute(const fs::path& filePath, std::string& outputHash, std::error_code& errorCode) const;

    /**
     * @brief Compute the MD5 fingerprint of an in-memory byte sequence.
     *
     * @param[in] bytes Bytes to hash
     * @param[out] outputHash 32 character lowercase hex digest
     * @return true on success, false if the digest could not be computed
     */
    bool ComputeBytes(const std::string& bytes, std::string& outputHash) const;
};
