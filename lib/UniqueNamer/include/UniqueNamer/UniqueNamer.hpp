#pragma once

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief Builds the name of a fingerprinted copy.
 *
 * For example `foo.jpg` becomes `foo.<timestamp>.<fingerprint>.jpg` and
 * `bar` becomes `bar.<timestamp>.<fingerprint>`.
 */
class UniqueNamer
{
  public:
    static constexpr const char* NoFilenameMessage = "no filename";
    static constexpr const char* NotAFileMessage = "operand is not a file";

    /**
     * @brief Construct the destination filename for a source file.
     *
     * The timestamp and fingerprint are inserted between the stem and the
     * extension. The result is a bare filename without any directory part.
     *
     * @param[in] filePath Source file, must be an existing regular file
     * @param[in] timestamp Timestamp segment
     * @param[in] fingerprint Fingerprint segment
     * @param[out] outputName Constructed filename
     * @param[out] errorMessage NoFilenameMessage or NotAFileMessage on failure
     * @return true on success, false on error
     */
    bool Build(const fs::path& filePath, const std::string& timestamp, const std::string& fingerprint, std::string& outputName,
               std::string& errorMessage) const;
};
