// file UniqueCopy.hpp:

#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief Failure classes of a unique copy, each with its own exit status.
 */
enum class CopyErrorKind
{
    None,   /**< Copy completed */
    Usage,  /**< Wrong command-line arguments */
    Read,   /**< Source could not be read or hashed */
    Naming, /**< Source is not a regular file or has no filename */
    Copy    /**< Destination could not be written */
};

/**
 * @brief Convert a CopyErrorKind enumeration value to its string representation.
 *
 * @param[in] errorKind The error kind to convert
 * @return String representation of the error kind
 */
inline const char* CopyErrorKindToString(CopyErrorKind errorKind)
{
    switch (errorKind)
    {
    case CopyErrorKind::None:
        return "None";
    case CopyErrorKind::Usage:
        return "Usage";
    case CopyErrorKind::Read:
        return "Read";
    case CopyErrorKind::Naming:
        return "Naming";
    case CopyErrorKind::Copy:
        return "Copy";
    }
    return "Unknown";
}

/**
 * @brief Map a CopyErrorKind to the process exit status reported for it.
 *
 * @param[in] errorKind The error kind to map
 * @return 0 for None, 1 to 4 for the failure classes
 */
inline int CopyErrorKindToExitCode(CopyErrorKind errorKind)
{
    switch (errorKind)
    {
    case CopyErrorKind::None:
        return 0;
    case CopyErrorKind::Usage:
        return 1;
    case CopyErrorKind::Read:
        return 2;
    case CopyErrorKind::Naming:
        return 3;
    case CopyErrorKind::Copy:
        return 4;
    }
    return 1;
}

/**
 * @brief Progress information for a unique copy.
 */
struct CopyProgress
{
    const char* stage;          /**< Pipeline stage: hashing, hashed, naming, copying, copied */
    fs::path source;            /**< Source file */
    fs::path destination;       /**< Destination file, empty until named */
    std::uintmax_t bytes;       /**< Bytes copied, set on the copied stage */
};

/**
 * @brief Configuration parameters for a unique copy.
 */
struct CopyConfig
{
    fs::path sourceFile;        /**< File to copy */

    bool verbose;               /**< Enable verbose stage output */

    std::function<void(const CopyProgress&)> onProgress;  /**< Optional callback for progress notifications */

    /**
     * @brief Initialize configuration with default values.
     */
    CopyConfig()
        : verbose(false)
        , onProgress(nullptr)
    {
    }
};

/**
 * @brief Result of a unique copy.
 */
struct CopyOutcome
{
    CopyErrorKind kind;         /**< None on success, failure class otherwise */
    std::string message;        /**< Error text, empty on success */
    std::string fingerprint;    /**< MD5 of the source, set once hashed */
    std::string timestamp;      /**< Local timestamp used in the name */
    std::string destination;    /**< Destination filename, set once named */
    std::uintmax_t bytesCopied; /**< Bytes written to the destination */

    CopyOutcome()
        : kind(CopyErrorKind::None)
        , bytesCopied(0)
    {
    }
};

/**
 * @brief Copy a file to a name carrying its timestamp and MD5 fingerprint.
 *
 * Hashes the source, takes a local timestamp, builds the new name and copies
 * the file into the current working directory. The first failing step ends
 * the run; a partially written destination is not removed.
 *
 * @param[in] configuration Configuration parameters for the copy
 * @return Outcome tagged with the failure class, CopyErrorKind::None on success
 */
CopyOutcome RunUniqueCopy(const CopyConfig& configuration);
