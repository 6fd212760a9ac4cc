// file UniqueCopy.cpp
#include "UniqueCopy/UniqueCopy.hpp"

#include "FileCopier/FileCopier.hpp"
#include "FileHasher/FileHasher.hpp"
#include "TimestampProvider/TimestampProvider.hpp"
#include "UniqueNamer/UniqueNamer.hpp"

#include <system_error>

namespace
{

void ReportProgress(const CopyConfig& config, const char* stage, const fs::path& destination, std::uintmax_t bytes)
{
    if (nullptr != config.onProgress)
    {
        config.onProgress({stage, config.sourceFile, destination, bytes});
    }
}

} // namespace

CopyOutcome RunUniqueCopy(const CopyConfig& config)
{
    const FileHasher fileHasher;
    const TimestampProvider timestampProvider;
    const UniqueNamer uniqueNamer;
    const FileCopier fileCopier;

    CopyOutcome outcome;

    ReportProgress(config, "hashing", fs::path(), 0);
    std::error_code ec;
    if (false == fileHasher.Compute(config.sourceFile, outcome.fingerprint, ec))
    {
        outcome.kind = CopyErrorKind::Read;
        outcome.message = "Error reading " + config.sourceFile.string() + ": " + ec.message();
        return outcome;
    }
    ReportProgress(config, "hashed", fs::path(), 0);

    outcome.timestamp = timestampProvider.Now();

    ReportProgress(config, "naming", fs::path(), 0);
    std::string namingError;
    if (false == uniqueNamer.Build(config.sourceFile, outcome.timestamp, outcome.fingerprint, outcome.destination, namingError))
    {
        outcome.kind = CopyErrorKind::Naming;
        outcome.message = namingError;
        return outcome;
    }

    const fs::path destination(outcome.destination);
    ReportProgress(config, "copying", destination, 0);
    if (false == fileCopier.Copy(config.sourceFile, destination, outcome.bytesCopied, ec))
    {
        outcome.kind = CopyErrorKind::Copy;
        outcome.message = ec.message();
        return outcome;
    }
    ReportProgress(config, "copied", destination, outcome.bytesCopied);

    return outcome;
}
