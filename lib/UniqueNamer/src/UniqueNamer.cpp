#include "UniqueNamer/UniqueNamer.hpp"

#include <system_error>

bool UniqueNamer::Build(const fs::path& filePath, const std::string& timestamp, const std::string& fingerprint, std::string& outputName,
                        std::string& errorMessage) const
{
    const fs::path fileName = filePath.filename();
    if ((true == fileName.empty()) || (fileName == ".") || (fileName == ".."))
    {
        errorMessage = NoFilenameMessage;
        return false;
    }

    std::error_code ec;
    if (false == fs::is_regular_file(filePath, ec))
    {
        errorMessage = NotAFileMessage;
        return false;
    }

    std::string name = fileName.stem().string();
    name += ".";
    name += timestamp;
    name += ".";
    name += fingerprint;

    // extension() keeps the leading dot; a name ending in '.' yields "." alone.
    const std::string extension = fileName.extension().string();
    if (false == extension.empty())
    {
        name += extension;
    }

    outputName = name;
    return true;
}
