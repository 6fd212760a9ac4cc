#include "FileCopier/FileCopier.hpp"

bool FileCopier::Copy(const fs::path& source, const fs::path& destination, std::uintmax_t& bytesCopied, std::error_code& errorCode) const
{
    errorCode.clear();
    bytesCopied = 0;

    fs::copy_file(source, destination, fs::copy_options::overwrite_existing, errorCode);
    if (errorCode)
    {
        return false;
    }

    const std::uintmax_t destinationSize = fs::file_size(destination, errorCode);
    if (errorCode)
    {
        return false;
    }

    bytesCopied = destinationSize;
    return true;
}
