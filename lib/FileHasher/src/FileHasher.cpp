#include "FileHasher/FileHasher.hpp"

#include <array>
#include <cerrno>
#include <cstdint>
#include <fstream>
#include <memory>

#include <openssl/evp.h>

namespace
{
constexpr std::size_t FileReadBufferSize = 8192;

struct DigestContextDeleter
{
    void operator()(EVP_MD_CTX* context) const
    {
        EVP_MD_CTX_free(context);
    }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

std::string HexEncode(const unsigned char* data, unsigned int length)
{
    static constexpr char HexDigits[] = "0123456789abcdef";
    std::string output;
    output.reserve(static_cast<std::size_t>(length) * 2);
    for (unsigned int index = 0; index < length; ++index)
    {
        output.push_back(HexDigits[(data[index] >> 4) & 0x0F]);
        output.push_back(HexDigits[data[index] & 0x0F]);
    }
    return output;
}

DigestContext CreateMd5Context()
{
    DigestContext context(EVP_MD_CTX_new());
    if ((nullptr != context) && (1 != EVP_DigestInit_ex(context.get(), EVP_md5(), nullptr)))
    {
        context.reset();
    }
    return context;
}

bool FinalizeDigest(EVP_MD_CTX* context, std::string& outputHash)
{
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digestLength = 0;
    if (1 != EVP_DigestFinal_ex(context, digest.data(), &digestLength))
    {
        return false;
    }
    outputHash = HexEncode(digest.data(), digestLength);
    return true;
}

// Best effort: iostreams do not guarantee errno survives a failed operation,
// so io_error stands in when nothing was recorded.
std::error_code LastIoError()
{
    if (0 != errno)
    {
        return std::error_code(errno, std::generic_category());
    }
    return std::make_error_code(std::errc::io_error);
}
} // namespace

bool FileHasher::Compute(const fs::path& filePath, std::string& outputHash, std::error_code& errorCode) const
{
    errorCode.clear();

    // Opening a directory succeeds on POSIX; report it the way read(2) would.
    std::error_code statusError;
    if (true == fs::is_directory(filePath, statusError))
    {
        errorCode = std::make_error_code(std::errc::is_a_directory);
        return false;
    }

    errno = 0;
    std::ifstream inputStream(filePath, std::ios::binary);
    if (false == inputStream.is_open())
    {
        errorCode = LastIoError();
        return false;
    }

    DigestContext context = CreateMd5Context();
    if (nullptr == context)
    {
        errorCode = std::make_error_code(std::errc::not_enough_memory);
        return false;
    }

    char buffer[FileReadBufferSize];
    const std::streamsize bufferSize = static_cast<std::streamsize>(sizeof(buffer));
    while (true)
    {
        errno = 0;
        inputStream.read(buffer, bufferSize);
        const std::streamsize bytesRead = inputStream.gcount();
        if (true == inputStream.bad())
        {
            errorCode = LastIoError();
            return false;
        }
        if (0 < bytesRead)
        {
            if (1 != EVP_DigestUpdate(context.get(), buffer, static_cast<std::size_t>(bytesRead)))
            {
                errorCode = std::make_error_code(std::errc::io_error);
                return false;
            }
        }
        if (bufferSize > bytesRead)
        {
            break;
        }
    }

    if (false == inputStream.eof())
    {
        errorCode = LastIoError();
        return false;
    }

    if (false == FinalizeDigest(context.get(), outputHash))
    {
        errorCode = std::make_error_code(std::errc::io_error);
        return false;
    }
    return true;
}

bool FileHasher::ComputeBytes(const std::string& bytes, std::string& outputHash) const
{
    DigestContext context = CreateMd5Context();
    if (nullptr == context)
    {
        return false;
    }

    if ((false == bytes.empty()) && (1 != EVP_DigestUpdate(context.get(), bytes.data(), bytes.size())))
    {
        return false;
    }

    return FinalizeDigest(context.get(), outputHash);
}
