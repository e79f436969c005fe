#pragma once

#include <stdexcept>
#include <string>

#include "stowage/error_codes.hpp"

namespace stowage::server
{

    // Base for every failure the upload components report to request handlers.
    class UploadError : public std::runtime_error
    {
    public:
        UploadError(stowage::ErrorCode code, const std::string &message)
            : std::runtime_error(message), code_(code) {}

        stowage::ErrorCode code() const noexcept { return code_; }

    private:
        stowage::ErrorCode code_;
    };

    class StoreError : public UploadError
    {
    public:
        using UploadError::UploadError;
    };

    class ChunkWriterError : public UploadError
    {
    public:
        using UploadError::UploadError;
    };

} // namespace stowage::server
