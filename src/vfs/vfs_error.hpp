#pragma once

#include "core/result.hpp"

#include <string>

namespace tvfs::vfs {

/// Codes carried in Error::code by VFS operations.
enum class Errc : int {
    InvalidSource = 400,
    NotFound = 404,
    MissingDirectory = 409,
    InvalidFilename = 422,
    InvalidPattern = 423,
    LoadFailed = 500,
};

inline Error make_error(Errc code, std::string message) {
    return Error(std::move(message), static_cast<int>(code));
}

inline bool has_code(const Error& err, Errc code) {
    return err.code == static_cast<int>(code);
}

} // namespace tvfs::vfs
