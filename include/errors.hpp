#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

class TopPhrasesError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// \brief A filesystem operation on the counter store or working area failed, or the store is corrupt.
class StorageIOError : public TopPhrasesError {
private:
    std::filesystem::path path_;

    static std::string describe(std::string const& what, std::filesystem::path const& path, std::error_code const& ec) {
        std::string msg = what + ": \"" + path.string() + "\"";
        if(ec) msg += " (" + ec.message() + ")";
        return msg;
    }

public:
    explicit StorageIOError(std::string const& what) : TopPhrasesError(what) {
    }

    StorageIOError(std::string const& what, std::filesystem::path const& path, std::error_code const& ec = std::error_code())
        : TopPhrasesError(describe(what, path, ec)), path_(path) {
    }

    std::filesystem::path const& path() const { return path_; }
};

/// \brief Two different phrases produced the same fingerprint.
class DigestCollisionError : public TopPhrasesError {
public:
    using TopPhrasesError::TopPhrasesError;
};

/// \brief The digest computation failed inside the crypto library.
class DigestError : public TopPhrasesError {
public:
    using TopPhrasesError::TopPhrasesError;
};

class InvalidArgumentError : public TopPhrasesError {
public:
    using TopPhrasesError::TopPhrasesError;
};

class InterruptedError : public TopPhrasesError {
public:
    using TopPhrasesError::TopPhrasesError;
};
