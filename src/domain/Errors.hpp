/**
 * @file Errors.hpp
 * @brief Error taxonomy shared by the storage engine, collaborators and reconcilers.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace chartkeeper::domain {

/**
 * @class Error
 * @brief Base of every failure a reconciliation pass converts into a condition.
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** @brief Disk, permission or rename failure inside the storage root. */
class StorageIOError : public Error {
public:
    using Error::Error;
};

/**
 * @class CredentialError
 * @brief The referenced secret is missing or cannot be turned into fetch options.
 */
class CredentialError : public Error {
public:
    enum class Kind {
        NotFound,
        Malformed
    };

    CredentialError(Kind kind, const std::string& message)
        : Error(message), m_kind(kind) {}

    Kind kind() const { return m_kind; }

private:
    Kind m_kind;
};

/**
 * @class TransportError
 * @brief Failure to retrieve remote bytes.
 *
 * InvalidURL and UnsupportedScheme cannot succeed until the spec changes;
 * TLSError and NetworkError (timeouts included) are retried.
 */
class TransportError : public Error {
public:
    enum class Kind {
        InvalidURL,
        UnsupportedScheme,
        TLSError,
        NetworkError
    };

    TransportError(Kind kind, const std::string& message)
        : Error(message), m_kind(kind) {}

    Kind kind() const { return m_kind; }

    bool isRetryable() const {
        return m_kind == Kind::TLSError || m_kind == Kind::NetworkError;
    }

private:
    Kind m_kind;
};

/** @brief Fetched index is empty or unparseable, or the requested entry is missing. */
class ContentError : public Error {
public:
    using Error::Error;
};

} // namespace chartkeeper::domain
