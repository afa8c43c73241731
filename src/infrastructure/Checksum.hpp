/**
 * @file Checksum.hpp
 * @brief SHA-256 content digests for deduplication and integrity checks.
 */

#pragma once
#include <string>

namespace chartkeeper::infrastructure {

class Checksum {
public:
    /** @brief Lower-case hex SHA-256 of the given bytes. */
    static std::string Sha256(const std::string& data);

    /**
     * @brief Lower-case hex SHA-256 of a file's contents, streamed.
     * @throws domain::StorageIOError if the file cannot be read.
     */
    static std::string Sha256File(const std::string& path);
};

} // namespace chartkeeper::infrastructure
