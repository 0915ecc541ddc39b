/**
 * Ferry - Random boundary tokens and content digests built on libsodium.
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <string>

namespace ferry::crypto
{

    void ensure_sodium_init();

    // Hex encoding of `byte_count` random bytes.
    std::string random_token(std::size_t byte_count);

    std::string hash_stream(std::istream &input);

    std::string hash_file(const std::filesystem::path &path);

} // namespace ferry::crypto
