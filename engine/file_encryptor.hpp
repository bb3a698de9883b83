#pragma once

// ============================================================
// file_encryptor.hpp -- At-rest transform for downloaded files
// ============================================================

#include "../common/platform.hpp"
#include <vector>

// decrypt(encrypt(x)) must equal x. Implementations throw
// std::runtime_error when the transform cannot be applied.
class FileEncryptor {
public:
    virtual ~FileEncryptor() = default;

    virtual std::vector<u8> encrypt(const std::vector<u8>& plain) = 0;
    virtual std::vector<u8> decrypt(const std::vector<u8>& cipher) = 0;
};
