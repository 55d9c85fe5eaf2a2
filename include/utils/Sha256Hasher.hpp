#pragma once

#include <string>
#include <string_view>

#include <openssl/evp.h>

// Incremental SHA-256 over OpenSSL's EVP interface.
class Sha256Hasher {
public:
    Sha256Hasher();
    ~Sha256Hasher();

    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;

    void Update(std::string_view data);

    // Raw 32-byte digest. May be called once; later Update calls throw.
    std::string Finalize();
    bool IsFinalized() const;

private:
    EVP_MD_CTX* context;
    bool finalized = false;
};
