#include "utils/Sha256Hasher.hpp"

#include <stdexcept>

Sha256Hasher::Sha256Hasher() : context(EVP_MD_CTX_new()) {
    if (context == nullptr) {
        throw std::runtime_error("Failed to allocate digest context");
    }
    if (EVP_DigestInit_ex(context, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(context);
        throw std::runtime_error("Failed to initialise SHA-256");
    }
}

Sha256Hasher::~Sha256Hasher() {
    EVP_MD_CTX_free(context);
}

void Sha256Hasher::Update(std::string_view data) {
    if (finalized) {
        throw std::runtime_error("SHA-256 already finalized");
    }
    if (data.empty()) {
        return;
    }
    if (EVP_DigestUpdate(context, data.data(), data.size()) != 1) {
        throw std::runtime_error("SHA-256 update failed");
    }
}

std::string Sha256Hasher::Finalize() {
    if (finalized) {
        throw std::runtime_error("SHA-256 already finalized");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(context, digest, &length) != 1) {
        throw std::runtime_error("SHA-256 finalization failed");
    }
    finalized = true;

    return std::string(reinterpret_cast<char*>(digest), length);
}

bool Sha256Hasher::IsFinalized() const {
    return finalized;
}
