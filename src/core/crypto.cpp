#include "crypto.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace atl {

std::string AtlCrypto::generate_sha256(const std::string& str) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;

    EVP_MD_CTX* context = EVP_MD_CTX_new();
    if (context == nullptr) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    bool ok = EVP_DigestInit_ex(context, EVP_sha256(), nullptr) == 1
        && EVP_DigestUpdate(context, str.data(), str.size()) == 1
        && EVP_DigestFinal_ex(context, hash, &length) == 1;
    EVP_MD_CTX_free(context);
    if (!ok) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < length; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
    }
    return ss.str();
}

std::string AtlCrypto::calculate_entry_seal(const std::string& prev_seal, const LedgerEntry& entry) {
    std::stringstream data;
    data << prev_seal << '|'
         << entry.account_id << '|'
         << entry.delta << '|'
         << to_string(entry.reason) << '|';
    if (entry.reference) {
        data << to_string(entry.reference->kind) << ':' << entry.reference->id;
    }
    data << '|' << entry.description << '|' << entry.created_at;

    return generate_sha256(data.str());
}

} // namespace atl
