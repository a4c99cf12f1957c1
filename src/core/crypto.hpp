/**
 * ATL: Atoll Coin Ledger - Cryptographic Module Header
 * Purpose: SHA-256 seals that chain each account's ledger entries together.
 */

#ifndef ATL_CRYPTO_HPP
#define ATL_CRYPTO_HPP

#include <string>
#include "atl_types.hpp"

namespace atl {

class AtlCrypto {
public:
    static std::string generate_sha256(const std::string& str);

    /**
     * calculate_entry_seal
     * Bonds an entry to the previous seal of the same account. The entry's own
     * seal and id are not part of the input, so the seal can be computed
     * before the store assigns an id.
     */
    static std::string calculate_entry_seal(const std::string& prev_seal, const LedgerEntry& entry);
};

} // namespace atl

#endif
