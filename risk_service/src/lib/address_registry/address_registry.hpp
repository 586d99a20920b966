#pragma once

#include <unordered_set>
#include <vector>

#include "risk_types/risk_types.hpp"

namespace wallet_risk {

// Known-bad and known-good addresses. An address may sit in both sets; the
// scorer lets the whitelist halve the blacklist penalty.
class AddressRegistry {
public:
    void AddToBlacklist(const std::vector<Address>& addresses);
    void AddToWhitelist(const std::vector<Address>& addresses);

    bool IsBlacklisted(const Address& address) const;
    bool IsWhitelisted(const Address& address) const;

    size_t BlacklistSize() const { return blacklist_.size(); }
    size_t WhitelistSize() const { return whitelist_.size(); }

private:
    std::unordered_set<Address> blacklist_;
    std::unordered_set<Address> whitelist_;
};

}  // namespace wallet_risk
