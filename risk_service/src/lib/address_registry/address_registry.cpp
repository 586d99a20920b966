#include "address_registry.hpp"

namespace wallet_risk {

void AddressRegistry::AddToBlacklist(const std::vector<Address>& addresses) {
    blacklist_.insert(addresses.begin(), addresses.end());
}

void AddressRegistry::AddToWhitelist(const std::vector<Address>& addresses) {
    whitelist_.insert(addresses.begin(), addresses.end());
}

bool AddressRegistry::IsBlacklisted(const Address& address) const {
    return blacklist_.count(address) > 0;
}

bool AddressRegistry::IsWhitelisted(const Address& address) const {
    return whitelist_.count(address) > 0;
}

}  // namespace wallet_risk
