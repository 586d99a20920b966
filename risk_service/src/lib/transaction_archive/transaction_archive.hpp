#pragma once

#include <string>
#include <vector>

#include <userver/storages/postgres/cluster.hpp>

#include <wallet/transaction.pb.h>

namespace wallet_risk {

// Durable log of observed transactions in PostgreSQL. Failures are logged and
// swallowed: the archive never fails a scoring call.
class TransactionArchive {
public:
    static constexpr int kDefaultHistoryLimit = 100;

    explicit TransactionArchive(userver::storages::postgres::ClusterPtr pg_cluster);
    virtual ~TransactionArchive() = default;

    virtual void SaveTransaction(const wallet::Transaction& tx);

    // Most recent transactions where the address is sender or recipient,
    // newest first.
    virtual std::vector<wallet::Transaction> GetAddressHistory(
        const std::string& address,
        int limit = kDefaultHistoryLimit) const;

private:
    userver::storages::postgres::ClusterPtr pg_cluster_;
};

}  // namespace wallet_risk
