#include "transaction_archive.hpp"

#include <string_view>

#include <userver/logging/log.hpp>

#include "proto_conversions/proto_conversions.hpp"

namespace wallet_risk {

namespace {

std::string_view CategoryToString(wallet::Transaction::Category category) {
    return ToString(proto::FromProto(category));
}

wallet::Transaction::Category StringToCategory(const std::string& str) {
    if (str == "receive") return wallet::Transaction::RECEIVE;
    if (str == "contract") return wallet::Transaction::CONTRACT;
    if (str == "approval") return wallet::Transaction::APPROVAL;
    return wallet::Transaction::SEND;
}

}  // namespace

TransactionArchive::TransactionArchive(userver::storages::postgres::ClusterPtr pg_cluster)
    : pg_cluster_(std::move(pg_cluster)) {}

void TransactionArchive::SaveTransaction(const wallet::Transaction& tx) {
    try {
        LOG_DEBUG() << "SaveTransaction: executing INSERT for transaction " << tx.transaction_id();

        // Amounts and timestamps are stored as NUMERIC text to keep the full u64 range.
        pg_cluster_->Execute(
            userver::storages::postgres::ClusterHostType::kMaster,
            "INSERT INTO wallet_transactions "
            "(transaction_id, sender, recipient, amount, category, timestamp_ms, failed) "
            "VALUES ($1, $2, $3, $4::numeric, $5::transaction_category, $6::numeric, $7) "
            "ON CONFLICT (transaction_id) DO NOTHING",
            tx.transaction_id(),
            tx.sender(),
            tx.recipient(),
            std::to_string(tx.amount()),
            std::string(CategoryToString(tx.category())),
            std::to_string(tx.timestamp_ms()),
            tx.status() == wallet::Transaction::FAILED);

        LOG_INFO() << "Archived transaction " << tx.transaction_id() << " from " << tx.sender();
    } catch (const std::exception& e) {
        LOG_ERROR() << "Failed to archive transaction " << tx.transaction_id() << ": " << e.what();
    }
}

std::vector<wallet::Transaction> TransactionArchive::GetAddressHistory(
    const std::string& address,
    int limit) const {
    std::vector<wallet::Transaction> history;
    if (limit <= 0) {
        limit = kDefaultHistoryLimit;
    }
    try {
        auto result = pg_cluster_->Execute(
            userver::storages::postgres::ClusterHostType::kSlave,
            "SELECT transaction_id, sender, recipient, amount::text AS amount, "
            "category::text AS category, timestamp_ms::text AS timestamp_ms, failed "
            "FROM wallet_transactions "
            "WHERE sender = $1 OR recipient = $1 "
            "ORDER BY timestamp_ms DESC "
            "LIMIT $2",
            address,
            limit);

        for (const auto& row : result) {
            wallet::Transaction tx;
            tx.set_transaction_id(row["transaction_id"].As<std::string>());
            tx.set_sender(row["sender"].As<std::string>());
            tx.set_recipient(row["recipient"].As<std::string>());
            tx.set_amount(std::stoull(row["amount"].As<std::string>()));
            tx.set_category(StringToCategory(row["category"].As<std::string>()));
            tx.set_timestamp_ms(std::stoull(row["timestamp_ms"].As<std::string>()));
            tx.set_status(row["failed"].As<bool>() ? wallet::Transaction::FAILED : wallet::Transaction::SUCCEEDED);
            history.push_back(std::move(tx));
        }

        LOG_INFO() << "Retrieved " << history.size() << " archived transactions for " << address;
    } catch (const std::exception& e) {
        LOG_ERROR() << "Failed to read transaction archive for " << address << ": " << e.what();
    }
    return history;
}

}  // namespace wallet_risk
