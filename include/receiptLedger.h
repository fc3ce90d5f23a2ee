#ifndef RECEIPT_LEDGER_H
#define RECEIPT_LEDGER_H

#include <leveldb/db.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config.h"
#include "receipt.h"

// leveldb index of validation receipts keyed by receipt uuid. Entries are
// written once and never replaced.
class ReceiptLedger {
    private:
        std::unique_ptr<leveldb::DB> db;

        static std::string receiptKey(const std::string& uuid);

    public:
        explicit ReceiptLedger(const std::string& path = Config::GetLedgerPath());
        ~ReceiptLedger() = default;

        // prevent copying
        ReceiptLedger(const ReceiptLedger&) = delete;
        ReceiptLedger& operator=(const ReceiptLedger&) = delete;

        // throws when a receipt with the same uuid is already recorded
        void Put(const Receipt& receipt);

        std::optional<Receipt> Get(const std::string& uuid) const;

        // in key order
        std::vector<std::string> ListUUIDs() const;
        int Count() const;
};

#endif
