#include "receiptLedger.h"

#include <leveldb/iterator.h>
#include <leveldb/write_batch.h>

#include <filesystem>
#include <stdexcept>

#include "utils.h"

ReceiptLedger::ReceiptLedger(const std::string& path) {
    // ensure parent directory exists
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    leveldb::DB* rawDb = nullptr;
    leveldb::Options options;
    options.create_if_missing = true;

    leveldb::Status status = leveldb::DB::Open(options, path, &rawDb);
    if (!status.ok()) {
        throw std::runtime_error("Error opening receipt ledger: " + status.ToString());
    }

    db.reset(rawDb);
}

std::string ReceiptLedger::receiptKey(const std::string& uuid) {
    // prefix for receipts
    return "r" + uuid;
}

void ReceiptLedger::Put(const Receipt& receipt) {
    const std::string& uuid = receipt.GetHeader().uuid;
    std::string key = receiptKey(uuid);

    std::string existing;
    leveldb::Status status = db->Get(leveldb::ReadOptions(), key, &existing);
    if (status.ok()) {
        throw std::runtime_error("Receipt " + uuid + " is already recorded");
    }
    if (!status.IsNotFound()) {
        throw std::runtime_error("Error reading receipt ledger: " + status.ToString());
    }

    std::vector<uint8_t> value = StringToBytes(receipt.ToJsonText());

    leveldb::WriteBatch batch;
    batch.Put(key, ByteArrayToSlice(value));

    status = db->Write(leveldb::WriteOptions(), &batch);
    if (!status.ok()) {
        throw std::runtime_error("Error writing receipt " + uuid + ": " + status.ToString());
    }
}

std::optional<Receipt> ReceiptLedger::Get(const std::string& uuid) const {
    std::string value;
    leveldb::Status status = db->Get(leveldb::ReadOptions(), receiptKey(uuid), &value);

    if (status.IsNotFound()) {
        return std::nullopt;
    }
    if (!status.ok()) {
        throw std::runtime_error("Error reading receipt " + uuid + ": " + status.ToString());
    }

    return Receipt::FromJsonText(value);
}

std::vector<std::string> ReceiptLedger::ListUUIDs() const {
    std::vector<std::string> uuids;

    std::unique_ptr<leveldb::Iterator> it(db->NewIterator(leveldb::ReadOptions()));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        std::string key = it->key().ToString();

        // only receipt entries
        if (!key.empty() && key[0] == 'r') {
            uuids.push_back(key.substr(1));
        }
    }

    if (!it->status().ok()) {
        throw std::runtime_error("Error iterating receipt ledger: " + it->status().ToString());
    }

    return uuids;
}

int ReceiptLedger::Count() const { return static_cast<int>(ListUUIDs().size()); }
