#ifndef RECEIPT_H
#define RECEIPT_H

#include <nlohmann/json.hpp>

#include <cstdint>
#include <ostream>
#include <string>

using json = nlohmann::json;

struct ReceiptHeader {
        std::string uuid;              // time based, minted once
        int64_t timestamp{0};          // seconds since the unix epoch
        std::string validationMoment;  // timestamp in human readable form
};

struct ReceiptBody {
        std::string proofUUID;
        std::string proofProvider;  // uuid of the tree that produced the proof
        bool result{false};
};

// Record of one validation event. Replicating a receipt from its
// serialization keeps the original uuid and timestamp.
class Receipt {
    private:
        ReceiptHeader header;
        ReceiptBody body;

        Receipt() = default;

    public:
        Receipt(const std::string& proofUUID, const std::string& proofProvider, bool result);

        const ReceiptHeader& GetHeader() const { return header; }
        const ReceiptBody& GetBody() const { return body; }

        json Serialize() const;

        // sorted keys, 4 space indentation
        std::string ToJsonText() const;

        static Receipt FromJson(const json& serialized);
        static Receipt FromJsonText(const std::string& text);

        std::string ToString() const;
};

bool operator==(const Receipt& lhs, const Receipt& rhs);
bool operator!=(const Receipt& lhs, const Receipt& rhs);

std::ostream& operator<<(std::ostream& os, const Receipt& receipt);

#endif
