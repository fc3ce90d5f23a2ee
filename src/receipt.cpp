#include "receipt.h"

#include <ctime>
#include <sstream>
#include <stdexcept>

#include "utils.h"

Receipt::Receipt(const std::string& proofUUID, const std::string& proofProvider, bool result) {
    std::time_t now = std::time(nullptr);

    header.uuid = GenerateUUID();
    header.timestamp = static_cast<int64_t>(now);
    header.validationMoment = FormatMoment(now);

    body.proofUUID = proofUUID;
    body.proofProvider = proofProvider;
    body.result = result;
}

json Receipt::Serialize() const {
    return json{{"header",
                 {{"uuid", header.uuid},
                  {"timestamp", header.timestamp},
                  {"validation_moment", header.validationMoment}}},
                {"body",
                 {{"proof_uuid", body.proofUUID},
                  {"proof_provider", body.proofProvider},
                  {"result", body.result}}}};
}

std::string Receipt::ToJsonText() const { return Serialize().dump(4); }

Receipt Receipt::FromJson(const json& serialized) {
    if (!serialized.is_object() || !serialized.contains("header") ||
        !serialized.contains("body")) {
        throw std::runtime_error("Receipt requires header and body sections");
    }

    const json& headerJson = serialized.at("header");
    const json& bodyJson = serialized.at("body");

    Receipt receipt;

    try {
        receipt.header.uuid = headerJson.at("uuid").get<std::string>();
        receipt.header.timestamp = headerJson.at("timestamp").get<int64_t>();
        receipt.header.validationMoment = headerJson.at("validation_moment").get<std::string>();

        receipt.body.proofUUID = bodyJson.at("proof_uuid").get<std::string>();
        receipt.body.proofProvider = bodyJson.at("proof_provider").get<std::string>();
        receipt.body.result = bodyJson.at("result").get<bool>();
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Malformed receipt: ") + e.what());
    }

    return receipt;
}

Receipt Receipt::FromJsonText(const std::string& text) {
    json parsed;
    try {
        parsed = json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Receipt is not valid JSON: ") + e.what());
    }
    return FromJson(parsed);
}

std::string Receipt::ToString() const {
    std::stringstream ss;
    ss << "\n    ----------------------------- VALIDATION RECEIPT -----------------------------\n"
       << "\n    uuid           : " << header.uuid << "\n"
       << "\n    timestamp      : " << header.timestamp << " (" << header.validationMoment << ")\n"
       << "\n    proof-uuid     : " << body.proofUUID
       << "\n    proof-provider : " << body.proofProvider << "\n"
       << "\n    result         : " << (body.result ? "VALID" : "NON VALID") << "\n"
       << "\n    ------------------------------- END OF RECEIPT -------------------------------\n";
    return ss.str();
}

bool operator==(const Receipt& lhs, const Receipt& rhs) {
    const ReceiptHeader& lh = lhs.GetHeader();
    const ReceiptHeader& rh = rhs.GetHeader();
    const ReceiptBody& lb = lhs.GetBody();
    const ReceiptBody& rb = rhs.GetBody();

    return lh.uuid == rh.uuid && lh.timestamp == rh.timestamp &&
           lh.validationMoment == rh.validationMoment && lb.proofUUID == rb.proofUUID &&
           lb.proofProvider == rb.proofProvider && lb.result == rb.result;
}

bool operator!=(const Receipt& lhs, const Receipt& rhs) { return !(lhs == rhs); }

std::ostream& operator<<(std::ostream& os, const Receipt& receipt) {
    return os << receipt.ToString();
}
