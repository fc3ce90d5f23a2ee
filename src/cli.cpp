#include "cli.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "config.h"
#include "encoding.h"
#include "hashEngine.h"
#include "merkleProof.h"
#include "receipt.h"
#include "receiptLedger.h"
#include "validation.h"

static std::string readFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open " + path);
    }

    std::stringstream ss;
    ss << file.rdbuf();
    if (!file && !file.eof()) {
        throw std::runtime_error("Failed to read " + path);
    }
    return ss.str();
}

void CLI::printUsage() {
    std::cout << "Usage:\n";
    std::cout << "  hash -data TEXT [-algorithm ALGO] [-encoding ENC] [-nosecurity] - Print the "
                 "leaf digest of TEXT\n";
    std::cout << "  validate -proof FILE -target DIGEST [-save] [-savedir DIR] [-ledger] - "
                 "Validate the proof in FILE against DIGEST and print the receipt\n";
    std::cout << "  showproof -proof FILE - Print the proof stored in FILE\n";
    std::cout << "  showreceipt -file FILE - Print the receipt stored in FILE\n";
    std::cout << "  getreceipt -uuid UUID - Print a receipt recorded in the ledger\n";
    std::cout << "  listreceipts - List the uuids of all receipts in the ledger\n";
    std::cout << "\nGlobal flags:\n";
    std::cout << "  -datadir DIR - Set the data directory (default: ./data)\n";
}

void CLI::hash(const std::string& data, const std::string& algorithm,
               const std::string& encoding, bool security) {
    HashEngine engine(algorithm, encoding, security);
    std::cout << DecodeText(engine.HashEntry(data), engine.GetEncoding()) << std::endl;
}

bool CLI::validate(const std::string& proofPath, const std::string& target,
                   const std::string& saveDir, bool useLedger) {
    MerkleProof proof = MerkleProof::FromJsonText(readFile(proofPath));

    // the target is compared in the encoding the proof declares
    std::vector<uint8_t> targetBytes = EncodeText(target, proof.header.params.encoding);

    Receipt receipt = ValidationReceipt(targetBytes, proof);
    std::cout << receipt;

    if (!saveDir.empty()) {
        std::filesystem::create_directories(saveDir);
        std::string written = StoreReceipt(receipt, saveDir);
        std::cout << "[receipt] Saved to " << written << std::endl;
    }

    if (useLedger) {
        ReceiptLedger ledger;
        ledger.Put(receipt);
        std::cout << "[ledger] Recorded receipt " << receipt.GetHeader().uuid << std::endl;
    }

    return receipt.GetBody().result;
}

void CLI::showProof(const std::string& proofPath) {
    std::cout << MerkleProof::FromJsonText(readFile(proofPath));
}

void CLI::showReceipt(const std::string& receiptPath) {
    std::cout << Receipt::FromJsonText(readFile(receiptPath));
}

void CLI::getReceipt(const std::string& uuid) {
    ReceiptLedger ledger;
    std::optional<Receipt> receipt = ledger.Get(uuid);

    if (!receipt) {
        throw std::runtime_error("No receipt " + uuid + " in the ledger");
    }

    std::cout << *receipt;
}

void CLI::listReceipts() {
    ReceiptLedger ledger;
    std::vector<std::string> uuids = ledger.ListUUIDs();

    if (uuids.empty()) {
        std::cout << "No receipts recorded. Validate with 'validate ... -ledger' first."
                  << std::endl;
        return;
    }

    std::cout << "Receipts:" << std::endl;
    for (const std::string& uuid : uuids) {
        std::cout << "  " << uuid << std::endl;
    }
}

int CLI::run(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage();
        return 1;
    }

    // parse global -datadir flag
    int cmdStart = 1;
    if (std::string(argv[1]) == "-datadir") {
        if (argc < 4) {
            std::cout << "Error: -datadir requires a value\n";
            printUsage();
            return 1;
        }
        Config::SetDataDir(argv[2]);
        cmdStart = 3;
    }

    if (cmdStart >= argc) {
        printUsage();
        return 1;
    }

    // shift argv
    int cmdArgc = argc - cmdStart;
    char** cmdArgv = argv + cmdStart;

    std::string command = cmdArgv[0];

    // switches take no value, every other flag takes exactly one
    std::map<std::string, std::string> flags;
    for (int i = 1; i < cmdArgc; i++) {
        std::string flag = cmdArgv[i];
        if (flag == "-nosecurity" || flag == "-save" || flag == "-ledger") {
            flags[flag] = "";
        } else if (i + 1 < cmdArgc) {
            flags[flag] = cmdArgv[++i];
        } else {
            std::cout << "Error: flag " << flag << " requires a value\n";
            printUsage();
            return 1;
        }
    }

    if (command == "hash") {
        if (!flags.count("-data")) {
            std::cout << "Error: hash requires -data flag\n";
            printUsage();
            return 1;
        }
        std::string algorithm =
            flags.count("-algorithm") ? flags["-algorithm"] : Defaults::ALGORITHM;
        std::string encoding =
            flags.count("-encoding") ? flags["-encoding"] : Defaults::ENCODING;
        hash(flags["-data"], algorithm, encoding, !flags.count("-nosecurity"));
    } else if (command == "validate") {
        if (!flags.count("-proof") || !flags.count("-target")) {
            std::cout << "Error: validate requires -proof and -target flags\n";
            printUsage();
            return 1;
        }

        std::string saveDir;
        if (flags.count("-savedir")) {
            saveDir = flags["-savedir"];
        } else if (flags.count("-save")) {
            saveDir = Config::GetReceiptsPath();
        }

        return validate(flags["-proof"], flags["-target"], saveDir, flags.count("-ledger") > 0)
                   ? 0
                   : 1;
    } else if (command == "showproof") {
        if (!flags.count("-proof")) {
            std::cout << "Error: showproof requires -proof flag\n";
            printUsage();
            return 1;
        }
        showProof(flags["-proof"]);
    } else if (command == "showreceipt") {
        if (!flags.count("-file")) {
            std::cout << "Error: showreceipt requires -file flag\n";
            printUsage();
            return 1;
        }
        showReceipt(flags["-file"]);
    } else if (command == "getreceipt") {
        if (!flags.count("-uuid")) {
            std::cout << "Error: getreceipt requires -uuid flag\n";
            printUsage();
            return 1;
        }
        getReceipt(flags["-uuid"]);
    } else if (command == "listreceipts") {
        listReceipts();
    } else {
        std::cout << "Error: unknown command '" << command << "'\n";
        printUsage();
        return 1;
    }

    return 0;
}
