#ifndef CLI_H
#define CLI_H

#include <string>

class CLI {
    private:
        void printUsage();

        void hash(const std::string& data, const std::string& algorithm,
                  const std::string& encoding, bool security);
        bool validate(const std::string& proofPath, const std::string& target,
                      const std::string& saveDir, bool useLedger);
        void showProof(const std::string& proofPath);
        void showReceipt(const std::string& receiptPath);
        void getReceipt(const std::string& uuid);
        void listReceipts();

    public:
        CLI() = default;

        // returns the process exit code
        int run(int argc, char* argv[]);
};

#endif
