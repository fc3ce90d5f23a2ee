#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

// algorithm or encoding outside the supported sets
class UnsupportedParameterError : public std::invalid_argument {
    public:
        explicit UnsupportedParameterError(const std::string& provided)
            : std::invalid_argument(provided + " is not supported") {}
};

// validation parameters lacking one of the required keys
class MissingConfigurationKeyError : public std::invalid_argument {
    private:
        std::string key;

    public:
        explicit MissingConfigurationKeyError(const std::string& key)
            : std::invalid_argument("Hash engine could not be configured: missing parameter: " +
                                    key),
              key(key) {}

        const std::string& Key() const { return key; }
};

// the proof path does not lead to the target, or the proof was never generated
class InvalidProofError : public std::runtime_error {
    public:
        explicit InvalidProofError(const std::string& reason)
            : std::runtime_error("Invalid proof: " + reason) {}
};

#endif
