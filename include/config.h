#ifndef CONFIG_H
#define CONFIG_H

#include <cstddef>
#include <string>

inline const std::string DEFAULT_DATA_DIR = "./data";

// hashing parameters used when the caller does not name any
namespace Defaults {

    inline const std::string ALGORITHM = "sha256";
    inline const std::string ENCODING = "utf_8";
    inline constexpr bool SECURITY = true;

    // bytes fed into the digest per update call
    inline constexpr size_t DIGEST_CHUNK_SIZE = 1024;

}  // namespace Defaults

// data directory
namespace Config {

    void SetDataDir(const std::string& dir);

    const std::string& GetDataDir();

    std::string GetReceiptsPath();
    std::string GetLedgerPath();

}  // namespace Config

#endif
