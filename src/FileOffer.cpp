#include "p2pchat/FileOffer.hpp"
#include <openssl/sha.h>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace p2pchat {

    namespace {
        constexpr size_t READ_BLOCK_SIZE = 4096;

        void requireRegularFile(const std::string& path) {
            std::error_code ec;
            if (path.empty() || !std::filesystem::is_regular_file(path, ec)) {
                throw FileNotFoundError(path);
            }
        }
    }

    std::string sha256File(const std::string& path) {
        requireRegularFile(path);

        std::ifstream in(path, std::ios::binary);
        if (!in) throw std::runtime_error("Cannot open " + path);

        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256_CTX sha256;
        SHA256_Init(&sha256);

        std::vector<char> block(READ_BLOCK_SIZE);
        while (in) {
            in.read(block.data(), static_cast<std::streamsize>(block.size()));
            const std::streamsize got = in.gcount();
            if (got > 0) SHA256_Update(&sha256, block.data(), static_cast<size_t>(got));
        }
        if (in.bad()) throw std::runtime_error("Read error on " + path);
        SHA256_Final(hash, &sha256);

        std::stringstream ss;
        for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) { ss << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i]; }
        return ss.str();
    }

    FileOffer buildFileOffer(const std::string& path, const std::string& sender) {
        requireRegularFile(path);

        FileOffer offer;
        offer.filename = std::filesystem::path(path).filename().string();
        offer.size = static_cast<uint64_t>(std::filesystem::file_size(path));
        offer.hash = sha256File(path);
        offer.sender = sender;
        return offer;
    }

} // namespace p2pchat
