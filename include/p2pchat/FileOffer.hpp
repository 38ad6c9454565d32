#ifndef P2PCHAT_FILE_OFFER_HPP
#define P2PCHAT_FILE_OFFER_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace p2pchat {

    /** Raised when a file offered with /sendfile does not resolve to a regular file. */
    class FileNotFoundError : public std::runtime_error {
    public:
        explicit FileNotFoundError(const std::string& path)
            : std::runtime_error("File not found: " + path), filePath(path) {}

        const std::string& path() const { return filePath; }

    private:
        std::string filePath;
    };

    /**
     * Metadata proposed to a peer before a transfer. Only the basename travels;
     * the local path never leaves the process.
     */
    struct FileOffer {
        std::string filename;
        uint64_t size = 0;
        std::string hash;
        std::string sender;
    };

    /**
     * @brief SHA-256 of a file's contents, read in 4 KiB blocks
     * @param path Path to a readable regular file
     * @return Lowercase hex digest (64 characters)
     * @throws FileNotFoundError if the path does not resolve
     * @throws std::runtime_error if the file cannot be read
     */
    std::string sha256File(const std::string& path);

    /**
     * @brief Builds the offer for a local file
     * @throws FileNotFoundError if the path does not resolve
     */
    FileOffer buildFileOffer(const std::string& path, const std::string& sender);

} // namespace p2pchat

#endif // P2PCHAT_FILE_OFFER_HPP
