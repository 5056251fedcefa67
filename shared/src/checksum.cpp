#include "ftpmirror/checksum.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <fstream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

#include <openssl/evp.h>
#include <sodium.h>
#include <zlib.h>

namespace ftpmirror::checksum
{

    namespace
    {

        struct AlgorithmMapping
        {
            HashAlgorithm algorithm;
            std::string_view label;
        };

        constexpr std::array<AlgorithmMapping, 5> kAlgorithmMappings{{
            {HashAlgorithm::Crc32, "CRC32"},
            {HashAlgorithm::Md5, "MD5"},
            {HashAlgorithm::Sha1, "SHA-1"},
            {HashAlgorithm::Sha256, "SHA-256"},
            {HashAlgorithm::Sha512, "SHA-512"},
        }};

        constexpr std::size_t kReadBufferSize = 1024 * 1024;

        std::string to_hex(std::span<const unsigned char> data)
        {
            static constexpr char kHexDigits[] = "0123456789abcdef";
            std::string result;
            result.resize(data.size() * 2);
            for (std::size_t i = 0; i < data.size(); ++i)
            {
                const auto byte = data[i];
                result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
                result[2 * i + 1] = kHexDigits[byte & 0x0F];
            }
            return result;
        }

        std::string normalize_name(std::string_view value)
        {
            std::string result;
            for (const char ch : value)
            {
                if (ch == '-' || ch == '_' || std::isspace(static_cast<unsigned char>(ch)))
                {
                    continue;
                }
                result.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
            }
            return result;
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        void ensure_initialized_once()
        {
            std::call_once(sodium_once_flag(), []()
                           {
                               if (sodium_init() < 0)
                               {
                                   throw std::runtime_error("libsodium initialization failed");
                               } });
        }

        class Digest
        {
        public:
            virtual ~Digest() = default;
            virtual void update(const unsigned char *data, std::size_t size) = 0;
            virtual std::string finish() = 0;
        };

        class Crc32Digest final : public Digest
        {
        public:
            void update(const unsigned char *data, std::size_t size) override
            {
                // zlib takes uInt lengths.
                while (size > 0)
                {
                    const auto step = static_cast<uInt>(std::min<std::size_t>(size, 1u << 30));
                    crc_ = ::crc32(crc_, data, step);
                    data += step;
                    size -= step;
                }
            }

            std::string finish() override
            {
                const auto value = static_cast<std::uint32_t>(crc_ & 0xFFFFFFFFu);
                const std::array<unsigned char, 4> bytes{
                    static_cast<unsigned char>(value >> 24),
                    static_cast<unsigned char>(value >> 16),
                    static_cast<unsigned char>(value >> 8),
                    static_cast<unsigned char>(value),
                };
                return to_hex(bytes);
            }

        private:
            uLong crc_{::crc32(0L, Z_NULL, 0)};
        };

        class Sha256Digest final : public Digest
        {
        public:
            Sha256Digest()
            {
                ensure_initialized_once();
                if (crypto_hash_sha256_init(&state_) != 0)
                {
                    throw std::runtime_error("crypto_hash_sha256_init failed");
                }
            }

            void update(const unsigned char *data, std::size_t size) override
            {
                if (crypto_hash_sha256_update(&state_, data, size) != 0)
                {
                    throw std::runtime_error("crypto_hash_sha256_update failed");
                }
            }

            std::string finish() override
            {
                std::array<unsigned char, crypto_hash_sha256_BYTES> digest{};
                if (crypto_hash_sha256_final(&state_, digest.data()) != 0)
                {
                    throw std::runtime_error("crypto_hash_sha256_final failed");
                }
                return to_hex(digest);
            }

        private:
            crypto_hash_sha256_state state_{};
        };

        class Sha512Digest final : public Digest
        {
        public:
            Sha512Digest()
            {
                ensure_initialized_once();
                if (crypto_hash_sha512_init(&state_) != 0)
                {
                    throw std::runtime_error("crypto_hash_sha512_init failed");
                }
            }

            void update(const unsigned char *data, std::size_t size) override
            {
                if (crypto_hash_sha512_update(&state_, data, size) != 0)
                {
                    throw std::runtime_error("crypto_hash_sha512_update failed");
                }
            }

            std::string finish() override
            {
                std::array<unsigned char, crypto_hash_sha512_BYTES> digest{};
                if (crypto_hash_sha512_final(&state_, digest.data()) != 0)
                {
                    throw std::runtime_error("crypto_hash_sha512_final failed");
                }
                return to_hex(digest);
            }

        private:
            crypto_hash_sha512_state state_{};
        };

        class EvpDigest final : public Digest
        {
        public:
            explicit EvpDigest(const EVP_MD *md) : context_(EVP_MD_CTX_new(), &EVP_MD_CTX_free)
            {
                if (!context_ || EVP_DigestInit_ex(context_.get(), md, nullptr) != 1)
                {
                    throw std::runtime_error("EVP_DigestInit_ex failed");
                }
            }

            void update(const unsigned char *data, std::size_t size) override
            {
                if (EVP_DigestUpdate(context_.get(), data, size) != 1)
                {
                    throw std::runtime_error("EVP_DigestUpdate failed");
                }
            }

            std::string finish() override
            {
                std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
                unsigned int length = 0;
                if (EVP_DigestFinal_ex(context_.get(), digest.data(), &length) != 1)
                {
                    throw std::runtime_error("EVP_DigestFinal_ex failed");
                }
                return to_hex(std::span<const unsigned char>(digest.data(), length));
            }

        private:
            std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context_;
        };

        std::unique_ptr<Digest> make_digest(HashAlgorithm algorithm)
        {
            switch (algorithm)
            {
            case HashAlgorithm::Crc32:
                return std::make_unique<Crc32Digest>();
            case HashAlgorithm::Md5:
                return std::make_unique<EvpDigest>(EVP_md5());
            case HashAlgorithm::Sha1:
                return std::make_unique<EvpDigest>(EVP_sha1());
            case HashAlgorithm::Sha256:
                return std::make_unique<Sha256Digest>();
            case HashAlgorithm::Sha512:
                return std::make_unique<Sha512Digest>();
            }
            throw std::invalid_argument("Unknown hash algorithm");
        }

        std::optional<std::uint32_t> parse_crc(std::string_view value)
        {
            std::uint32_t result = 0;
            const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result, 16);
            if (ec != std::errc{} || ptr != value.data() + value.size() || value.empty())
            {
                return std::nullopt;
            }
            return result;
        }

    } // namespace

    std::string_view to_string(HashAlgorithm algorithm) noexcept
    {
        for (const auto &mapping : kAlgorithmMappings)
        {
            if (mapping.algorithm == algorithm)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<HashAlgorithm> hash_algorithm_from_string(std::string_view value) noexcept
    {
        const auto normalized = normalize_name(value);
        for (const auto &mapping : kAlgorithmMappings)
        {
            if (normalize_name(mapping.label) == normalized)
            {
                return mapping.algorithm;
            }
        }
        return std::nullopt;
    }

    void ensure_sodium_init()
    {
        ensure_initialized_once();
    }

    std::string hash_bytes(std::span<const std::byte> data, HashAlgorithm algorithm)
    {
        auto digest = make_digest(algorithm);
        digest->update(reinterpret_cast<const unsigned char *>(data.data()), data.size());
        return digest->finish();
    }

    std::string hash_stream(std::istream &input, HashAlgorithm algorithm)
    {
        auto digest = make_digest(algorithm);
        std::vector<unsigned char> buffer(kReadBufferSize);
        while (input)
        {
            input.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(input.gcount());
            if (read_count > 0)
            {
                digest->update(buffer.data(), read_count);
            }
        }
        if (input.bad())
        {
            throw std::runtime_error("Read error while hashing stream");
        }
        return digest->finish();
    }

    std::string hash_file(const std::filesystem::path &path, HashAlgorithm algorithm)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open file for hashing: " + path.string());
        }
        return hash_stream(file, algorithm);
    }

    bool digests_equal(std::string_view lhs, std::string_view rhs, HashAlgorithm algorithm)
    {
        if (algorithm == HashAlgorithm::Crc32)
        {
            const auto left = parse_crc(lhs);
            const auto right = parse_crc(rhs);
            return left && right && *left == *right;
        }
        return lhs.size() == rhs.size() &&
               std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b)
                          { return std::tolower(static_cast<unsigned char>(a)) ==
                                   std::tolower(static_cast<unsigned char>(b)); });
    }

} // namespace ftpmirror::checksum
