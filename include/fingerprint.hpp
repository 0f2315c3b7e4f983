#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <openssl/evp.h>

#include "errors.hpp"

/// \brief A SHA-256 digest identifying the exact byte content of a phrase.
struct Fingerprint {
    static constexpr size_t NUM_BYTES = 32;
    static constexpr size_t NUM_HEX_DIGITS = 2 * NUM_BYTES;

    std::array<uint8_t, NUM_BYTES> bytes = {};

    auto operator<=>(Fingerprint const&) const = default;

    std::string hex() const {
        static constexpr char alphabet[] = "0123456789ABCDEF";

        std::string s(NUM_HEX_DIGITS, '0');
        for(size_t i = 0; i < NUM_BYTES; i++) {
            s[2 * i] = alphabet[bytes[i] >> 4];
            s[2 * i + 1] = alphabet[bytes[i] & 0x0F];
        }
        return s;
    }

    // accepts either case, rejects anything that is not exactly NUM_HEX_DIGITS hex digits
    static std::optional<Fingerprint> from_hex(std::string_view const s) {
        if(s.length() != NUM_HEX_DIGITS) return std::nullopt;

        auto nibble = [](char const c) -> int {
            if(c >= '0' && c <= '9') return c - '0';
            if(c >= 'A' && c <= 'F') return c - 'A' + 10;
            if(c >= 'a' && c <= 'f') return c - 'a' + 10;
            return -1;
        };

        Fingerprint fp;
        for(size_t i = 0; i < NUM_BYTES; i++) {
            auto const hi = nibble(s[2 * i]);
            auto const lo = nibble(s[2 * i + 1]);
            if(hi < 0 || lo < 0) return std::nullopt;
            fp.bytes[i] = uint8_t((hi << 4) | lo);
        }
        return fp;
    }
};

/// \brief Incremental SHA-256 computation.
///
/// Bytes of a phrase may be fed in any number of pieces; \ref digest finalizes the current phrase
/// and resets the context for the next one.
class Fingerprinter {
private:
    struct ContextDeleter {
        void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };

    std::unique_ptr<EVP_MD_CTX, ContextDeleter> ctx_;

    void reset() {
        if(EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
            throw DigestError("EVP_DigestInit_ex failed");
        }
    }

public:
    Fingerprinter() : ctx_(EVP_MD_CTX_new()) {
        if(!ctx_) throw DigestError("EVP_MD_CTX_new failed");
        reset();
    }

    Fingerprinter(Fingerprinter&&) = default;
    Fingerprinter& operator=(Fingerprinter&&) = default;

    void update(char const* data, size_t const num) {
        if(num == 0) return;
        if(EVP_DigestUpdate(ctx_.get(), data, num) != 1) {
            throw DigestError("EVP_DigestUpdate failed");
        }
    }

    void update(std::string_view const s) {
        update(s.data(), s.size());
    }

    Fingerprint digest() {
        Fingerprint fp;
        unsigned int len = 0;
        if(EVP_DigestFinal_ex(ctx_.get(), fp.bytes.data(), &len) != 1 || len != Fingerprint::NUM_BYTES) {
            throw DigestError("EVP_DigestFinal_ex failed");
        }
        reset();
        return fp;
    }
};

inline Fingerprint fingerprint(std::string_view const bytes) {
    Fingerprinter f;
    f.update(bytes);
    return f.digest();
}
