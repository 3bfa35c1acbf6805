#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace gpgalias::crypto
{

    /**
     * A resolved OpenPGP key: the identifier it was looked up by, its primary
     * fingerprint and the fingerprints of its subkeys.
     */
    struct SigningKey
    {
        std::string identifier;
        std::string fingerprint;
        std::vector<std::string> subkey_fingerprints;

        /** True if fpr is the primary fingerprint or one of the subkey fingerprints */
        bool owns_fingerprint(const std::string &fpr) const;
    };

    /**
     * One signature found on a verified artifact
     */
    struct SignatureInfo
    {
        bool valid{false};                   // engine summary carries the "valid" flag
        std::optional<std::string> fingerprint; // absent when the engine could not resolve the signer
    };

    /**
     * Plaintext and signature list produced by verifying an opaque signed blob
     */
    struct VerifiedPayload
    {
        std::string plaintext;
        std::vector<SignatureInfo> signatures;
    };

    /**
     * Abstract interface over an OpenPGP engine. Implementations are blocking.
     */
    class CryptoProvider
    {
    public:
        virtual ~CryptoProvider() = default;

        /**
         * Resolve a key by identifier (key ID, fingerprint or user ID).
         * @param identifier Identifier as configured by the user
         */
        virtual Result<SigningKey> get_key(const std::string &identifier) = 0;

        /**
         * Produce a clear-signed blob embedding plaintext.
         * @param plaintext Bytes to sign
         * @param key Key to sign with, as returned by get_key
         */
        virtual Result<std::string> sign_clear(const std::string &plaintext, const SigningKey &key) = 0;

        /**
         * Verify an opaque (clear-signed or inline) blob, returning the embedded
         * plaintext and every signature found. An error means the engine could not
         * process the blob at all.
         */
        virtual Result<VerifiedPayload> verify_opaque(const std::string &signed_data) = 0;
    };

    /** Compare two hex fingerprints ignoring case and embedded spaces */
    bool fingerprints_equal(const std::string &a, const std::string &b);

} // namespace gpgalias::crypto
