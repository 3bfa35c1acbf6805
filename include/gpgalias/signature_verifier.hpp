#pragma once

#include "config.hpp"
#include "crypto.hpp"
#include "types.hpp"
#include <string>

namespace gpgalias
{

    /**
     * Decides whether a stored artifact anchors an alias to a key ID.
     *
     * Checks run in a fixed order and the first failure wins:
     *  1. the engine can verify the blob at all
     *  2. the signed text (trailing whitespace trimmed) is the expected key ID
     *  3. there is exactly one signature
     *  4. the engine marks that signature valid
     *  5. the signer fingerprint is known
     *  6. the designated signing key can be looked up
     *  7. the signer is that key or one of its subkeys
     * Every failure is a definitive rejection; nothing is retried.
     */
    class SignatureVerifier
    {
    public:
        explicit SignatureVerifier(crypto::CryptoProvider &provider);

        TrustDecision verify(const std::string &artifact,
                             const std::string &expected_key_id,
                             const SigningPolicy &policy) const;

    private:
        crypto::CryptoProvider &provider_;
    };

} // namespace gpgalias
