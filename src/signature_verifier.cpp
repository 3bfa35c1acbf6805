#include "gpgalias/signature_verifier.hpp"
#include <format>

#include <spdlog/spdlog.h>

namespace gpgalias
{
    namespace
    {
        TrustDecision reject(RejectReason reason, std::string detail)
        {
            spdlog::error("{}", detail);
            return TrustDecision::rejected(reason, std::move(detail));
        }
    } // namespace

    SignatureVerifier::SignatureVerifier(crypto::CryptoProvider &provider)
        : provider_(provider)
    {
    }

    TrustDecision SignatureVerifier::verify(const std::string &artifact,
                                            const std::string &expected_key_id,
                                            const SigningPolicy &policy) const
    {
        auto payload = provider_.verify_opaque(artifact);
        if (!payload)
        {
            return reject(RejectReason::VerificationError, payload.error().what());
        }

        if (!is_valid_utf8(payload->plaintext))
        {
            return reject(RejectReason::ContentMismatch, "signed content is not valid UTF-8");
        }
        // Anchors are created over the trimmed key ID.
        auto signed_id = trim_end(payload->plaintext);
        auto expected_id = trim_end(expected_key_id);
        if (signed_id != expected_id)
        {
            return reject(RejectReason::ContentMismatch,
                          std::format("invalid signed content: key does not match (`{}` != `{}`)",
                                      signed_id, expected_id));
        }

        const auto &sigs = payload->signatures;
        if (sigs.size() != 1)
        {
            return reject(RejectReason::WrongSignatureCount,
                          std::format("invalid number of signatures: expected 1, got {}", sigs.size()));
        }

        const auto &sig = sigs.front();
        if (!sig.valid)
        {
            return reject(RejectReason::InvalidSignature, "invalid signature");
        }

        if (!sig.fingerprint || sig.fingerprint->empty())
        {
            return reject(RejectReason::NoFingerprint, "invalid fingerprint on key signature was made by");
        }

        auto expected_key = provider_.get_key(policy.key);
        if (!expected_key)
        {
            return reject(RejectReason::MissingSigningKey,
                          std::format("could not get signing key: {}", expected_key.error().what()));
        }

        // Subkey list is taken from the engine as-is; binding signatures are not re-checked.
        if (!expected_key->owns_fingerprint(*sig.fingerprint))
        {
            return reject(RejectReason::WrongSigner,
                          std::format("signature made by wrong key (got {})", *sig.fingerprint));
        }

        spdlog::debug("signature on `{}` made by {} is trusted", expected_key_id, *sig.fingerprint);
        return TrustDecision::trusted();
    }

} // namespace gpgalias
