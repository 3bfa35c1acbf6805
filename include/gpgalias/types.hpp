#pragma once

#include <expected>
#include <string>
#include <stdexcept>
#include <format>
#include <utility>

namespace gpgalias
{

    /**
     * Final outcome of a trust decision for one alias
     */
    enum class TrustOutcome
    {
        Trusted,
        NewlyAnchored,
        Rejected
    };

    /**
     * Why a binding was rejected. None is only used alongside a non-rejected outcome.
     */
    enum class RejectReason
    {
        None,
        VerificationError,
        ContentMismatch,
        WrongSignatureCount,
        InvalidSignature,
        NoFingerprint,
        MissingSigningKey,
        WrongSigner,
        ConsentRefused
    };

    inline std::string outcome_to_string(TrustOutcome outcome)
    {
        switch (outcome)
        {
        case TrustOutcome::Trusted:
            return "trusted";
        case TrustOutcome::NewlyAnchored:
            return "newly anchored";
        case TrustOutcome::Rejected:
            return "rejected";
        }
        return "unknown";
    }

    inline std::string reject_reason_to_string(RejectReason reason)
    {
        switch (reason)
        {
        case RejectReason::None:
            return "none";
        case RejectReason::VerificationError:
            return "verification error";
        case RejectReason::ContentMismatch:
            return "content mismatch";
        case RejectReason::WrongSignatureCount:
            return "wrong signature count";
        case RejectReason::InvalidSignature:
            return "invalid signature";
        case RejectReason::NoFingerprint:
            return "no fingerprint";
        case RejectReason::MissingSigningKey:
            return "missing signing key";
        case RejectReason::WrongSigner:
            return "wrong signer";
        case RejectReason::ConsentRefused:
            return "consent refused";
        }
        return "unknown";
    }

    /**
     * Result of checking one alias -> key binding.
     * The abort case is not represented here; it travels as the error side of Result.
     */
    struct TrustDecision
    {
        TrustOutcome outcome{TrustOutcome::Rejected};
        RejectReason reason{RejectReason::None};
        std::string detail;

        static TrustDecision trusted()
        {
            return TrustDecision{TrustOutcome::Trusted, RejectReason::None, {}};
        }

        static TrustDecision newly_anchored()
        {
            return TrustDecision{TrustOutcome::NewlyAnchored, RejectReason::None, {}};
        }

        static TrustDecision rejected(RejectReason reason, std::string detail)
        {
            return TrustDecision{TrustOutcome::Rejected, reason, std::move(detail)};
        }

        /** True for Trusted and NewlyAnchored */
        bool accepted() const { return outcome != TrustOutcome::Rejected; }

        std::string to_string() const
        {
            if (outcome != TrustOutcome::Rejected)
                return outcome_to_string(outcome);
            return std::format("rejected ({})", reject_reason_to_string(reason));
        }
    };

    /**
     * Error types for gpg-alias operations
     */
    enum class ErrorCode
    {
        ConfigError,
        CryptoError,
        IOError,
        NotFound,
        InvalidInput
    };

    /**
     * gpg-alias error with code and message. Anything returned as this error
     * aborts the whole run.
     */
    class GpgAliasError : public std::runtime_error
    {
    public:
        ErrorCode code;

        GpgAliasError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static GpgAliasError config(const std::string &msg)
        {
            return GpgAliasError(ErrorCode::ConfigError, msg);
        }

        static GpgAliasError crypto(const std::string &msg)
        {
            return GpgAliasError(ErrorCode::CryptoError, msg);
        }

        static GpgAliasError io(const std::string &msg)
        {
            return GpgAliasError(ErrorCode::IOError, msg);
        }

        static GpgAliasError not_found(const std::string &msg)
        {
            return GpgAliasError(ErrorCode::NotFound, msg);
        }

        static GpgAliasError invalid_input(const std::string &msg)
        {
            return GpgAliasError(ErrorCode::InvalidInput, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, GpgAliasError>;

    /**
     * Strip trailing whitespace and line terminators
     */
    std::string trim_end(const std::string &s);

    /**
     * Check that a byte string is well-formed UTF-8
     */
    bool is_valid_utf8(const std::string &s);

} // namespace gpgalias
