#pragma once

#include "crypto.hpp"
#include <memory>

namespace gpgalias::crypto
{

    /**
     * CryptoProvider backed by GPGME (OpenPGP protocol). Uses the user's
     * default GnuPG home; signing may trigger pinentry for the passphrase.
     */
    class GpgmeCryptoProvider : public CryptoProvider
    {
    public:
        /** Throws GpgAliasError if no OpenPGP context can be created */
        GpgmeCryptoProvider();
        ~GpgmeCryptoProvider() override;

        /** Non-throwing factory */
        static Result<std::unique_ptr<GpgmeCryptoProvider>> create();

        Result<SigningKey> get_key(const std::string &identifier) override;

        Result<std::string> sign_clear(const std::string &plaintext, const SigningKey &key) override;

        Result<VerifiedPayload> verify_opaque(const std::string &signed_data) override;

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };

} // namespace gpgalias::crypto
