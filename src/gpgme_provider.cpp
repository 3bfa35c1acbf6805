#include "gpgalias/gpgme_provider.hpp"
#include <cstdio>
#include <mutex>

#include <gpgme++/context.h>
#include <gpgme++/data.h>
#include <gpgme++/error.h>
#include <gpgme++/global.h>
#include <gpgme++/key.h>
#include <gpgme++/signingresult.h>
#include <gpgme++/verificationresult.h>
#include <spdlog/spdlog.h>

namespace gpgalias::crypto
{
    namespace
    {
        std::once_flag gpgme_init_flag;

        void init_gpgme()
        {
            std::call_once(gpgme_init_flag, [] { GpgME::initializeLibrary(); });
        }

        std::string error_string(const GpgME::Error &err)
        {
            const char *s = err.asString();
            return s ? std::string(s) : std::string("unknown GPGME error");
        }

        Result<std::string> drain(GpgME::Data &data)
        {
            if (data.seek(0, SEEK_SET) != 0)
                return std::unexpected(GpgAliasError::crypto("could not rewind GPGME data buffer"));

            std::string out;
            char buf[4096];
            for (;;)
            {
                auto n = data.read(buf, sizeof(buf));
                if (n < 0)
                    return std::unexpected(GpgAliasError::crypto("could not read GPGME data buffer"));
                if (n == 0)
                    break;
                out.append(buf, static_cast<std::size_t>(n));
            }
            return out;
        }
    } // namespace

    class GpgmeCryptoProvider::Impl
    {
    public:
        Impl()
        {
            init_gpgme();
            ctx_.reset(GpgME::Context::createForProtocol(GpgME::OpenPGP));
            if (!ctx_)
            {
                throw GpgAliasError::crypto("could not create gpgme context");
            }
            ctx_->setArmor(true);
            ctx_->setTextMode(true);
        }

        Result<GpgME::Key> lookup(const std::string &identifier, bool secret)
        {
            GpgME::Error err;
            GpgME::Key key = ctx_->key(identifier.c_str(), err, secret);
            if (err)
                return std::unexpected(GpgAliasError::crypto("could not get key `" + identifier + "`: " + error_string(err)));
            if (key.isNull())
                return std::unexpected(GpgAliasError::crypto("could not get key `" + identifier + "`: no such key"));
            return key;
        }

        Result<SigningKey> get_key(const std::string &identifier)
        {
            auto key = lookup(identifier, false);
            if (!key)
                return std::unexpected(key.error());

            const char *primary = key->primaryFingerprint();
            if (!primary)
                return std::unexpected(GpgAliasError::crypto("key `" + identifier + "` has no fingerprint"));

            SigningKey out;
            out.identifier = identifier;
            out.fingerprint = primary;
            for (const auto &sub : key->subkeys())
            {
                if (const char *fpr = sub.fingerprint())
                    out.subkey_fingerprints.emplace_back(fpr);
            }
            spdlog::trace("resolved key `{}` to {} ({} subkeys)", identifier, out.fingerprint,
                          out.subkey_fingerprints.size());
            return out;
        }

        Result<std::string> sign_clear(const std::string &plaintext, const SigningKey &key)
        {
            // Resolve by fingerprint so the signer is exactly the key that was checked.
            auto signer = lookup(key.fingerprint, true);
            if (!signer)
                return std::unexpected(signer.error());

            ctx_->clearSigningKeys();
            if (auto err = ctx_->addSigningKey(*signer); err)
            {
                return std::unexpected(GpgAliasError::crypto("could not add signing key as a signer: " + error_string(err)));
            }

            GpgME::Data plain(plaintext.data(), plaintext.size(), true);
            GpgME::Data signed_data;
            auto result = ctx_->sign(plain, signed_data, GpgME::Clearsigned);
            ctx_->clearSigningKeys();
            if (result.error())
            {
                return std::unexpected(GpgAliasError::crypto("could not create signature: " + error_string(result.error())));
            }
            return drain(signed_data);
        }

        Result<VerifiedPayload> verify_opaque(const std::string &signed_data)
        {
            GpgME::Data sig(signed_data.data(), signed_data.size(), true);
            GpgME::Data plain;
            auto result = ctx_->verifyOpaqueSignature(sig, plain);
            if (result.error())
            {
                return std::unexpected(GpgAliasError::crypto("could not verify signature: " + error_string(result.error())));
            }

            auto text = drain(plain);
            if (!text)
                return std::unexpected(text.error());

            VerifiedPayload out;
            out.plaintext = std::move(*text);
            for (const auto &s : result.signatures())
            {
                SignatureInfo info;
                info.valid = (s.summary() & GpgME::Signature::Valid) != 0;
                if (const char *fpr = s.fingerprint(); fpr && *fpr)
                    info.fingerprint = std::string(fpr);
                out.signatures.push_back(std::move(info));
            }
            return out;
        }

    private:
        std::unique_ptr<GpgME::Context> ctx_;
    };

    GpgmeCryptoProvider::GpgmeCryptoProvider() : impl_(std::make_unique<Impl>()) {}
    GpgmeCryptoProvider::~GpgmeCryptoProvider() = default;

    Result<std::unique_ptr<GpgmeCryptoProvider>> GpgmeCryptoProvider::create()
    {
        try
        {
            return std::make_unique<GpgmeCryptoProvider>();
        }
        catch (const GpgAliasError &e)
        {
            return std::unexpected(e);
        }
    }

    Result<SigningKey> GpgmeCryptoProvider::get_key(const std::string &identifier)
    {
        return impl_->get_key(identifier);
    }

    Result<std::string> GpgmeCryptoProvider::sign_clear(const std::string &plaintext, const SigningKey &key)
    {
        return impl_->sign_clear(plaintext, key);
    }

    Result<VerifiedPayload> GpgmeCryptoProvider::verify_opaque(const std::string &signed_data)
    {
        return impl_->verify_opaque(signed_data);
    }

} // namespace gpgalias::crypto
