#include "gpgalias/anchor_creator.hpp"
#include <format>

#include <spdlog/spdlog.h>

namespace gpgalias
{

    AnchorCreator::AnchorCreator(const AnchorStore &store, crypto::CryptoProvider &provider, ConsentPrompt &prompt)
        : store_(store), provider_(provider), prompt_(prompt)
    {
    }

    Result<TrustDecision> AnchorCreator::create(const std::string &alias,
                                                const std::string &key_id,
                                                const SigningPolicy &policy) const
    {
        spdlog::warn("no signature for alias `{}`", alias);
        spdlog::info("Please stop to read this message. gpg-alias did not find a signature for the alias called `{}`.", alias);
        spdlog::info("If you just added this alias, this is normal, and you will need to verify the key ID for the alias.");
        spdlog::warn("Alias `{}` points to key ID `{}`.", alias, key_id);

        if (!prompt_.confirm("Is this correct?"))
        {
            auto detail = std::format("no signature found for alias `{}` and creating a new signature was not authorised", alias);
            spdlog::error("{}", detail);
            return TrustDecision::rejected(RejectReason::ConsentRefused, detail);
        }

        spdlog::info("creating signature for alias `{}`. you may need to enter your pgp passphrase", alias);

        auto key = provider_.get_key(policy.key);
        if (!key)
        {
            return std::unexpected(GpgAliasError::crypto(std::format("missing signing key: {}", key.error().what())));
        }

        auto signed_id = provider_.sign_clear(trim_end(key_id), *key);
        if (!signed_id)
        {
            return std::unexpected(signed_id.error());
        }

        if (auto written = store_.write(alias, *signed_id); !written)
        {
            return std::unexpected(written.error());
        }

        spdlog::info("alias `{}` anchored at {}", alias, store_.locate(alias).string());
        return TrustDecision::newly_anchored();
    }

} // namespace gpgalias
