#include "gpgalias/trust_orchestrator.hpp"

#include <spdlog/spdlog.h>

namespace gpgalias
{

    TrustOrchestrator::TrustOrchestrator(SigningPolicy policy,
                                         const AnchorStore &store,
                                         crypto::CryptoProvider &provider,
                                         ConsentPrompt &prompt)
        : policy_(std::move(policy)),
          store_(store),
          verifier_(provider),
          creator_(store, provider, prompt)
    {
    }

    Result<TrustDecision> TrustOrchestrator::decide(const std::string &alias, const std::string &key_id) const
    {
        if (!policy_.enabled)
        {
            return TrustDecision::trusted();
        }

        auto exists = store_.exists(alias);
        if (!exists)
            return std::unexpected(exists.error());

        if (!*exists)
        {
            return creator_.create(alias, key_id, policy_);
        }

        auto artifact = store_.read(alias);
        if (!artifact)
            return std::unexpected(artifact.error());

        auto decision = verifier_.verify(*artifact, key_id, policy_);
        spdlog::debug("alias `{}`: {}", alias, decision.to_string());
        return decision;
    }

} // namespace gpgalias
