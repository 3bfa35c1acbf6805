#pragma once

#include "anchor_creator.hpp"
#include "anchor_store.hpp"
#include "config.hpp"
#include "consent.hpp"
#include "crypto.hpp"
#include "signature_verifier.hpp"
#include "types.hpp"
#include <string>

namespace gpgalias
{

    /**
     * Single entry point for "may alias be resolved to key_id".
     * Holds no state between calls beyond the references it was built with.
     */
    class TrustOrchestrator
    {
    public:
        TrustOrchestrator(SigningPolicy policy,
                          const AnchorStore &store,
                          crypto::CryptoProvider &provider,
                          ConsentPrompt &prompt);

        /**
         * Disabled policy: Trusted without touching the filesystem or engine.
         * Otherwise verify the existing anchor, or create one if there is none.
         */
        Result<TrustDecision> decide(const std::string &alias, const std::string &key_id) const;

    private:
        SigningPolicy policy_;
        const AnchorStore &store_;
        SignatureVerifier verifier_;
        AnchorCreator creator_;
    };

} // namespace gpgalias
