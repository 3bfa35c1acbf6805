#pragma once

#include "anchor_store.hpp"
#include "config.hpp"
#include "consent.hpp"
#include "crypto.hpp"
#include "types.hpp"
#include <string>

namespace gpgalias
{

    /**
     * Anchors a previously unseen alias: warns the operator, asks for consent,
     * clear-signs the key ID with the designated key and stores the result.
     *
     * Refused consent is a rejection and writes nothing. Engine and I/O
     * failures after consent abort the run (error side of the Result).
     */
    class AnchorCreator
    {
    public:
        AnchorCreator(const AnchorStore &store, crypto::CryptoProvider &provider, ConsentPrompt &prompt);

        Result<TrustDecision> create(const std::string &alias,
                                     const std::string &key_id,
                                     const SigningPolicy &policy) const;

    private:
        const AnchorStore &store_;
        crypto::CryptoProvider &provider_;
        ConsentPrompt &prompt_;
    };

} // namespace gpgalias
