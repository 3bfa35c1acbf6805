#include <catch2/catch_test_macros.hpp>
#include "gpgalias/anchor_creator.hpp"
#include "gpgalias/signature_verifier.hpp"
#include "test_support.hpp"
#include <fstream>
#include <sstream>

using namespace gpgalias;
using namespace gpgalias::testing;

namespace
{
    constexpr const char *kSignerFpr = "0123456789ABCDEF0123456789ABCDEFABCD1234";
}

TEST_CASE("Refused consent writes nothing", "[creator]")
{
    TempDir tmp;
    AnchorStore store(tmp.path() / "gpg-alias");
    FakeCryptoProvider provider;
    provider.add_key("ABCD1234", kSignerFpr);
    ScriptedConsent no(false);
    AnchorCreator creator(store, provider, no);

    auto decision = creator.create("work", "1111AAAA", SigningPolicy{true, "ABCD1234"});
    REQUIRE(decision.has_value());
    REQUIRE(decision->outcome == TrustOutcome::Rejected);
    REQUIRE(decision->reason == RejectReason::ConsentRefused);
    REQUIRE(no.asked == 1);
    REQUIRE(no.last_question == "Is this correct?");
    REQUIRE(provider.sign_calls == 0);
    REQUIRE(provider.get_key_calls == 0);
    REQUIRE_FALSE(std::filesystem::exists(store.locate("work")));
    REQUIRE(count_files(tmp.path()) == 0);
}

TEST_CASE("Consent produces a verifiable anchor", "[creator]")
{
    TempDir tmp;
    AnchorStore store(tmp.path() / "gpg-alias");
    FakeCryptoProvider provider;
    provider.add_key("ABCD1234", kSignerFpr);
    ScriptedConsent yes(true);
    AnchorCreator creator(store, provider, yes);

    auto decision = creator.create("work", "1111AAAA", SigningPolicy{true, "ABCD1234"});
    REQUIRE(decision.has_value());
    REQUIRE(decision->outcome == TrustOutcome::NewlyAnchored);
    REQUIRE(provider.last_signed == "1111AAAA");
    REQUIRE(std::filesystem::exists(tmp.path() / "gpg-alias" / "work.asc"));

    auto artifact = store.read("work");
    REQUIRE(artifact.has_value());
    SignatureVerifier verifier(provider);
    REQUIRE(verifier.verify(*artifact, "1111AAAA", SigningPolicy{true, "ABCD1234"}).outcome ==
            TrustOutcome::Trusted);
}

TEST_CASE("Missing signing key after consent aborts", "[creator]")
{
    TempDir tmp;
    AnchorStore store(tmp.path() / "gpg-alias");
    FakeCryptoProvider provider;
    ScriptedConsent yes(true);
    AnchorCreator creator(store, provider, yes);

    auto decision = creator.create("work", "1111AAAA", SigningPolicy{true, "ABCD1234"});
    REQUIRE_FALSE(decision.has_value());
    REQUIRE(decision.error().code == ErrorCode::CryptoError);
    REQUIRE_FALSE(std::filesystem::exists(store.locate("work")));
}

TEST_CASE("Signing failure aborts without writing", "[creator]")
{
    TempDir tmp;
    AnchorStore store(tmp.path() / "gpg-alias");
    FakeCryptoProvider provider;
    provider.add_key("ABCD1234", kSignerFpr);
    provider.fail_signing = true;
    ScriptedConsent yes(true);
    AnchorCreator creator(store, provider, yes);

    auto decision = creator.create("work", "1111AAAA", SigningPolicy{true, "ABCD1234"});
    REQUIRE_FALSE(decision.has_value());
    REQUIRE(decision.error().code == ErrorCode::CryptoError);
    REQUIRE_FALSE(std::filesystem::exists(store.locate("work")));
}

TEST_CASE("Unwritable anchor directory aborts", "[creator]")
{
    TempDir tmp;
    // A regular file where the anchor directory should be.
    {
        std::ofstream blocker(tmp.path() / "gpg-alias");
        blocker << "not a directory";
    }
    AnchorStore store(tmp.path() / "gpg-alias");
    FakeCryptoProvider provider;
    provider.add_key("ABCD1234", kSignerFpr);
    ScriptedConsent yes(true);
    AnchorCreator creator(store, provider, yes);

    auto decision = creator.create("work", "1111AAAA", SigningPolicy{true, "ABCD1234"});
    REQUIRE_FALSE(decision.has_value());
    REQUIRE(decision.error().code == ErrorCode::IOError);
}

TEST_CASE("Stream consent prompt only accepts y", "[creator][consent]")
{
    auto answer = [](const std::string &input) {
        std::istringstream in(input);
        std::ostringstream out;
        StreamConsentPrompt prompt(in, out);
        bool result = prompt.confirm("Is this correct?");
        REQUIRE(out.str().starts_with("Is this correct? [y/N] "));
        return result;
    };

    REQUIRE(answer("y\n"));
    REQUIRE(answer("Y\n"));
    REQUIRE(answer("y"));
    REQUIRE(answer("y \r\n"));
    REQUIRE_FALSE(answer("\n"));
    REQUIRE_FALSE(answer(""));
    REQUIRE_FALSE(answer("n\n"));
    REQUIRE_FALSE(answer("yes\n"));
    REQUIRE_FALSE(answer(" y\n"));
}
