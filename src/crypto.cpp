#include "gpgalias/crypto.hpp"
#include <algorithm>
#include <cctype>

namespace gpgalias::crypto
{
    namespace
    {
        std::string normalize(const std::string &fpr)
        {
            std::string out;
            out.reserve(fpr.size());
            for (unsigned char c : fpr)
            {
                if (std::isspace(c))
                    continue;
                out.push_back(static_cast<char>(std::toupper(c)));
            }
            return out;
        }
    } // namespace

    bool fingerprints_equal(const std::string &a, const std::string &b)
    {
        auto na = normalize(a);
        return !na.empty() && na == normalize(b);
    }

    bool SigningKey::owns_fingerprint(const std::string &fpr) const
    {
        if (fingerprints_equal(fingerprint, fpr))
            return true;
        return std::any_of(subkey_fingerprints.begin(), subkey_fingerprints.end(),
                           [&](const std::string &sub) { return fingerprints_equal(sub, fpr); });
    }

} // namespace gpgalias::crypto
