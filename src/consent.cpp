#include "gpgalias/consent.hpp"
#include "gpgalias/types.hpp"
#include <istream>
#include <ostream>

namespace gpgalias
{

    bool is_affirmative(const std::string &response)
    {
        auto r = trim_end(response);
        return r == "y" || r == "Y";
    }

    StreamConsentPrompt::StreamConsentPrompt(std::istream &in, std::ostream &out)
        : in_(in), out_(out)
    {
    }

    bool StreamConsentPrompt::confirm(const std::string &question)
    {
        out_ << question << " [y/N] " << std::flush;

        std::string response;
        if (!std::getline(in_, response))
        {
            out_ << std::endl;
            return false;
        }
        return is_affirmative(response);
    }

} // namespace gpgalias
