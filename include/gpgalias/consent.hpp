#pragma once

#include <iosfwd>
#include <string>

namespace gpgalias
{

    /**
     * Source of explicit operator consent. confirm() blocks until an answer
     * is available; there is no timeout.
     */
    class ConsentPrompt
    {
    public:
        virtual ~ConsentPrompt() = default;

        /** Ask question; true only on an explicit affirmative */
        virtual bool confirm(const std::string &question) = 0;
    };

    /**
     * Reads one line from in after writing `question [y/N] ` to out.
     * Only "y" or "Y" counts as consent; empty input and end of stream refuse.
     */
    class StreamConsentPrompt : public ConsentPrompt
    {
    public:
        StreamConsentPrompt(std::istream &in, std::ostream &out);

        bool confirm(const std::string &question) override;

    private:
        std::istream &in_;
        std::ostream &out_;
    };

    /** True if response is an affirmative answer */
    bool is_affirmative(const std::string &response);

} // namespace gpgalias
