#include "gpgalias/types.hpp"
#include <cstddef>
#include <cstdint>

namespace gpgalias
{

    std::string trim_end(const std::string &s)
    {
        auto end = s.find_last_not_of(" \t\r\n\v\f");
        if (end == std::string::npos)
            return {};
        return s.substr(0, end + 1);
    }

    bool is_valid_utf8(const std::string &s)
    {
        std::size_t i = 0;
        while (i < s.size())
        {
            auto c = static_cast<unsigned char>(s[i]);
            std::size_t len = 0;
            uint32_t cp = 0;
            if (c < 0x80)
            {
                ++i;
                continue;
            }
            else if ((c & 0xE0) == 0xC0)
            {
                len = 2;
                cp = c & 0x1F;
            }
            else if ((c & 0xF0) == 0xE0)
            {
                len = 3;
                cp = c & 0x0F;
            }
            else if ((c & 0xF8) == 0xF0)
            {
                len = 4;
                cp = c & 0x07;
            }
            else
            {
                return false;
            }

            if (i + len > s.size())
                return false;
            for (std::size_t k = 1; k < len; ++k)
            {
                auto cc = static_cast<unsigned char>(s[i + k]);
                if ((cc & 0xC0) != 0x80)
                    return false;
                cp = (cp << 6) | (cc & 0x3F);
            }

            // overlong encodings, surrogates, out of range
            if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000))
                return false;
            if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
                return false;

            i += len;
        }
        return true;
    }

} // namespace gpgalias
