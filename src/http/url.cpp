#include <boost/url.hpp>

#include "url.hpp"

namespace urls = boost::urls;

std::optional<std::string> resolve_url(std::string_view base, std::string_view ref) {
    auto b = urls::parse_uri(base);
    if (!b)
        return std::nullopt;

    auto r = urls::parse_uri_reference(ref);
    std::string encoded;
    if (!r) {
        // keep the delimiters, escape everything else that is illegal
        static constexpr auto allowed = urls::pchars + urls::grammar::lut_chars("/?#%");
        encoded = urls::encode(ref, allowed);
        r = urls::parse_uri_reference(encoded);
        if (!r)
            return std::nullopt;
    }

    urls::url dest;
    auto rv = urls::resolve(*b, *r, dest);
    if (!rv)
        return std::nullopt;

    return std::string(dest.buffer());
}
