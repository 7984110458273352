#include "fingerprint.h"

#include <iomanip>
#include <sstream>

#include <openssl/evp.h>

#include "common/errors.h"

namespace Benchkit {

namespace {

void AppendQuoted(std::string& out, const std::string& s) {
    out.push_back('"');
    for (char c : s) {
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('"');
}

} // namespace

Context ReduceContext(const Context& ctx, const std::string& x_key) {
    Context reduced = ctx;
    reduced.erase(x_key);
    reduced.erase(kFnameKey);
    reduced.erase(kTimestampKey);
    return reduced;
}

std::string CanonicalForm(const Context& ctx) {
    // std::map iterates in key order, which makes the form independent of
    // the order keys appeared in the artifact.
    std::string out = "{";
    bool first = true;
    for (const auto& [key, value] : ctx) {
        if (!first) out.push_back(',');
        first = false;
        AppendQuoted(out, key);
        out.push_back(':');
        switch (value.index()) {
            case 0:
                out.push_back('i');
                out += ToString(value);
                break;
            case 1:
                out.push_back('d');
                out += ToString(value);
                break;
            default:
                out.push_back('s');
                AppendQuoted(out, std::get<std::string>(value));
                break;
        }
    }
    out.push_back('}');
    return out;
}

std::string Fingerprint(const Context& ctx) {
    const std::string canonical = CanonicalForm(ctx);

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(canonical.data(), canonical.size(), digest, &digest_len,
                   EVP_md5(), nullptr) != 1) {
        throw Error("EVP_Digest failed while fingerprinting context");
    }

    std::ostringstream hex;
    hex << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digest_len; ++i) {
        hex << std::setw(2) << static_cast<int>(digest[i]);
    }
    return hex.str();
}

} // namespace Benchkit
