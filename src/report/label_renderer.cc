#include "label_renderer.h"

#include <cctype>

#include "common/errors.h"

namespace Benchkit {

namespace {

std::string Trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

} // namespace

std::string EscapeLabelValue(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&#34;"; break;
            case '\'': out += "&#39;"; break;
            default:
                if (std::iscntrl(static_cast<unsigned char>(c))) {
                    out.push_back(' ');
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    return out;
}

std::string RenderLabel(const std::string& label_template, const Context& ctx) {
    std::string out;
    size_t pos = 0;
    while (pos < label_template.size()) {
        const size_t open = label_template.find("{{", pos);
        if (open == std::string::npos) {
            out.append(label_template, pos, std::string::npos);
            break;
        }
        out.append(label_template, pos, open - pos);

        const size_t close = label_template.find("}}", open + 2);
        if (close == std::string::npos) {
            throw TemplateError("unterminated placeholder at offset " + std::to_string(open) +
                                " in '" + label_template + "'");
        }
        const std::string key = Trim(label_template.substr(open + 2, close - open - 2));
        if (key.empty()) {
            throw TemplateError("empty placeholder at offset " + std::to_string(open) +
                                " in '" + label_template + "'");
        }

        auto it = ctx.find(key);
        if (it == ctx.end()) {
            throw TemplateError("'" + key + "' is undefined in label template '" +
                                label_template + "'");
        }
        out += EscapeLabelValue(ToString(it->second));
        pos = close + 2;
    }
    return out;
}

} // namespace Benchkit
