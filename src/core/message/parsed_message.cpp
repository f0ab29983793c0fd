#include <eventwire/core/message/parsed_message.hpp>
#include <regex>

namespace EventWire {

const HeaderValue* ParsedMessage::findHeader(std::string_view key) const {
    auto it = headers.find(std::string(key));
    if (it == headers.end()) return nullptr;
    return &it->second;
}

const std::string* ParsedMessage::findStringHeader(std::string_view key) const {
    const HeaderValue* value = findHeader(key);
    if (!value) return nullptr;
    return std::get_if<std::string>(value);
}

bool isJsonContentType(std::string_view contentType) {
    // ECMAScript '.' does not match line terminators
    static const std::regex kJsonContentType("application/.*json.*");
    return std::regex_match(contentType.begin(), contentType.end(), kJsonContentType);
}

} // namespace EventWire
