#include "counselscript/types.hpp"

#include <sstream>

namespace counselscript {

std::optional<double> attribute_as_double(const Attributes& attrs, const std::string& key) {
    auto it = attrs.find(key);
    if (it == attrs.end()) return std::nullopt;

    if (const auto* d = std::get_if<double>(&it->second)) return *d;
    if (const auto* i = std::get_if<std::int64_t>(&it->second)) return static_cast<double>(*i);
    if (const auto* b = std::get_if<bool>(&it->second)) return *b ? 1.0 : 0.0;
    if (const auto* s = std::get_if<std::string>(&it->second)) {
        try {
            size_t pos = 0;
            double v = std::stod(*s, &pos);
            if (pos == s->size()) return v;
        } catch (const std::exception&) {
            // not numeric text
        }
    }
    return std::nullopt;
}

std::optional<std::string> attribute_as_string(const Attributes& attrs, const std::string& key) {
    auto it = attrs.find(key);
    if (it == attrs.end() || std::holds_alternative<std::monostate>(it->second)) {
        return std::nullopt;
    }
    return attribute_to_string(it->second);
}

std::string attribute_to_string(const AttributeValue& value) {
    struct Visitor {
        std::string operator()(std::monostate) const { return ""; }
        std::string operator()(bool b) const { return b ? "true" : "false"; }
        std::string operator()(std::int64_t i) const { return std::to_string(i); }
        std::string operator()(double d) const {
            std::ostringstream ss;
            ss << d;
            return ss.str();
        }
        std::string operator()(const std::string& s) const { return s; }
    };
    return std::visit(Visitor{}, value);
}

} // namespace counselscript
