#include "counselscript/util/json.hpp"
#include "counselscript/error.hpp"

namespace counselscript::util {

namespace json = boost::json;

json::value to_json(const AttributeValue& value) {
    struct Visitor {
        json::value operator()(std::monostate) const { return nullptr; }
        json::value operator()(bool b) const { return b; }
        json::value operator()(std::int64_t i) const { return i; }
        json::value operator()(double d) const { return d; }
        json::value operator()(const std::string& s) const { return json::string(s); }
    };
    return std::visit(Visitor{}, value);
}

json::object to_json(const Attributes& attrs) {
    json::object obj;
    for (const auto& [key, value] : attrs) {
        obj[key] = to_json(value);
    }
    return obj;
}

Attributes attributes_from_json(const json::object& obj) {
    Attributes attrs;
    for (const auto& kv : obj) {
        const std::string key(kv.key());
        const json::value& v = kv.value();
        switch (v.kind()) {
            case json::kind::null:    attrs[key] = std::monostate{}; break;
            case json::kind::bool_:   attrs[key] = v.get_bool(); break;
            case json::kind::int64:   attrs[key] = v.get_int64(); break;
            case json::kind::uint64:  attrs[key] = static_cast<std::int64_t>(v.get_uint64()); break;
            case json::kind::double_: attrs[key] = v.get_double(); break;
            case json::kind::string:  attrs[key] = std::string(v.get_string()); break;
            default:                  attrs[key] = json::serialize(v); break;
        }
    }
    return attrs;
}

std::string serialize_attributes(const Attributes& attrs) {
    return json::serialize(to_json(attrs));
}

Attributes parse_attributes(const std::string& json_text) {
    if (json_text.empty()) return {};
    boost::system::error_code ec;
    json::value v = json::parse(json_text, ec);
    if (ec || !v.is_object()) {
        throw InvalidArgumentError("Malformed attribute JSON", ec ? ec.message() : "not an object");
    }
    return attributes_from_json(v.as_object());
}

} // namespace counselscript::util
