#include <procbridge/core/control/xmlrpc_value.hpp>

namespace ProcBridge {

namespace {

[[noreturn]] void mismatch(XmlRpcValue::Type actual, XmlRpcValue::Type wanted) {
    throw XmlRpcParseError(std::string("XML-RPC value is ") + XmlRpcValue::typeName(actual) +
                           ", expected " + XmlRpcValue::typeName(wanted));
}

} // anonymous namespace

const char* XmlRpcValue::typeName(Type type) {
    switch (type) {
        case Type::NIL:     return "nil";
        case Type::BOOLEAN: return "boolean";
        case Type::INT:     return "int";
        case Type::DOUBLE:  return "double";
        case Type::STRING:  return "string";
        case Type::ARRAY:   return "array";
        case Type::STRUCT:  return "struct";
        default:            return "unknown";
    }
}

bool XmlRpcValue::asBool() const {
    if (type_ != Type::BOOLEAN) mismatch(type_, Type::BOOLEAN);
    return bool_;
}

int64_t XmlRpcValue::asInt() const {
    if (type_ != Type::INT) mismatch(type_, Type::INT);
    return int_;
}

double XmlRpcValue::asDouble() const {
    if (type_ == Type::INT) return static_cast<double>(int_);
    if (type_ != Type::DOUBLE) mismatch(type_, Type::DOUBLE);
    return double_;
}

const std::string& XmlRpcValue::asString() const {
    if (type_ != Type::STRING) mismatch(type_, Type::STRING);
    return string_;
}

const XmlRpcValue::Array& XmlRpcValue::asArray() const {
    if (type_ != Type::ARRAY) mismatch(type_, Type::ARRAY);
    return array_;
}

const XmlRpcValue::Struct& XmlRpcValue::asStruct() const {
    if (type_ != Type::STRUCT) mismatch(type_, Type::STRUCT);
    return struct_;
}

const XmlRpcValue* XmlRpcValue::member(const std::string& key) const {
    if (type_ != Type::STRUCT) return nullptr;
    auto it = struct_.find(key);
    return it != struct_.end() ? &it->second : nullptr;
}

std::string XmlRpcValue::memberString(const std::string& key, const std::string& fallback) const {
    const XmlRpcValue* v = member(key);
    if (!v) return fallback;
    if (v->type_ == Type::STRING) return v->string_;
    if (v->type_ == Type::INT) return std::to_string(v->int_);
    return fallback;
}

int64_t XmlRpcValue::memberInt(const std::string& key, int64_t fallback) const {
    const XmlRpcValue* v = member(key);
    if (!v) return fallback;
    if (v->type_ == Type::INT) return v->int_;
    if (v->type_ == Type::BOOLEAN) return v->bool_ ? 1 : 0;
    return fallback;
}

} // namespace ProcBridge
