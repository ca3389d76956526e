#pragma once
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace ProcBridge {

/**
 * @brief Response could not be parsed, or had an unexpected shape
 */
class XmlRpcParseError : public std::runtime_error {
public:
    explicit XmlRpcParseError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @class XmlRpcValue
 * @brief Dynamically typed XML-RPC value (nil, scalar, array or struct)
 */
class XmlRpcValue {
public:
    enum class Type : uint8_t { NIL, BOOLEAN, INT, DOUBLE, STRING, ARRAY, STRUCT };

    using Array = std::vector<XmlRpcValue>;
    using Struct = std::map<std::string, XmlRpcValue>;

    XmlRpcValue() = default;
    XmlRpcValue(bool v) : type_(Type::BOOLEAN), bool_(v) {}
    XmlRpcValue(int v) : type_(Type::INT), int_(v) {}
    XmlRpcValue(int64_t v) : type_(Type::INT), int_(v) {}
    XmlRpcValue(double v) : type_(Type::DOUBLE), double_(v) {}
    XmlRpcValue(const char* v) : type_(Type::STRING), string_(v) {}
    XmlRpcValue(std::string v) : type_(Type::STRING), string_(std::move(v)) {}
    XmlRpcValue(Array v) : type_(Type::ARRAY), array_(std::move(v)) {}
    XmlRpcValue(Struct v) : type_(Type::STRUCT), struct_(std::move(v)) {}

    Type type() const { return type_; }
    bool isNil() const { return type_ == Type::NIL; }
    bool isArray() const { return type_ == Type::ARRAY; }
    bool isStruct() const { return type_ == Type::STRUCT; }

    // Typed accessors throw XmlRpcParseError on a type mismatch
    bool asBool() const;
    int64_t asInt() const;
    double asDouble() const;
    const std::string& asString() const;
    const Array& asArray() const;
    const Struct& asStruct() const;

    // Struct helpers; missing members or mismatched types yield the fallback
    const XmlRpcValue* member(const std::string& key) const;
    std::string memberString(const std::string& key, const std::string& fallback = std::string()) const;
    int64_t memberInt(const std::string& key, int64_t fallback = 0) const;

    static const char* typeName(Type type);

private:
    Type type_ = Type::NIL;
    bool bool_ = false;
    int64_t int_ = 0;
    double double_ = 0.0;
    std::string string_;
    Array array_;
    Struct struct_;
};

} // namespace ProcBridge
