#include <procbridge/core/control/xmlrpc_codec.hpp>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace ProcBridge {

namespace {

void appendUtf8(std::string& out, unsigned long cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::string decodeEntities(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] != '&') {
            out += raw[i];
            continue;
        }
        auto semi = raw.find(';', i);
        if (semi == std::string::npos)
            throw XmlRpcParseError("Unterminated entity in XML text");
        std::string ent = raw.substr(i + 1, semi - i - 1);
        if (ent == "lt")        out += '<';
        else if (ent == "gt")   out += '>';
        else if (ent == "amp")  out += '&';
        else if (ent == "quot") out += '"';
        else if (ent == "apos") out += '\'';
        else if (ent.size() > 1 && ent[0] == '#') {
            bool hex = ent[1] == 'x' || ent[1] == 'X';
            const char* digits = ent.c_str() + (hex ? 2 : 1);
            char* end = nullptr;
            unsigned long cp = std::strtoul(digits, &end, hex ? 16 : 10);
            if (end == digits || *end != '\0' || cp > 0x10FFFF)
                throw XmlRpcParseError("Bad character reference: &" + ent + ";");
            appendUtf8(out, cp);
        } else {
            throw XmlRpcParseError("Unknown entity: &" + ent + ";");
        }
        i = semi;
    }
    return out;
}

struct Tag {
    std::string name;
    bool closing = false;
    bool selfClosing = false;
};

/**
 * Forward-only cursor over the response document. Only the subset of
 * XML that XML-RPC servers emit is understood: elements, text, entities,
 * the prolog and comments. Attributes are skipped.
 */
class XmlCursor {
public:
    explicit XmlCursor(const std::string& doc) : doc_(doc) {}

    void skipWhitespace() {
        while (pos_ < doc_.size() && std::isspace(static_cast<unsigned char>(doc_[pos_]))) ++pos_;
    }

    // Skip whitespace, the <?xml ...?> prolog and comments
    void skipMisc() {
        while (true) {
            skipWhitespace();
            if (doc_.compare(pos_, 2, "<?") == 0) {
                skipPast("?>");
            } else if (doc_.compare(pos_, 4, "<!--") == 0) {
                skipPast("-->");
            } else {
                return;
            }
        }
    }

    Tag readTag() {
        skipMisc();
        if (pos_ >= doc_.size() || doc_[pos_] != '<')
            throw XmlRpcParseError("Expected '<' at offset " + std::to_string(pos_));
        ++pos_;

        Tag tag;
        if (pos_ < doc_.size() && doc_[pos_] == '/') {
            tag.closing = true;
            ++pos_;
        }
        size_t start = pos_;
        while (pos_ < doc_.size() && !std::isspace(static_cast<unsigned char>(doc_[pos_])) &&
               doc_[pos_] != '>' && doc_[pos_] != '/') {
            ++pos_;
        }
        tag.name = doc_.substr(start, pos_ - start);
        if (tag.name.empty())
            throw XmlRpcParseError("Empty tag name at offset " + std::to_string(start));

        auto close = doc_.find('>', pos_);
        if (close == std::string::npos)
            throw XmlRpcParseError("Unterminated tag <" + tag.name + ">");
        tag.selfClosing = close > pos_ && doc_[close - 1] == '/';
        pos_ = close + 1;
        return tag;
    }

    Tag peekTag() {
        size_t saved = pos_;
        Tag tag = readTag();
        pos_ = saved;
        return tag;
    }

    // Raw text up to the next '<', entity-decoded
    std::string readText() {
        auto next = doc_.find('<', pos_);
        if (next == std::string::npos)
            throw XmlRpcParseError("Unexpected end of document in text");
        std::string raw = doc_.substr(pos_, next - pos_);
        pos_ = next;
        return decodeEntities(raw);
    }

    bool atClosing(const std::string& name) {
        size_t saved = pos_;
        skipWhitespace();
        bool result = doc_.compare(pos_, name.size() + 2, "</" + name) == 0;
        pos_ = saved;
        return result;
    }

    Tag expectOpen(const std::string& name) {
        Tag tag = readTag();
        if (tag.closing || tag.name != name)
            throw XmlRpcParseError("Expected <" + name + ">, got <" + (tag.closing ? "/" : "") + tag.name + ">");
        return tag;
    }

    void expectClose(const std::string& name) {
        Tag tag = readTag();
        if (!tag.closing || tag.name != name)
            throw XmlRpcParseError("Expected </" + name + ">, got <" + (tag.closing ? "/" : "") + tag.name + ">");
    }

    void expectEnd() {
        skipMisc();
        if (pos_ != doc_.size())
            throw XmlRpcParseError("Trailing data after document end");
    }

private:
    void skipPast(const char* marker) {
        auto end = doc_.find(marker, pos_);
        if (end == std::string::npos)
            throw XmlRpcParseError(std::string("Unterminated markup, missing '") + marker + "'");
        pos_ = end + std::strlen(marker);
    }

    const std::string& doc_;
    size_t pos_ = 0;
};

int64_t parseInt(const std::string& text) {
    std::string t = text;
    while (!t.empty() && std::isspace(static_cast<unsigned char>(t.back()))) t.pop_back();
    size_t lead = 0;
    while (lead < t.size() && std::isspace(static_cast<unsigned char>(t[lead]))) ++lead;
    t = t.substr(lead);
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(t.c_str(), &end, 10);
    if (t.empty() || errno != 0 || *end != '\0')
        throw XmlRpcParseError("Bad integer value: '" + text + "'");
    return static_cast<int64_t>(v);
}

// Text content of a typed element whose open tag was already read
std::string scalarText(XmlCursor& cur, const Tag& open) {
    if (open.selfClosing) return std::string();
    std::string text = cur.readText();
    cur.expectClose(open.name);
    return text;
}

XmlRpcValue parseValue(XmlCursor& cur);

XmlRpcValue parseArray(XmlCursor& cur) {
    XmlRpcValue::Array items;
    Tag data = cur.expectOpen("data");
    if (!data.selfClosing) {
        while (!cur.atClosing("data")) {
            items.push_back(parseValue(cur));
        }
        cur.expectClose("data");
    }
    cur.expectClose("array");
    return XmlRpcValue(std::move(items));
}

XmlRpcValue parseStruct(XmlCursor& cur) {
    XmlRpcValue::Struct members;
    while (!cur.atClosing("struct")) {
        cur.expectOpen("member");
        Tag nameTag = cur.expectOpen("name");
        std::string name = scalarText(cur, nameTag);
        members[name] = parseValue(cur);
        cur.expectClose("member");
    }
    cur.expectClose("struct");
    return XmlRpcValue(std::move(members));
}

XmlRpcValue parseValue(XmlCursor& cur) {
    Tag open = cur.expectOpen("value");
    if (open.selfClosing) return XmlRpcValue(std::string());

    // <value>text</value> without a type element is a string
    std::string text = cur.readText();
    if (cur.atClosing("value")) {
        cur.expectClose("value");
        return XmlRpcValue(std::move(text));
    }

    Tag typed = cur.readTag();
    if (typed.closing)
        throw XmlRpcParseError("Unexpected </" + typed.name + "> inside <value>");

    XmlRpcValue result;
    const std::string& t = typed.name;
    if (t == "i4" || t == "int" || t == "i8") {
        result = XmlRpcValue(parseInt(scalarText(cur, typed)));
    } else if (t == "boolean") {
        std::string b = scalarText(cur, typed);
        if (b == "1") result = XmlRpcValue(true);
        else if (b == "0") result = XmlRpcValue(false);
        else throw XmlRpcParseError("Bad boolean value: '" + b + "'");
    } else if (t == "double") {
        std::string d = scalarText(cur, typed);
        char* end = nullptr;
        double v = std::strtod(d.c_str(), &end);
        if (d.empty() || *end != '\0')
            throw XmlRpcParseError("Bad double value: '" + d + "'");
        result = XmlRpcValue(v);
    } else if (t == "string" || t == "base64" || t == "dateTime.iso8601") {
        result = XmlRpcValue(scalarText(cur, typed));
    } else if (t == "nil") {
        if (!typed.selfClosing) cur.expectClose("nil");
    } else if (t == "array") {
        if (!typed.selfClosing) result = parseArray(cur);
        else result = XmlRpcValue(XmlRpcValue::Array{});
    } else if (t == "struct") {
        if (!typed.selfClosing) result = parseStruct(cur);
        else result = XmlRpcValue(XmlRpcValue::Struct{});
    } else {
        throw XmlRpcParseError("Unsupported XML-RPC type <" + t + ">");
    }

    cur.expectClose("value");
    return result;
}

void encodeValue(std::string& out, const XmlRpcValue& v) {
    out += "<value>";
    switch (v.type()) {
        case XmlRpcValue::Type::NIL:
            out += "<nil/>";
            break;
        case XmlRpcValue::Type::BOOLEAN:
            out += v.asBool() ? "<boolean>1</boolean>" : "<boolean>0</boolean>";
            break;
        case XmlRpcValue::Type::INT:
            out += "<int>" + std::to_string(v.asInt()) + "</int>";
            break;
        case XmlRpcValue::Type::DOUBLE:
            out += "<double>" + std::to_string(v.asDouble()) + "</double>";
            break;
        case XmlRpcValue::Type::STRING:
            out += "<string>" + xmlEscape(v.asString()) + "</string>";
            break;
        case XmlRpcValue::Type::ARRAY:
            out += "<array><data>";
            for (const auto& item : v.asArray()) encodeValue(out, item);
            out += "</data></array>";
            break;
        case XmlRpcValue::Type::STRUCT:
            out += "<struct>";
            for (const auto& kv : v.asStruct()) {
                out += "<member><name>" + xmlEscape(kv.first) + "</name>";
                encodeValue(out, kv.second);
                out += "</member>";
            }
            out += "</struct>";
            break;
    }
    out += "</value>";
}

} // anonymous namespace

std::string xmlEscape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default:  out += c; break;
        }
    }
    return out;
}

std::string encodeMethodCall(const std::string& method, const std::vector<XmlRpcValue>& params) {
    std::string out = "<?xml version=\"1.0\"?>\n<methodCall><methodName>";
    out += xmlEscape(method);
    out += "</methodName><params>";
    for (const auto& p : params) {
        out += "<param>";
        encodeValue(out, p);
        out += "</param>";
    }
    out += "</params></methodCall>\n";
    return out;
}

XmlRpcValue decodeMethodResponse(const std::string& xml) {
    XmlCursor cur(xml);
    cur.expectOpen("methodResponse");

    Tag body = cur.readTag();
    if (body.closing)
        throw XmlRpcParseError("Empty <methodResponse>");

    if (body.name == "fault") {
        XmlRpcValue fault = parseValue(cur);
        cur.expectClose("fault");
        cur.expectClose("methodResponse");
        if (!fault.isStruct())
            throw XmlRpcParseError("Fault value is not a struct");
        throw RpcFault(static_cast<int>(fault.memberInt("faultCode", 0)),
                       fault.memberString("faultString", "unknown fault"));
    }

    if (body.name != "params")
        throw XmlRpcParseError("Unexpected <" + body.name + "> in <methodResponse>");

    XmlRpcValue result;
    if (!body.selfClosing) {
        if (!cur.atClosing("params")) {
            cur.expectOpen("param");
            result = parseValue(cur);
            cur.expectClose("param");
        }
        cur.expectClose("params");
    }
    cur.expectClose("methodResponse");
    cur.expectEnd();
    return result;
}

} // namespace ProcBridge
