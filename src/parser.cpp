// ═══════════════════════════════════════════════════════════════════
//  src/parser.cpp — Query and SDL parsing
// ═══════════════════════════════════════════════════════════════════

#include "batchql/parser.h"
#include <cctype>
#include <stdexcept>

namespace batchql::graphql {

const FieldDef* TypeDef::findField(const std::string& fieldName) const {
    for (auto& f : fields) {
        if (f.name == fieldName) return &f;
    }
    return nullptr;
}

namespace detail {

// ═══════════════════════════════════════════
//  Cursor
// ═══════════════════════════════════════════

void Cursor::fail(const std::string& message) const {
    throw SyntaxError(message + " at position " + std::to_string(pos_), pos_);
}

void Cursor::skipWhitespace() {
    while (pos_ < source_.size()) {
        char c = source_[pos_];
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == ',') {
            pos_++;
        } else if (c == '#') {
            while (pos_ < source_.size() && source_[pos_] != '\n') pos_++;
        } else {
            break;
        }
    }
}

void Cursor::expect(char c) {
    skipWhitespace();
    if (peek() != c) {
        fail(std::string("Expected '") + c + "'");
    }
    advance();
}

void Cursor::skipBalanced(char open, char close) {
    expect(open);
    int depth = 1;
    while (depth > 0) {
        if (pos_ >= source_.size()) fail(std::string("Unterminated '") + open + "'");
        char c = advance();
        if (c == '"') {
            pos_--;
            parseString();
            continue;
        }
        if (c == open) depth++;
        if (c == close) depth--;
    }
}

std::string Cursor::parseIdentifier() {
    skipWhitespace();
    std::string result;
    while (pos_ < source_.size() && isIdentChar(source_[pos_])) {
        result += source_[pos_++];
    }
    if (result.empty()) fail("Expected identifier");
    return result;
}

std::string Cursor::peekIdentifier() {
    skipWhitespace();
    std::size_t end = pos_;
    while (end < source_.size() && isIdentChar(source_[end])) end++;
    return source_.substr(pos_, end - pos_);
}

nlohmann::json Cursor::parseValue() {
    skipWhitespace();
    char c = peek();

    if (c == '"') return parseString();
    if (c == '-' || (c >= '0' && c <= '9')) return parseNumber();
    if (c == '{') return parseObjectValue();
    if (c == '[') return parseArrayValue();
    if (c == '$') {
        advance();
        return nlohmann::json{{"$var", parseIdentifier()}};
    }

    auto word = parseIdentifier();
    if (word == "true") return true;
    if (word == "false") return false;
    if (word == "null") return nullptr;
    return word; // enum value
}

std::string Cursor::parseString() {
    skipWhitespace();
    if (lookingAt("\"\"\"")) {
        pos_ += 3;
        auto end = source_.find("\"\"\"", pos_);
        if (end == std::string::npos) fail("Unterminated block string");
        auto text = source_.substr(pos_, end - pos_);
        pos_ = end + 3;
        return text;
    }

    expect('"');
    std::string result;
    while (peek() != '"') {
        if (pos_ >= source_.size() || peek() == '\n') fail("Unterminated string");
        if (peek() == '\\') {
            advance();
            char esc = advance();
            switch (esc) {
                case 'n': result += '\n'; break;
                case 't': result += '\t'; break;
                case 'r': result += '\r'; break;
                case 'b': result += '\b'; break;
                case 'f': result += '\f'; break;
                case 'u': {
                    if (pos_ + 4 > source_.size()) fail("Bad unicode escape");
                    for (std::size_t i = 0; i < 4; ++i) {
                        if (!std::isxdigit(static_cast<unsigned char>(source_[pos_ + i])))
                            fail("Bad unicode escape");
                    }
                    unsigned code = std::stoul(source_.substr(pos_, 4), nullptr, 16);
                    pos_ += 4;
                    // BMP only; encode as UTF-8
                    if (code < 0x80) {
                        result += static_cast<char>(code);
                    } else if (code < 0x800) {
                        result += static_cast<char>(0xC0 | (code >> 6));
                        result += static_cast<char>(0x80 | (code & 0x3F));
                    } else {
                        result += static_cast<char>(0xE0 | (code >> 12));
                        result += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
                        result += static_cast<char>(0x80 | (code & 0x3F));
                    }
                    break;
                }
                default: result += esc; break;
            }
        } else {
            result += advance();
        }
    }
    advance();
    return result;
}

nlohmann::json Cursor::parseNumber() {
    skipWhitespace();
    std::string numStr;
    bool isFloat = false;
    if (peek() == '-') numStr += advance();
    while (peek() >= '0' && peek() <= '9') numStr += advance();
    if (peek() == '.') {
        isFloat = true;
        numStr += advance();
        while (peek() >= '0' && peek() <= '9') numStr += advance();
    }
    if (peek() == 'e' || peek() == 'E') {
        isFloat = true;
        numStr += advance();
        if (peek() == '+' || peek() == '-') numStr += advance();
        while (peek() >= '0' && peek() <= '9') numStr += advance();
    }
    if (numStr.empty() || numStr == "-") fail("Expected number");

    // Out of range or malformed literals ("-.", "1e", 99999999999999999999)
    std::size_t used = 0;
    nlohmann::json value;
    try {
        value = isFloat ? nlohmann::json(std::stod(numStr, &used))
                        : nlohmann::json(std::stoll(numStr, &used));
    } catch (const std::invalid_argument&) {
        fail("Invalid number");
    } catch (const std::out_of_range&) {
        fail("Invalid number");
    }
    if (used != numStr.size()) fail("Invalid number");
    return value;
}

nlohmann::json Cursor::parseObjectValue() {
    expect('{');
    nlohmann::json obj = nlohmann::json::object();
    skipWhitespace();
    while (peek() != '}') {
        if (pos_ >= source_.size()) fail("Unterminated object value");
        auto key = parseIdentifier();
        expect(':');
        obj[key] = parseValue();
        skipWhitespace();
    }
    expect('}');
    return obj;
}

nlohmann::json Cursor::parseArrayValue() {
    expect('[');
    nlohmann::json arr = nlohmann::json::array();
    skipWhitespace();
    while (peek() != ']') {
        if (pos_ >= source_.size()) fail("Unterminated list value");
        arr.push_back(parseValue());
        skipWhitespace();
    }
    expect(']');
    return arr;
}

// ═══════════════════════════════════════════
//  GraphQLParser — operations
// ═══════════════════════════════════════════

ParsedQuery GraphQLParser::parse() {
    ParsedQuery result;
    skipWhitespace();

    if (peek() == '{') {
        result.operationType = "query";
    } else {
        auto keyword = parseIdentifier();
        if (keyword == "query" || keyword == "mutation") {
            result.operationType = keyword;
        } else {
            fail("Expected 'query' or 'mutation', got '" + keyword + "'");
        }

        skipWhitespace();
        if (peek() != '{' && peek() != '(') {
            result.operationName = parseIdentifier();
            skipWhitespace();
        }

        if (peek() == '(') {
            result.variables = parseVariableDefinitions();
        }
    }

    result.selections = parseSelectionSet();
    if (!atEnd()) fail("Unexpected trailing content");
    return result;
}

std::vector<VariableDefinition> GraphQLParser::parseVariableDefinitions() {
    std::vector<VariableDefinition> defs;
    expect('(');
    skipWhitespace();
    while (peek() != ')') {
        VariableDefinition def;
        expect('$');
        def.name = parseIdentifier();
        expect(':');
        def.type = parseTypeText();
        skipWhitespace();
        if (peek() == '=') {
            advance();
            def.defaultValue = parseValue();
            def.hasDefault = true;
        }
        defs.push_back(std::move(def));
        skipWhitespace();
        if (pos_ >= source_.size()) fail("Unterminated variable definitions");
    }
    expect(')');
    return defs;
}

std::string GraphQLParser::parseTypeText() {
    skipWhitespace();
    std::string text;
    if (peek() == '[') {
        advance();
        text = "[" + parseTypeText();
        expect(']');
        text += "]";
    } else {
        text = parseIdentifier();
    }
    skipWhitespace();
    if (peek() == '!') {
        advance();
        text += "!";
    }
    return text;
}

nlohmann::json GraphQLParser::parseArguments() {
    expect('(');
    nlohmann::json args = nlohmann::json::object();
    skipWhitespace();
    while (peek() != ')') {
        if (pos_ >= source_.size()) fail("Unterminated arguments");
        auto name = parseIdentifier();
        expect(':');
        args[name] = parseValue();
        skipWhitespace();
    }
    expect(')');
    return args;
}

FieldSelection GraphQLParser::parseField() {
    FieldSelection field;
    auto nameOrAlias = parseIdentifier();
    skipWhitespace();

    if (peek() == ':') {
        advance();
        field.alias = nameOrAlias;
        field.name = parseIdentifier();
        skipWhitespace();
    } else {
        field.name = nameOrAlias;
    }

    if (peek() == '(') {
        field.arguments = parseArguments();
    }

    skipWhitespace();
    if (peek() == '{') {
        field.selections = parseSelectionSet();
    }
    return field;
}

std::vector<FieldSelection> GraphQLParser::parseSelectionSet() {
    expect('{');
    std::vector<FieldSelection> selections;
    skipWhitespace();

    while (peek() != '}') {
        if (pos_ >= source_.size()) fail("Unterminated selection set");
        selections.push_back(parseField());
        skipWhitespace();
    }

    expect('}');
    if (selections.empty()) fail("Empty selection set");
    return selections;
}

// ═══════════════════════════════════════════
//  SchemaParser — type system definitions
// ═══════════════════════════════════════════

void SchemaParser::skipDescription() {
    skipWhitespace();
    if (peek() == '"') parseString();
}

void SchemaParser::skipDirectives() {
    skipWhitespace();
    while (peek() == '@') {
        advance();
        parseIdentifier();
        skipWhitespace();
        if (peek() == '(') skipBalanced('(', ')');
        skipWhitespace();
    }
}

void SchemaParser::skipImplements() {
    if (peekIdentifier() != "implements") return;
    parseIdentifier();
    skipWhitespace();
    if (peek() == '&') advance();
    parseIdentifier();
    skipWhitespace();
    while (peek() == '&') {
        advance();
        parseIdentifier();
        skipWhitespace();
    }
}

TypeRef SchemaParser::parseTypeRef() {
    skipWhitespace();
    TypeRef ref;
    if (peek() == '[') {
        advance();
        auto inner = parseTypeRef();
        expect(']');
        ref.name = inner.name;
        ref.display = "[" + inner.display + "]";
        ref.list = true;
    } else {
        ref.name = parseIdentifier();
        ref.display = ref.name;
    }
    skipWhitespace();
    if (peek() == '!') {
        advance();
        ref.nonNull = true;
        ref.display += "!";
    }
    return ref;
}

std::vector<FieldDef> SchemaParser::parseFieldsBlock() {
    std::vector<FieldDef> fields;
    expect('{');
    skipWhitespace();
    while (peek() != '}') {
        if (pos_ >= source_.size()) fail("Unterminated field block");
        skipDescription();
        FieldDef field;
        field.name = parseIdentifier();
        skipWhitespace();
        if (peek() == '(') skipBalanced('(', ')');
        expect(':');
        field.type = parseTypeRef();
        skipWhitespace();
        // Input fields may carry a default value.
        if (peek() == '=') {
            advance();
            parseValue();
        }
        skipDirectives();
        fields.push_back(std::move(field));
        skipWhitespace();
    }
    expect('}');
    return fields;
}

std::vector<std::string> SchemaParser::parseEnumValues() {
    std::vector<std::string> values;
    expect('{');
    skipWhitespace();
    while (peek() != '}') {
        if (pos_ >= source_.size()) fail("Unterminated enum");
        skipDescription();
        values.push_back(parseIdentifier());
        skipDirectives();
    }
    expect('}');
    return values;
}

std::vector<std::string> SchemaParser::parseUnionMembers() {
    std::vector<std::string> members;
    expect('=');
    skipWhitespace();
    if (peek() == '|') advance();
    members.push_back(parseIdentifier());
    skipWhitespace();
    while (peek() == '|') {
        advance();
        members.push_back(parseIdentifier());
        skipWhitespace();
    }
    return members;
}

void SchemaParser::parseSchemaBlock(SchemaDocument& doc) {
    skipDirectives();
    expect('{');
    skipWhitespace();
    while (peek() != '}') {
        if (pos_ >= source_.size()) fail("Unterminated schema block");
        auto operation = parseIdentifier();
        expect(':');
        auto typeName = parseIdentifier();
        if (operation == "query") {
            doc.queryType = typeName;
        } else if (operation == "mutation") {
            doc.mutationType = typeName;
        }
        skipWhitespace();
    }
    expect('}');
}

SchemaDocument SchemaParser::parse() {
    SchemaDocument doc;

    while (!atEnd()) {
        skipDescription();
        auto keyword = parseIdentifier();
        bool extension = false;
        if (keyword == "extend") {
            extension = true;
            keyword = parseIdentifier();
        }

        if (keyword == "schema") {
            parseSchemaBlock(doc);
            continue;
        }

        TypeDef def;
        if (keyword == "type") {
            def.kind = TypeKind::Object;
        } else if (keyword == "interface") {
            def.kind = TypeKind::Interface;
        } else if (keyword == "input") {
            def.kind = TypeKind::Input;
        } else if (keyword == "enum") {
            def.kind = TypeKind::Enum;
        } else if (keyword == "scalar") {
            def.kind = TypeKind::Scalar;
        } else if (keyword == "union") {
            def.kind = TypeKind::Union;
        } else {
            fail("Unsupported definition '" + keyword + "'");
        }

        def.name = parseIdentifier();
        skipImplements();
        skipDirectives();
        skipWhitespace();

        switch (def.kind) {
            case TypeKind::Object:
            case TypeKind::Interface:
            case TypeKind::Input:
                if (peek() == '{') def.fields = parseFieldsBlock();
                break;
            case TypeKind::Enum:
                if (peek() == '{') def.values = parseEnumValues();
                break;
            case TypeKind::Union:
                if (peek() == '=') def.values = parseUnionMembers();
                break;
            case TypeKind::Scalar:
                break;
        }

        (extension ? doc.extensions : doc.definitions).push_back(std::move(def));
    }
    return doc;
}

} // namespace detail

// ═══════════════════════════════════════════
//  Free functions
// ═══════════════════════════════════════════

ParsedQuery parseQuery(const std::string& source) {
    detail::GraphQLParser parser(source);
    return parser.parse();
}

SchemaDocument parseSchema(const std::string& source) {
    detail::SchemaParser parser(source);
    return parser.parse();
}

nlohmann::json substituteVariables(const nlohmann::json& arguments,
                                   const nlohmann::json& variables,
                                   const std::vector<VariableDefinition>& definitions) {
    if (arguments.is_object()) {
        if (arguments.size() == 1 && arguments.contains("$var") && arguments["$var"].is_string()) {
            const auto& name = arguments["$var"].get_ref<const std::string&>();
            if (variables.is_object() && variables.contains(name)) {
                return variables[name];
            }
            for (auto& def : definitions) {
                if (def.name == name && def.hasDefault) return def.defaultValue;
            }
            return nullptr;
        }
        nlohmann::json out = nlohmann::json::object();
        for (auto& [key, value] : arguments.items()) {
            out[key] = substituteVariables(value, variables, definitions);
        }
        return out;
    }
    if (arguments.is_array()) {
        nlohmann::json out = nlohmann::json::array();
        for (auto& value : arguments) {
            out.push_back(substituteVariables(value, variables, definitions));
        }
        return out;
    }
    return arguments;
}

} // namespace batchql::graphql
