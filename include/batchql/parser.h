#pragma once
// ═══════════════════════════════════════════════════════════════════
//  batchql/parser.h — Query and schema-definition parsers
// ═══════════════════════════════════════════════════════════════════
//
//    auto query  = graphql::parseQuery("{ dogs { name owner { name } } }");
//    auto schema = graphql::parseSchema("type Dog { name: String! }");
//
// ═══════════════════════════════════════════════════════════════════

#include "errors.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace batchql::graphql {

// ═══════════════════════════════════════════
//  Query document
// ═══════════════════════════════════════════

struct FieldSelection {
    std::string name;
    std::string alias;
    // Literal arguments. A variable reference is stored as the object
    // {"$var": "<name>"}; "$var" cannot be a key of a GraphQL literal.
    nlohmann::json arguments = nlohmann::json::object();
    std::vector<FieldSelection> selections;

    const std::string& responseKey() const { return alias.empty() ? name : alias; }
};

struct VariableDefinition {
    std::string name;
    std::string type;
    nlohmann::json defaultValue;
    bool hasDefault = false;
};

struct ParsedQuery {
    std::string operationType; // "query" or "mutation"
    std::string operationName;
    std::vector<VariableDefinition> variables;
    std::vector<FieldSelection> selections;
};

// Replace variable references in arguments with values from `variables`,
// falling back to the declared default and then to null.
nlohmann::json substituteVariables(const nlohmann::json& arguments,
                                   const nlohmann::json& variables,
                                   const std::vector<VariableDefinition>& definitions);

// ═══════════════════════════════════════════
//  Schema definition document
// ═══════════════════════════════════════════

struct TypeRef {
    std::string name;     // innermost named type
    std::string display;  // as written, e.g. "[Dog!]!"
    bool list = false;
    bool nonNull = false;
};

struct FieldDef {
    std::string name;
    TypeRef type;
};

enum class TypeKind { Scalar, Object, Interface, Union, Input, Enum };

struct TypeDef {
    std::string name;
    TypeKind kind = TypeKind::Object;
    std::vector<FieldDef> fields;
    std::vector<std::string> values; // enum values, union members

    const FieldDef* findField(const std::string& fieldName) const;
    bool isLeaf() const { return kind == TypeKind::Scalar || kind == TypeKind::Enum; }
};

struct SchemaDocument {
    std::vector<TypeDef> definitions;
    std::vector<TypeDef> extensions; // `extend type` blocks
    std::string queryType;
    std::string mutationType;
};

namespace detail {

// Character cursor shared by both parsers. Commas and `#` comments count
// as whitespace, as in the GraphQL grammar.
class Cursor {
public:
    explicit Cursor(const std::string& source) : source_(source), pos_(0) {}

protected:
    std::string source_;
    std::size_t pos_;

    char peek() const { return pos_ < source_.size() ? source_[pos_] : '\0'; }
    char advance() { return pos_ < source_.size() ? source_[pos_++] : '\0'; }
    bool atEnd() { skipWhitespace(); return pos_ >= source_.size(); }
    bool lookingAt(const std::string& text) const {
        return source_.compare(pos_, text.size(), text) == 0;
    }

    void skipWhitespace();
    void expect(char c);
    void skipBalanced(char open, char close);
    std::string parseIdentifier();
    std::string peekIdentifier();
    nlohmann::json parseValue();
    std::string parseString();
    nlohmann::json parseNumber();
    nlohmann::json parseObjectValue();
    nlohmann::json parseArrayValue();
    [[noreturn]] void fail(const std::string& message) const;

    static bool isIdentChar(char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
               (c >= '0' && c <= '9') || c == '_';
    }
};

class GraphQLParser : public Cursor {
public:
    explicit GraphQLParser(const std::string& source) : Cursor(source) {}

    ParsedQuery parse();

private:
    std::vector<VariableDefinition> parseVariableDefinitions();
    std::string parseTypeText();
    nlohmann::json parseArguments();
    FieldSelection parseField();
    std::vector<FieldSelection> parseSelectionSet();
};

class SchemaParser : public Cursor {
public:
    explicit SchemaParser(const std::string& source) : Cursor(source) {}

    SchemaDocument parse();

private:
    void skipDescription();
    void skipDirectives();
    void skipImplements();
    TypeRef parseTypeRef();
    std::vector<FieldDef> parseFieldsBlock();
    std::vector<std::string> parseEnumValues();
    std::vector<std::string> parseUnionMembers();
    void parseSchemaBlock(SchemaDocument& doc);
};

} // namespace detail

ParsedQuery parseQuery(const std::string& source);
SchemaDocument parseSchema(const std::string& source);

} // namespace batchql::graphql
