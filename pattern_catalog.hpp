#pragma once

#include <memory>
#include <regex>
#include <string>
#include <vector>

// Version of the built-in heuristic list. Bump when the list changes.
constexpr int kBuiltinCatalogVersion = 1;

enum class PatternKind {
    Literal,
    BuiltIn
};

enum class BuiltinKind {
    SecretAssignment,   // password=..., token: ...
    BearerToken,        // Authorization: Bearer <token>
    UrlCredentials,     // scheme://user:<password>@host
    AwsAccessKey,       // AKIA + 16
    GithubToken,        // ghp_..., github_pat_...
    PrivateKeyBlock,    // PEM private key
    HighEntropyToken    // long random-looking token
};

// Half-open byte span [start, end) inside a payload.
struct Span {
    size_t start = 0;
    size_t end = 0;
};

const std::vector<BuiltinKind> &builtin_kinds();
const char *builtin_name(BuiltinKind kind);
const char *builtin_description(BuiltinKind kind);

// A matcher over text. Immutable once constructed.
class Pattern
{
public:
    static Pattern literal(std::string text, bool case_sensitive, size_t ordinal);
    static Pattern builtin(BuiltinKind kind);

    PatternKind kind() const { return kind_; }
    BuiltinKind builtin_kind() const { return builtin_; }

    // Safe to print: literals are reported as "literal#N", never by value.
    const std::string &name() const { return name_; }

    // Deduplication key.
    const std::string &normalized() const { return normalized_; }

    bool case_sensitive() const { return case_sensitive_; }

    // Appends every non-overlapping occurrence in text, leftmost first.
    void find_all(const std::string &text, std::vector<Span> &out) const;

private:
    Pattern() = default;

    void find_literal(const std::string &text, std::vector<Span> &out) const;
    void find_regex(const std::string &text, std::vector<Span> &out) const;

    PatternKind kind_ = PatternKind::Literal;
    BuiltinKind builtin_ = BuiltinKind::SecretAssignment;
    std::string name_;
    std::string normalized_;
    std::string literal_;
    bool case_sensitive_ = true;
    std::shared_ptr<const std::regex> regex_;
    int group_ = 0;
};

// Ordered, deduplicated set of patterns for one run.
class PatternCatalog
{
public:
    // Explicit literals come first, then the built-ins in their fixed order.
    // Throws RedactError(InvalidOptions) when the result would be empty or a
    // literal is empty.
    static PatternCatalog build(const std::vector<std::string> &explicit_patterns,
                                bool include_builtins,
                                bool ignore_case = false);

    const std::vector<Pattern> &patterns() const { return patterns_; }
    size_t size() const { return patterns_.size(); }

private:
    std::vector<Pattern> patterns_;
};
