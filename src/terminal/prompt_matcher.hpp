#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <core/types.hpp>

// A concrete prompt shape: literal prefix, then (optionally) a bounded
// wildcard that may not contain line terminators, then a literal suffix.
// "[alice@box ~]$ " is prefix "[alice@box ", wildcard "~", suffix "]$ ".
struct PromptPattern {
    std::string prefix;
    std::string suffix;
    bool has_wildcard = false;
    std::size_t max_wildcard = 0;

    // Longest byte sequence that can still be a prompt
    std::size_t max_length() const {
        return prefix.size() + (has_wildcard ? max_wildcard : 0) + suffix.size();
    }

    // Whole-string match (no anchoring concerns)
    bool matches(const std::string& text) const;
};

// Template with {user} and {host} placeholders and at most one {cwd}
// wildcard, e.g. "[{user}@{host} {cwd}]$ ".
class PromptTemplate {
public:
    PromptTemplate() = default;
    explicit PromptTemplate(std::string tmpl, std::size_t max_cwd = 255);

    // Validates placeholders: at most one {cwd}, non-empty literal text.
    static Result<PromptTemplate> create(const std::string& tmpl, std::size_t max_cwd = 255);

    PromptPattern instantiate(const std::string& user, const std::string& host) const;

    const std::string& text() const { return tmpl_; }

private:
    std::string tmpl_;
    std::size_t max_cwd_ = 255;
};

// Where a recognized prompt sits in the session byte stream
struct PromptBoundary {
    uint64_t start;    // session-relative offset of the prompt's first byte
    uint64_t end;      // offset just past the prompt's last byte
};

// Incremental, start-of-line anchored prompt recognizer.
//
// feed() consumes the next slice of the stream and reports every prompt that
// completed inside it, including ones whose bytes began in an earlier slice.
// Only bytes of the current line are carried between calls, and never more
// than the pattern's max_length(). A line holds at most one prompt.
// Nothing is ever synthesized: a boundary is reported only for bytes seen.
class PromptMatcher {
public:
    explicit PromptMatcher(PromptPattern pattern, uint64_t start_offset = 0);

    std::vector<PromptBoundary> feed(const std::string& bytes);
    std::vector<PromptBoundary> feed(const char* data, std::size_t len);

    // Total bytes consumed so far (next byte's offset)
    uint64_t offset() const { return offset_; }

    const PromptPattern& pattern() const { return pattern_; }

    // Bytes currently held as a possible prompt start
    std::size_t carry_size() const { return line_.size(); }

private:
    PromptPattern pattern_;
    uint64_t offset_;
    uint64_t line_start_;
    std::string line_;
    bool candidate_ = true;

    bool check_candidate();
};
