#include "prompt_matcher.hpp"

static const std::string kCwd = "{cwd}";

static void replace_all(std::string& s, const std::string& from, const std::string& to) {
    std::size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

bool PromptPattern::matches(const std::string& text) const {
    if (text.size() < prefix.size() + suffix.size()) return false;
    if (text.size() > max_length()) return false;
    if (text.compare(0, prefix.size(), prefix) != 0) return false;
    if (text.compare(text.size() - suffix.size(), suffix.size(), suffix) != 0) return false;

    std::size_t middle = text.size() - prefix.size() - suffix.size();
    if (!has_wildcard) return middle == 0;
    auto wild = text.substr(prefix.size(), middle);
    return wild.find_first_of("\r\n") == std::string::npos;
}

// ── PromptTemplate ───────────────────────────────────────────

PromptTemplate::PromptTemplate(std::string tmpl, std::size_t max_cwd)
    : tmpl_(std::move(tmpl)), max_cwd_(max_cwd) {}

Result<PromptTemplate> PromptTemplate::create(const std::string& tmpl, std::size_t max_cwd) {
    auto first = tmpl.find(kCwd);
    if (first != std::string::npos && tmpl.find(kCwd, first + 1) != std::string::npos) {
        return Result<PromptTemplate>::Err("Prompt template may contain at most one {cwd}");
    }
    if (first == 0) {
        return Result<PromptTemplate>::Err("Prompt template must start with literal text");
    }
    if (tmpl.empty()) {
        return Result<PromptTemplate>::Err("Prompt template is empty");
    }
    if (tmpl.find_first_of("\r\n") != std::string::npos) {
        return Result<PromptTemplate>::Err("Prompt template must be a single line");
    }
    return Result<PromptTemplate>::Ok(PromptTemplate(tmpl, max_cwd));
}

PromptPattern PromptTemplate::instantiate(const std::string& user, const std::string& host) const {
    std::string text = tmpl_;
    replace_all(text, "{user}", user);
    replace_all(text, "{host}", host);

    PromptPattern pattern;
    auto pos = text.find(kCwd);
    if (pos == std::string::npos) {
        pattern.prefix = text;
    } else {
        pattern.prefix = text.substr(0, pos);
        pattern.suffix = text.substr(pos + kCwd.size());
        pattern.has_wildcard = true;
        pattern.max_wildcard = max_cwd_;
    }
    return pattern;
}

// ── PromptMatcher ────────────────────────────────────────────

PromptMatcher::PromptMatcher(PromptPattern pattern, uint64_t start_offset)
    : pattern_(std::move(pattern)), offset_(start_offset), line_start_(start_offset) {
    line_.reserve(pattern_.max_length());
}

std::vector<PromptBoundary> PromptMatcher::feed(const std::string& bytes) {
    return feed(bytes.data(), bytes.size());
}

std::vector<PromptBoundary> PromptMatcher::feed(const char* data, std::size_t len) {
    std::vector<PromptBoundary> found;

    for (std::size_t i = 0; i < len; ++i, ++offset_) {
        char c = data[i];

        if (c == '\n' || c == '\r') {
            line_.clear();
            candidate_ = true;
            line_start_ = offset_ + 1;
            continue;
        }

        if (!candidate_) continue;

        line_.push_back(c);
        if (check_candidate()) {
            found.push_back({line_start_, offset_ + 1});
            candidate_ = false;
        }
        if (!candidate_) line_.clear();
    }

    return found;
}

// Called after each byte appended to line_. Returns true on a complete
// prompt; clears candidate_ once the line can no longer become one.
bool PromptMatcher::check_candidate() {
    const auto& p = pattern_;
    std::size_t n = line_.size();

    if (n <= p.prefix.size()) {
        if (line_[n - 1] != p.prefix[n - 1]) {
            candidate_ = false;
            return false;
        }
        return n == p.prefix.size() && !p.has_wildcard && p.suffix.empty();
    }

    if (n > p.max_length()) {
        candidate_ = false;
        return false;
    }

    if (!p.has_wildcard) {
        std::size_t i = n - p.prefix.size() - 1;
        if (line_[n - 1] != p.suffix[i]) {
            candidate_ = false;
            return false;
        }
        return n == p.prefix.size() + p.suffix.size();
    }

    return n >= p.prefix.size() + p.suffix.size() &&
           line_.compare(n - p.suffix.size(), p.suffix.size(), p.suffix) == 0;
}
