#include "invocation.hpp"
#include "util.hpp"
#include <cctype>
#include <cstdlib>
#include <set>

namespace {

struct OpEntry { Op op; const char* name; };

// Order is the order operations are listed to the model.
const OpEntry kOps[] = {
    {Op::Click, "click"},
    {Op::RightClick, "right_click"},
    {Op::DoubleClick, "double_click"},
    {Op::Drag, "drag"},
    {Op::Write, "write"},
    {Op::Remember, "remember"},
    {Op::Recall, "recall"},
    {Op::Help, "help"},
};

class Parser {
public:
    explicit Parser(const std::string& s): s_(s) {}

    std::optional<Invocation> parse(std::string& why) {
        Invocation inv;
        skip_ws();
        if (!identifier(inv.name)) { why = "expected identifier"; return std::nullopt; }
        while (peek() == '.') {
            ++i_;
            std::string part;
            if (!identifier(part)) { why = "expected attribute name"; return std::nullopt; }
            inv.name += "." + part;
        }
        auto dot = inv.name.rfind('.');
        std::string callee = dot == std::string::npos ? inv.name : inv.name.substr(dot + 1);
        auto op = op_from_name(callee);
        if (!op) { why = "unknown operation '" + callee + "'"; return std::nullopt; }
        inv.op = *op;

        skip_ws();
        if (peek() != '(') { why = "expected '('"; return std::nullopt; }
        ++i_;
        skip_ws();
        if (peek() != ')') {
            for (;;) {
                Literal lit;
                if (!literal(lit, why)) return std::nullopt;
                inv.args.push_back(std::move(lit));
                skip_ws();
                if (peek() == ',') {
                    ++i_;
                    skip_ws();
                    if (peek() == ')') break;  // trailing comma
                    continue;
                }
                if (peek() == ')') break;
                why = "expected ',' or ')'";
                return std::nullopt;
            }
        }
        ++i_;  // ')'
        skip_ws();
        if (peek() == '#') i_ = s_.size();
        if (i_ != s_.size()) { why = "trailing input after call"; return std::nullopt; }
        return inv;
    }

private:
    char peek() const { return i_ < s_.size() ? s_[i_] : '\0'; }
    void skip_ws() { while (i_ < s_.size() && (s_[i_] == ' ' || s_[i_] == '\t')) ++i_; }

    bool identifier(std::string& out) {
        if (!(std::isalpha((unsigned char)peek()) || peek() == '_')) return false;
        size_t b = i_;
        while (std::isalnum((unsigned char)peek()) || peek() == '_') ++i_;
        out = s_.substr(b, i_ - b);
        return true;
    }

    bool literal(Literal& out, std::string& why) {
        char c = peek();
        if (c == '"' || c == '\'') {
            out.type = Literal::String;
            return string_lit(out.str, why);
        }
        if (std::isdigit((unsigned char)c) || c == '.' || c == '-' || c == '+') {
            out.type = Literal::Number;
            return number(out.num, why);
        }
        why = "argument is not a literal";
        return false;
    }

    bool number(double& out, std::string& why) {
        size_t b = i_;
        if (peek() == '-' || peek() == '+') { ++i_; skip_ws(); }
        std::string text = s_[b] == '-' ? "-" : "";
        size_t digits = 0;
        while (std::isdigit((unsigned char)peek())) { text += s_[i_++]; ++digits; }
        if (peek() == '.') {
            text += s_[i_++];
            while (std::isdigit((unsigned char)peek())) { text += s_[i_++]; ++digits; }
        }
        if (digits == 0) { why = "malformed number"; return false; }
        if (peek() == 'e' || peek() == 'E') {
            text += s_[i_++];
            if (peek() == '-' || peek() == '+') text += s_[i_++];
            if (!std::isdigit((unsigned char)peek())) { why = "malformed exponent"; return false; }
            while (std::isdigit((unsigned char)peek())) text += s_[i_++];
        }
        if (std::isalpha((unsigned char)peek()) || peek() == '_') { why = "malformed number"; return false; }
        out = std::strtod(text.c_str(), nullptr);
        return true;
    }

    static void append_utf8(std::string& o, unsigned long cp) {
        if (cp < 0x80) o += (char)cp;
        else if (cp < 0x800) { o += (char)(0xC0 | (cp >> 6)); o += (char)(0x80 | (cp & 0x3F)); }
        else if (cp < 0x10000) {
            o += (char)(0xE0 | (cp >> 12)); o += (char)(0x80 | ((cp >> 6) & 0x3F));
            o += (char)(0x80 | (cp & 0x3F));
        } else {
            o += (char)(0xF0 | (cp >> 18)); o += (char)(0x80 | ((cp >> 12) & 0x3F));
            o += (char)(0x80 | ((cp >> 6) & 0x3F)); o += (char)(0x80 | (cp & 0x3F));
        }
    }

    bool hex_escape(std::string& o, size_t n, std::string& why) {
        if (i_ + n > s_.size()) { why = "truncated escape"; return false; }
        unsigned long cp = 0;
        for (size_t k = 0; k < n; ++k) {
            char h = s_[i_ + k];
            if (!std::isxdigit((unsigned char)h)) { why = "bad hex escape"; return false; }
            cp = cp * 16 + (unsigned long)(std::isdigit((unsigned char)h) ? h - '0' : (std::tolower((unsigned char)h) - 'a' + 10));
        }
        i_ += n;
        append_utf8(o, cp);
        return true;
    }

    bool string_lit(std::string& out, std::string& why) {
        char q = s_[i_++];
        out.clear();
        while (i_ < s_.size()) {
            char c = s_[i_++];
            if (c == q) return true;
            if (c != '\\') { out += c; continue; }
            if (i_ >= s_.size()) break;
            char e = s_[i_++];
            switch (e) {
                case 'n': out += '\n'; break;
                case 't': out += '\t'; break;
                case 'r': out += '\r'; break;
                case '0': out += '\0'; break;
                case 'a': out += '\a'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'v': out += '\v'; break;
                case '\\': out += '\\'; break;
                case '\'': out += '\''; break;
                case '"': out += '"'; break;
                case 'x': if (!hex_escape(out, 2, why)) return false; break;
                case 'u': if (!hex_escape(out, 4, why)) return false; break;
                case 'U': if (!hex_escape(out, 8, why)) return false; break;
                default: out += '\\'; out += e; break;
            }
        }
        why = "unterminated string";
        return false;
    }

    const std::string& s_;
    size_t i_ = 0;
};

// Bodies of ``` fences, optionally tagged python/py. The opening fence must
// be followed by a newline; an unclosed fence ends the scan.
std::vector<std::string> fenced_blocks(const std::string& raw) {
    std::vector<std::string> blocks;
    size_t pos = 0;
    while ((pos = raw.find("```", pos)) != std::string::npos) {
        size_t p = pos + 3;
        if (raw.compare(p, 6, "python") == 0) p += 6;
        else if (raw.compare(p, 2, "py") == 0) p += 2;
        size_t last_nl = std::string::npos;
        while (p < raw.size() && std::isspace((unsigned char)raw[p])) {
            if (raw[p] == '\n') last_nl = p;
            ++p;
        }
        if (last_nl == std::string::npos) { pos += 1; continue; }
        size_t start = last_nl + 1;
        size_t end = raw.find("```", start);
        if (end == std::string::npos) break;
        blocks.push_back(raw.substr(start, end - start));
        pos = end + 3;
    }
    return blocks;
}

}  // namespace

const char* op_name(Op op) {
    for (const auto& e : kOps) if (e.op == op) return e.name;
    return "?";
}

std::optional<Op> op_from_name(const std::string& name) {
    for (const auto& e : kOps) if (name == e.name) return e.op;
    return std::nullopt;
}

std::string operation_list() {
    std::string s;
    for (const auto& e : kOps) {
        if (!s.empty()) s += ", ";
        s += e.name;
    }
    return s;
}

std::optional<Invocation> parse_invocation(const std::string& line, std::string* why) {
    std::string reason;
    Parser p(line);
    auto r = p.parse(reason);
    if (!r && why) *why = reason;
    return r;
}

std::vector<std::string> extract_invocations(const std::string& raw) {
    std::vector<std::string> sources;
    auto blocks = fenced_blocks(raw);
    if (!blocks.empty()) {
        std::string joined;
        for (const auto& b : blocks) {
            if (!joined.empty()) joined += "\n";
            joined += trim(b);
        }
        sources.push_back(joined);
    }
    sources.push_back(raw);

    std::vector<std::string> out;
    std::set<std::string> seen;
    for (const auto& src : sources) {
        for (const auto& line : split_lines(src)) {
            std::string t = trim(line);
            if (t.empty() || seen.count(t)) continue;
            seen.insert(t);
            if (parse_invocation(t)) out.push_back(t);
        }
    }
    return out;
}
