#include "calcexpr/json.hpp"

#include <optional>
#include <vector>

#include <fmt/format.h>

namespace calcexpr {

// -----------------------------
// Writer
// -----------------------------
static void write_string(std::string& out, std::string_view s) {
    out += '"';
    for (char ch : s) {
        unsigned char c = static_cast<unsigned char>(ch);
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            default:
                if (c < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    out += ch;
                }
        }
    }
    out += '"';
}

static void write_node(std::string& out, const Expr& e) {
    if (e.is_literal()) {
        out += "{\"type\":\"number\",\"value\":";
        write_string(out, e.as_literal().value);
        out += '}';
        return;
    }

    if (e.is_variable()) {
        const Variable& v = e.as_variable();
        out += "{\"type\":\"input\",\"value\":";
        write_string(out, v.name);
        if (v.label) {
            out += ",\"label\":";
            write_string(out, *v.label);
        }
        out += '}';
        return;
    }

    const BinaryOp& bin = e.as_binary();
    out += "{\"type\":\"operator\",\"value\":";
    write_string(out, std::string(1, op_symbol(bin.op)));
    out += ",\"children\":[";
    write_node(out, *bin.left);
    out += ',';
    write_node(out, *bin.right);
    out += "]}";
}

std::string to_json(const Expr& expr) {
    std::string out;
    write_node(out, expr);
    return out;
}

// -----------------------------
// Reader
// -----------------------------
namespace {

class Reader {
public:
    explicit Reader(std::string_view s) : s_(s) {}

    Expr read_document() {
        skip_ws();
        Expr e = read_node(0);
        skip_ws();
        if (!is_end()) fail("Trailing content after formula document");
        return e;
    }

private:
    [[noreturn]] void fail(std::string_view msg) const {
        throw FormatError(fmt::format("{} (offset {})", msg, i_));
    }

    bool is_end() const { return i_ >= s_.size(); }

    void skip_ws() {
        while (!is_end() && (s_[i_] == ' ' || s_[i_] == '\t' || s_[i_] == '\n' || s_[i_] == '\r')) ++i_;
    }

    char peek() {
        skip_ws();
        if (is_end()) fail("Unexpected end of document");
        return s_[i_];
    }

    void expect(char c) {
        if (peek() != c) fail(fmt::format("Expected '{}'", c));
        ++i_;
    }

    // Node nesting d means a tree at least d + 1 deep, so this accepts every
    // tree Expr::binary can build and nothing deeper.
    void check_depth(std::size_t depth) const {
        if (depth >= kMaxExprDepth) {
            fail(fmt::format("Formula document nested deeper than {} levels", kMaxExprDepth));
        }
    }

    Expr read_node(std::size_t depth) {
        check_depth(depth);
        expect('{');

        std::optional<std::string> type;
        std::optional<std::string> value;
        std::optional<std::string> label;
        std::optional<std::vector<Expr>> children;

        if (peek() == '}') fail("Empty formula node");

        for (;;) {
            std::string key = read_string();
            expect(':');

            if (key == "type") {
                if (type) fail("Duplicate key \"type\"");
                type = read_string();
            } else if (key == "value") {
                if (value) fail("Duplicate key \"value\"");
                value = read_string();
            } else if (key == "label") {
                if (label) fail("Duplicate key \"label\"");
                if (peek() == 'n') {
                    read_literal("null");
                } else {
                    label = read_string();
                }
            } else if (key == "children") {
                if (children) fail("Duplicate key \"children\"");
                children = read_children(depth);
            } else {
                skip_value(depth + 1);
            }

            char c = peek();
            ++i_;
            if (c == '}') break;
            if (c != ',') fail("Expected ',' or '}' in formula node");
        }

        return make_node(std::move(type), std::move(value), std::move(label), std::move(children));
    }

    std::vector<Expr> read_children(std::size_t depth) {
        std::vector<Expr> out;
        expect('[');
        if (peek() == ']') {
            ++i_;
            return out;
        }
        for (;;) {
            out.push_back(read_node(depth + 1));
            char c = peek();
            ++i_;
            if (c == ']') break;
            if (c != ',') fail("Expected ',' or ']' in children");
        }
        return out;
    }

    Expr make_node(std::optional<std::string> type,
                   std::optional<std::string> value,
                   std::optional<std::string> label,
                   std::optional<std::vector<Expr>> children) const {
        if (!type) fail("Formula node without \"type\"");
        if (!value) fail("Formula node without \"value\"");

        if (*type == "number") {
            if (children) fail("Number node must not have children");
            if (!is_valid_literal(*value)) fail(fmt::format("Invalid numeric literal '{}'", *value));
            return Expr::literal(std::move(*value));
        }

        if (*type == "input") {
            if (children) fail("Input node must not have children");
            if (value->empty()) fail("Input node with empty name");
            return Expr::variable(std::move(*value), std::move(label));
        }

        if (*type == "operator") {
            std::optional<Op> op;
            if (value->size() == 1) op = op_from_symbol((*value)[0]);
            if (!op) fail(fmt::format("Unsupported operator '{}'", *value));
            if (!children || children->size() != 2) fail("Operator node needs exactly two children");
            return Expr::binary(*op, std::move((*children)[0]), std::move((*children)[1]));
        }

        fail(fmt::format("Unsupported node type '{}'", *type));
    }

    static unsigned hex_value(char c) {
        if (c >= '0' && c <= '9') return static_cast<unsigned>(c - '0');
        if (c >= 'a' && c <= 'f') return static_cast<unsigned>(c - 'a' + 10);
        if (c >= 'A' && c <= 'F') return static_cast<unsigned>(c - 'A' + 10);
        return 16;
    }

    unsigned read_hex4() {
        if (i_ + 4 > s_.size()) fail("Truncated \\u escape");
        unsigned v = 0;
        for (int k = 0; k < 4; ++k) {
            unsigned h = hex_value(s_[i_++]);
            if (h > 15) fail("Invalid \\u escape");
            v = (v << 4) | h;
        }
        return v;
    }

    static void append_utf8(std::string& out, unsigned cp) {
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

    std::string read_string() {
        expect('"');
        std::string out;
        for (;;) {
            if (is_end()) fail("Unterminated string");
            char c = s_[i_++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("Control character in string");
            if (c != '\\') {
                out += c;
                continue;
            }
            if (is_end()) fail("Unterminated escape");
            char esc = s_[i_++];
            switch (esc) {
                case '"':  out += '"'; break;
                case '\\': out += '\\'; break;
                case '/':  out += '/'; break;
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'u': {
                    unsigned cp = read_hex4();
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        if (i_ + 2 > s_.size() || s_[i_] != '\\' || s_[i_ + 1] != 'u') {
                            fail("Unpaired surrogate in \\u escape");
                        }
                        i_ += 2;
                        unsigned lo = read_hex4();
                        if (lo < 0xDC00 || lo > 0xDFFF) fail("Unpaired surrogate in \\u escape");
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                    } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                        fail("Unpaired surrogate in \\u escape");
                    }
                    append_utf8(out, cp);
                } break;
                default:
                    fail(fmt::format("Invalid escape '\\{}'", esc));
            }
        }
        return out;
    }

    void read_literal(std::string_view word) {
        skip_ws();
        if (s_.substr(i_, word.size()) != word) fail("Invalid literal");
        i_ += word.size();
    }

    // Unknown keys: consume any JSON value without interpreting it.
    void skip_value(std::size_t depth) {
        check_depth(depth);
        char c = peek();
        switch (c) {
            case '"':
                read_string();
                return;
            case 't': read_literal("true"); return;
            case 'f': read_literal("false"); return;
            case 'n': read_literal("null"); return;
            case '{': {
                ++i_;
                if (peek() == '}') { ++i_; return; }
                for (;;) {
                    read_string();
                    expect(':');
                    skip_value(depth + 1);
                    char d = peek();
                    ++i_;
                    if (d == '}') return;
                    if (d != ',') fail("Expected ',' or '}' in object");
                }
            }
            case '[': {
                ++i_;
                if (peek() == ']') { ++i_; return; }
                for (;;) {
                    skip_value(depth + 1);
                    char d = peek();
                    ++i_;
                    if (d == ']') return;
                    if (d != ',') fail("Expected ',' or ']' in array");
                }
            }
            default:
                break;
        }

        std::size_t start = i_;
        while (!is_end()) {
            char d = s_[i_];
            bool numeric = (d >= '0' && d <= '9') || d == '-' || d == '+' || d == '.' || d == 'e' || d == 'E';
            if (!numeric) break;
            ++i_;
        }
        if (i_ == start) fail("Invalid JSON value");
    }

    std::string_view s_;
    std::size_t i_{0};
};

} // namespace

Expr from_json(std::string_view json) {
    return Reader(json).read_document();
}

} // namespace calcexpr
