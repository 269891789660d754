#pragma once

#include "error.hpp"
#include "types.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <fmt/format.h>

namespace stepwise::debug {

/// Result of evaluating a guest expression
class value {
public:
    value() = default;
    explicit value(bool b) : v_(b) {}
    explicit value(double d) : v_(d) {}
    explicit value(std::string s) : v_(std::move(s)) {}
    explicit value(const char* s) : v_(std::string(s)) {}

    [[nodiscard]] bool is_nil() const noexcept { return std::holds_alternative<std::monostate>(v_); }
    [[nodiscard]] bool is_bool() const noexcept { return std::holds_alternative<bool>(v_); }
    [[nodiscard]] bool is_number() const noexcept { return std::holds_alternative<double>(v_); }
    [[nodiscard]] bool is_string() const noexcept { return std::holds_alternative<std::string>(v_); }

    [[nodiscard]] bool as_bool() const { return std::get<bool>(v_); }
    [[nodiscard]] double as_number() const { return std::get<double>(v_); }
    [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(v_); }

    /// Only nil and false are falsy
    [[nodiscard]] bool truthy() const noexcept {
        if (is_nil()) return false;
        if (auto* b = std::get_if<bool>(&v_)) return *b;
        return true;
    }

    [[nodiscard]] const char* type_name() const noexcept {
        switch (v_.index()) {
            case 0: return "nil";
            case 1: return "boolean";
            case 2: return "number";
            default: return "string";
        }
    }

    [[nodiscard]] std::string render() const {
        switch (v_.index()) {
            case 0: return "nil";
            case 1: return as_bool() ? "true" : "false";
            case 2: {
                double d = as_number();
                if (std::isfinite(d) && d == std::trunc(d) && std::fabs(d) < 1e15) {
                    return fmt::format("{}", static_cast<long long>(d));
                }
                return fmt::format("{}", d);
            }
            default: return as_string();
        }
    }

    bool operator==(const value&) const = default;

    /// Interpret a captured variable using its type tag
    static value from_variable(const variable& var) {
        const auto& t = var.type;
        if (t == "nil") return value();
        if (t == "boolean" || t == "bool") return value(var.value == "true");
        if (t == "number" || t == "integer" || t == "float") {
            double d = 0;
            auto [ptr, ec] = std::from_chars(var.value.data(), var.value.data() + var.value.size(), d);
            if (ec == std::errc{} && ptr == var.value.data() + var.value.size()) {
                return value(d);
            }
            return value(var.value);
        }
        if (t == "string" && var.value.size() >= 2 &&
            (var.value.front() == '"' || var.value.front() == '\'') &&
            var.value.back() == var.value.front()) {
            return value(var.value.substr(1, var.value.size() - 2));
        }
        return value(var.value);
    }

private:
    std::variant<std::monostate, bool, double, std::string> v_;
};

/// Names visible to an expression: frame locals first, then globals
struct evaluation_scope {
    std::span<const variable> locals;
    std::span<const variable> globals;

    [[nodiscard]] const variable* lookup(std::string_view name) const noexcept {
        for (const auto& v : locals) {
            if (v.name == name) return &v;
        }
        for (const auto& v : globals) {
            if (v.name == name) return &v;
        }
        return nullptr;
    }
};

/// Parsed expression, reusable across pauses
class compiled_expression {
public:
    explicit compiled_expression(std::string text) : text_(std::move(text)) {}
    virtual ~compiled_expression() = default;

    [[nodiscard]] virtual debug_result<value> evaluate(const evaluation_scope& scope) const = 0;

    [[nodiscard]] const std::string& text() const noexcept { return text_; }

private:
    std::string text_;
};

using compiled_expression_ptr = std::shared_ptr<const compiled_expression>;

/// Guest-language expression support used for conditions and watches.
/// Embedders with a real interpreter plug their own evaluator in here.
class expression_evaluator {
public:
    virtual ~expression_evaluator() = default;

    [[nodiscard]] virtual debug_result<compiled_expression_ptr> compile(std::string_view text) const = 0;

    [[nodiscard]] debug_result<value> evaluate(std::string_view text, const evaluation_scope& scope) const {
        auto compiled = compile(text);
        if (!compiled) {
            return std::unexpected(compiled.error());
        }
        return (*compiled)->evaluate(scope);
    }

    /// Truthiness of a compiled guard
    [[nodiscard]] static debug_result<bool> evaluate_condition(const compiled_expression& expr,
                                                              const evaluation_scope& scope) {
        auto result = expr.evaluate(scope);
        if (!result) {
            return std::unexpected(result.error());
        }
        return result->truthy();
    }
};

namespace detail {

enum class token_kind : uint8_t {
    end, number, string, name,
    kw_and, kw_or, kw_not, kw_true, kw_false, kw_nil,
    eq, ne, lt, le, gt, ge,
    plus, minus, star, slash, percent, concat,
    lparen, rparen, dot
};

struct token {
    token_kind kind = token_kind::end;
    std::string text;
    double number = 0;
};

class lexer {
public:
    explicit lexer(std::string_view src) : src_(src) {}

    debug_result<std::vector<token>> run() {
        std::vector<token> out;
        while (true) {
            skip_space();
            if (pos_ >= src_.size()) {
                out.push_back(token{});
                return out;
            }
            auto tok = next();
            if (!tok) return std::unexpected(tok.error());
            out.push_back(std::move(*tok));
        }
    }

private:
    void skip_space() {
        while (pos_ < src_.size() && std::isspace(static_cast<unsigned char>(src_[pos_]))) ++pos_;
    }

    bool peek_is(char c, size_t ahead = 0) const {
        return pos_ + ahead < src_.size() && src_[pos_ + ahead] == c;
    }

    debug_result<token> next() {
        char c = src_[pos_];
        if (std::isdigit(static_cast<unsigned char>(c)) ||
            (c == '.' && pos_ + 1 < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_ + 1])))) {
            return number();
        }
        if (c == '"' || c == '\'') {
            return string(c);
        }
        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            return name();
        }
        auto two = [&](token_kind k) { pos_ += 2; return token{k, {}, 0}; };
        auto one = [&](token_kind k) { pos_ += 1; return token{k, {}, 0}; };
        switch (c) {
            case '=': if (peek_is('=', 1)) return two(token_kind::eq); break;
            case '~': if (peek_is('=', 1)) return two(token_kind::ne); break;
            case '!': if (peek_is('=', 1)) return two(token_kind::ne); break;
            case '<': return peek_is('=', 1) ? two(token_kind::le) : one(token_kind::lt);
            case '>': return peek_is('=', 1) ? two(token_kind::ge) : one(token_kind::gt);
            case '+': return one(token_kind::plus);
            case '-': return one(token_kind::minus);
            case '*': return one(token_kind::star);
            case '/': return one(token_kind::slash);
            case '%': return one(token_kind::percent);
            case '(': return one(token_kind::lparen);
            case ')': return one(token_kind::rparen);
            case '.': return peek_is('.', 1) ? two(token_kind::concat) : one(token_kind::dot);
            default: break;
        }
        return make_error(debug_errc::evaluation_error, "unexpected '{}' at offset {}", c, pos_);
    }

    debug_result<token> number() {
        size_t start = pos_;
        while (pos_ < src_.size() &&
               (std::isdigit(static_cast<unsigned char>(src_[pos_])) || src_[pos_] == '.' ||
                src_[pos_] == 'e' || src_[pos_] == 'E' ||
                ((src_[pos_] == '+' || src_[pos_] == '-') && pos_ > start &&
                 (src_[pos_ - 1] == 'e' || src_[pos_ - 1] == 'E')))) {
            ++pos_;
        }
        double d = 0;
        auto text = src_.substr(start, pos_ - start);
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), d);
        if (ec != std::errc{} || ptr != text.data() + text.size()) {
            return make_error(debug_errc::evaluation_error, "malformed number '{}'", text);
        }
        return token{token_kind::number, std::string(text), d};
    }

    debug_result<token> string(char quote) {
        ++pos_;
        std::string text;
        while (pos_ < src_.size() && src_[pos_] != quote) {
            if (src_[pos_] == '\\' && pos_ + 1 < src_.size()) {
                ++pos_;
                switch (src_[pos_]) {
                    case 'n': text.push_back('\n'); break;
                    case 't': text.push_back('\t'); break;
                    default: text.push_back(src_[pos_]); break;
                }
            } else {
                text.push_back(src_[pos_]);
            }
            ++pos_;
        }
        if (pos_ >= src_.size()) {
            return make_error(debug_errc::evaluation_error, "unterminated string");
        }
        ++pos_;
        return token{token_kind::string, std::move(text), 0};
    }

    debug_result<token> name() {
        size_t start = pos_;
        while (pos_ < src_.size() &&
               (std::isalnum(static_cast<unsigned char>(src_[pos_])) || src_[pos_] == '_')) {
            ++pos_;
        }
        std::string text(src_.substr(start, pos_ - start));
        token_kind kind = token_kind::name;
        if (text == "and") kind = token_kind::kw_and;
        else if (text == "or") kind = token_kind::kw_or;
        else if (text == "not") kind = token_kind::kw_not;
        else if (text == "true") kind = token_kind::kw_true;
        else if (text == "false") kind = token_kind::kw_false;
        else if (text == "nil") kind = token_kind::kw_nil;
        return token{kind, std::move(text), 0};
    }

    std::string_view src_;
    size_t pos_ = 0;
};

struct ast_node {
    enum class op : uint8_t {
        literal, lookup, negate, logical_not,
        logical_and, logical_or,
        eq, ne, lt, le, gt, ge,
        add, sub, mul, div, mod, concat
    };

    op kind = op::literal;
    value literal;
    std::string path;    // dotted name for lookups
    uint32_t height = 1;
    std::unique_ptr<ast_node> lhs;
    std::unique_ptr<ast_node> rhs;
};

using ast_ptr = std::unique_ptr<ast_node>;

class parser {
public:
    /// Bound on parenthesis/unary nesting and on tree height; evaluation
    /// and destruction recurse over the tree
    static constexpr uint32_t max_depth = 200;

    explicit parser(std::vector<token> tokens) : tokens_(std::move(tokens)) {}

    debug_result<ast_ptr> parse() {
        auto root = parse_or();
        if (!root) return root;
        if (peek().kind != token_kind::end) {
            return make_error(debug_errc::evaluation_error, "unexpected trailing input");
        }
        return root;
    }

private:
    const token& peek() const { return tokens_[pos_]; }

    bool accept(token_kind kind) {
        if (peek().kind == kind) {
            ++pos_;
            return true;
        }
        return false;
    }

    static debug_result<ast_ptr> binary(ast_node::op kind, ast_ptr lhs, ast_ptr rhs) {
        uint32_t height = 1 + std::max(lhs ? lhs->height : 0u, rhs ? rhs->height : 0u);
        if (height > max_depth) {
            return make_error(debug_errc::evaluation_error, "expression nested deeper than {}", max_depth);
        }
        auto node = std::make_unique<ast_node>();
        node->kind = kind;
        node->height = height;
        node->lhs = std::move(lhs);
        node->rhs = std::move(rhs);
        return node;
    }

    class depth_guard {
    public:
        explicit depth_guard(uint32_t& depth) : depth_(depth) { ++depth_; }
        ~depth_guard() { --depth_; }
        depth_guard(const depth_guard&) = delete;
        depth_guard& operator=(const depth_guard&) = delete;

        [[nodiscard]] bool exceeded() const noexcept { return depth_ > max_depth; }

    private:
        uint32_t& depth_;
    };

    static debug_result<ast_ptr> too_deep() {
        return make_error(debug_errc::evaluation_error, "expression nested deeper than {}", max_depth);
    }

    debug_result<ast_ptr> parse_or() {
        auto lhs = parse_and();
        while (lhs && accept(token_kind::kw_or)) {
            auto rhs = parse_and();
            if (!rhs) return rhs;
            lhs = binary(ast_node::op::logical_or, std::move(*lhs), std::move(*rhs));
        }
        return lhs;
    }

    debug_result<ast_ptr> parse_and() {
        auto lhs = parse_not();
        while (lhs && accept(token_kind::kw_and)) {
            auto rhs = parse_not();
            if (!rhs) return rhs;
            lhs = binary(ast_node::op::logical_and, std::move(*lhs), std::move(*rhs));
        }
        return lhs;
    }

    debug_result<ast_ptr> parse_not() {
        if (accept(token_kind::kw_not)) {
            depth_guard guard(depth_);
            if (guard.exceeded()) return too_deep();
            auto operand = parse_not();
            if (!operand) return operand;
            return binary(ast_node::op::logical_not, std::move(*operand), nullptr);
        }
        return parse_compare();
    }

    debug_result<ast_ptr> parse_compare() {
        auto lhs = parse_concat();
        if (!lhs) return lhs;
        ast_node::op kind;
        switch (peek().kind) {
            case token_kind::eq: kind = ast_node::op::eq; break;
            case token_kind::ne: kind = ast_node::op::ne; break;
            case token_kind::lt: kind = ast_node::op::lt; break;
            case token_kind::le: kind = ast_node::op::le; break;
            case token_kind::gt: kind = ast_node::op::gt; break;
            case token_kind::ge: kind = ast_node::op::ge; break;
            default: return lhs;
        }
        ++pos_;
        auto rhs = parse_concat();
        if (!rhs) return rhs;
        return binary(kind, std::move(*lhs), std::move(*rhs));
    }

    debug_result<ast_ptr> parse_concat() {
        auto lhs = parse_additive();
        while (lhs && accept(token_kind::concat)) {
            auto rhs = parse_additive();
            if (!rhs) return rhs;
            lhs = binary(ast_node::op::concat, std::move(*lhs), std::move(*rhs));
        }
        return lhs;
    }

    debug_result<ast_ptr> parse_additive() {
        auto lhs = parse_term();
        while (lhs) {
            ast_node::op kind;
            if (accept(token_kind::plus)) kind = ast_node::op::add;
            else if (accept(token_kind::minus)) kind = ast_node::op::sub;
            else break;
            auto rhs = parse_term();
            if (!rhs) return rhs;
            lhs = binary(kind, std::move(*lhs), std::move(*rhs));
        }
        return lhs;
    }

    debug_result<ast_ptr> parse_term() {
        auto lhs = parse_unary();
        while (lhs) {
            ast_node::op kind;
            if (accept(token_kind::star)) kind = ast_node::op::mul;
            else if (accept(token_kind::slash)) kind = ast_node::op::div;
            else if (accept(token_kind::percent)) kind = ast_node::op::mod;
            else break;
            auto rhs = parse_unary();
            if (!rhs) return rhs;
            lhs = binary(kind, std::move(*lhs), std::move(*rhs));
        }
        return lhs;
    }

    debug_result<ast_ptr> parse_unary() {
        if (accept(token_kind::minus)) {
            depth_guard guard(depth_);
            if (guard.exceeded()) return too_deep();
            auto operand = parse_unary();
            if (!operand) return operand;
            return binary(ast_node::op::negate, std::move(*operand), nullptr);
        }
        return parse_primary();
    }

    debug_result<ast_ptr> parse_primary() {
        auto node = std::make_unique<ast_node>();
        const token& tok = peek();
        switch (tok.kind) {
            case token_kind::number:
                node->literal = value(tok.number);
                ++pos_;
                return node;
            case token_kind::string:
                node->literal = value(tok.text);
                ++pos_;
                return node;
            case token_kind::kw_true:
                node->literal = value(true);
                ++pos_;
                return node;
            case token_kind::kw_false:
                node->literal = value(false);
                ++pos_;
                return node;
            case token_kind::kw_nil:
                ++pos_;
                return node;
            case token_kind::name:
                node->kind = ast_node::op::lookup;
                node->path = tok.text;
                ++pos_;
                while (peek().kind == token_kind::dot) {
                    ++pos_;
                    if (peek().kind != token_kind::name) {
                        return make_error(debug_errc::evaluation_error, "expected field name after '.'");
                    }
                    node->path += '.';
                    node->path += peek().text;
                    ++pos_;
                }
                return node;
            case token_kind::lparen: {
                ++pos_;
                depth_guard guard(depth_);
                if (guard.exceeded()) return too_deep();
                auto inner = parse_or();
                if (!inner) return inner;
                if (!accept(token_kind::rparen)) {
                    return make_error(debug_errc::evaluation_error, "expected ')'");
                }
                return inner;
            }
            case token_kind::end:
                return make_error(debug_errc::evaluation_error, "unexpected end of expression");
            default:
                return make_error(debug_errc::evaluation_error, "unexpected token");
        }
    }

    std::vector<token> tokens_;
    size_t pos_ = 0;
    uint32_t depth_ = 0;
};

class ast_expression final : public compiled_expression {
public:
    ast_expression(std::string text, ast_ptr root)
        : compiled_expression(std::move(text)), root_(std::move(root)) {}

    debug_result<value> evaluate(const evaluation_scope& scope) const override {
        return eval(*root_, scope);
    }

private:
    static debug_result<value> eval(const ast_node& node, const evaluation_scope& scope) {
        using op = ast_node::op;
        switch (node.kind) {
            case op::literal:
                return node.literal;
            case op::lookup: {
                auto* var = scope.lookup(node.path);
                if (var == nullptr) {
                    return make_error(debug_errc::evaluation_error, "undefined variable '{}'", node.path);
                }
                return value::from_variable(*var);
            }
            case op::logical_not: {
                auto v = eval(*node.lhs, scope);
                if (!v) return v;
                return value(!v->truthy());
            }
            case op::logical_and: {
                auto l = eval(*node.lhs, scope);
                if (!l || !l->truthy()) return l;
                return eval(*node.rhs, scope);
            }
            case op::logical_or: {
                auto l = eval(*node.lhs, scope);
                if (!l || l->truthy()) return l;
                return eval(*node.rhs, scope);
            }
            case op::negate: {
                auto v = eval(*node.lhs, scope);
                if (!v) return v;
                if (!v->is_number()) {
                    return make_error(debug_errc::evaluation_error, "cannot negate a {}", v->type_name());
                }
                return value(-v->as_number());
            }
            default:
                break;
        }

        auto l = eval(*node.lhs, scope);
        if (!l) return l;
        auto r = eval(*node.rhs, scope);
        if (!r) return r;

        switch (node.kind) {
            case op::eq: return value(*l == *r);
            case op::ne: return value(!(*l == *r));
            case op::lt: case op::le: case op::gt: case op::ge:
                return compare(node.kind, *l, *r);
            case op::concat:
                if (l->is_nil() || r->is_nil() || l->is_bool() || r->is_bool()) {
                    return make_error(debug_errc::evaluation_error, "cannot concatenate a {} and a {}",
                                      l->type_name(), r->type_name());
                }
                return value(l->render() + r->render());
            default:
                return arithmetic(node.kind, *l, *r);
        }
    }

    static debug_result<value> compare(ast_node::op kind, const value& l, const value& r) {
        using op = ast_node::op;
        int cmp = 0;
        if (l.is_number() && r.is_number()) {
            cmp = l.as_number() < r.as_number() ? -1 : (l.as_number() > r.as_number() ? 1 : 0);
        } else if (l.is_string() && r.is_string()) {
            int c = l.as_string().compare(r.as_string());
            cmp = c < 0 ? -1 : (c > 0 ? 1 : 0);
        } else {
            return make_error(debug_errc::evaluation_error, "cannot compare {} with {}",
                              l.type_name(), r.type_name());
        }
        switch (kind) {
            case op::lt: return value(cmp < 0);
            case op::le: return value(cmp <= 0);
            case op::gt: return value(cmp > 0);
            default:     return value(cmp >= 0);
        }
    }

    static debug_result<value> arithmetic(ast_node::op kind, const value& l, const value& r) {
        using op = ast_node::op;
        if (!l.is_number() || !r.is_number()) {
            return make_error(debug_errc::evaluation_error, "arithmetic on a {} and a {}",
                              l.type_name(), r.type_name());
        }
        double a = l.as_number();
        double b = r.as_number();
        switch (kind) {
            case op::add: return value(a + b);
            case op::sub: return value(a - b);
            case op::mul: return value(a * b);
            case op::div: return value(a / b);
            default:
                if (b == 0) {
                    return make_error(debug_errc::evaluation_error, "modulo by zero");
                }
                return value(a - std::floor(a / b) * b);
        }
    }

    ast_ptr root_;
};

} // namespace detail

/// Built-in evaluator for a small Lua-flavoured expression language:
/// literals, dotted names resolved against captured variables,
/// arithmetic, `..`, comparisons (`~=` and `!=` both mean not-equal)
/// and `and` / `or` / `not`.
class simple_evaluator final : public expression_evaluator {
public:
    debug_result<compiled_expression_ptr> compile(std::string_view text) const override {
        detail::lexer lex(text);
        auto tokens = lex.run();
        if (!tokens) {
            return std::unexpected(tokens.error());
        }
        detail::parser p(std::move(*tokens));
        auto root = p.parse();
        if (!root) {
            return std::unexpected(root.error());
        }
        return std::make_shared<detail::ast_expression>(std::string(text), std::move(*root));
    }
};

} // namespace stepwise::debug
