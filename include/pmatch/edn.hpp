// EDN reader for pattern, value and declaration forms (with source positions)
#pragma once
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <memory>
#include <stdexcept>
#include <sstream>
#include <cctype>
#include <map>
#include <cstdint>
#include <initializer_list>

namespace pmatch
{

    struct parse_error : std::runtime_error
    {
        using std::runtime_error::runtime_error;
    };

    struct keyword
    {
        std::string name;
    };
    struct symbol
    {
        std::string name;
    };
    struct list;
    struct vector_t;
    struct node;

    using node_ptr = std::shared_ptr<node>;

    struct list
    {
        std::vector<node_ptr> elems;
    };
    struct vector_t
    {
        std::vector<node_ptr> elems;
    };

    using node_data = std::variant<std::monostate, bool, int64_t, double, std::string, keyword, symbol, list, vector_t>;

    struct node
    {
        node_data data;
        std::map<std::string, int> metadata; // line / col / end-line / end-col
    };

    namespace detail
    {
        struct reader
        {
            std::string_view d;
            size_t p = 0;
            int line = 1, col = 1;
            int last_line = 1, last_col = 1;
            explicit reader(std::string_view s) : d(s) {}
            bool eof() const { return p >= d.size(); }
            char peek() const { return eof() ? '\0' : d[p]; }
            char peek_next() const { return p + 1 < d.size() ? d[p + 1] : '\0'; }
            char get()
            {
                if (eof())
                    return '\0';
                last_line = line;
                last_col = col;
                char c = d[p++];
                if (c == '\n')
                {
                    ++line;
                    col = 1;
                }
                else
                {
                    ++col;
                }
                return c;
            }
            void skip_ws()
            {
                while (!eof())
                {
                    char c = peek();
                    if (c == ';')
                    {
                        while (!eof() && get() != '\n')
                            continue;
                        continue;
                    }
                    if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v' || c == ',')
                    {
                        get();
                        continue;
                    }
                    break;
                }
            }
            std::string where() const { return " at line " + std::to_string(line) + ":" + std::to_string(col); }
        };
        inline bool is_digit(char c) { return c >= '0' && c <= '9'; }
        inline bool is_symbol_start(char c) { return std::isalpha((unsigned char)c) || c == '*' || c == '!' || c == '_' || c == '?' || c == '-' || c == '+' || c == '/' || c == '<' || c == '>' || c == '=' || c == '$' || c == '%' || c == '&' || c == '.'; }
        inline bool is_symbol_char(char c) { return is_symbol_start(c) || is_digit(c) || c == '#' || c == '\''; }

        inline node_ptr make_node(node_data d) { return std::make_shared<node>(node{std::move(d), {}}); }
        inline void attach_pos(node &n, int sl, int sc, int el, int ec)
        {
            n.metadata["line"] = sl;
            n.metadata["col"] = sc;
            n.metadata["end-line"] = el;
            n.metadata["end-col"] = ec;
        }

        inline node_ptr parse_value(reader &);

        inline node_ptr parse_seq(reader &r, char end, int sl, int sc)
        {
            std::vector<node_ptr> elems;
            r.skip_ws();
            while (!r.eof() && r.peek() != end)
            {
                elems.push_back(parse_value(r));
                r.skip_ws();
            }
            if (r.get() != end)
                throw parse_error(std::string("unterminated collection, expected '") + end + "'" + r.where());
            node_ptr out;
            if (end == ')')
                out = make_node(list{std::move(elems)});
            else
                out = make_node(vector_t{std::move(elems)});
            attach_pos(*out, sl, sc, r.last_line, r.last_col);
            return out;
        }

        inline node_ptr parse_string(reader &r)
        {
            int sl = r.line, sc = r.col;
            r.get(); // opening quote
            std::string out;
            bool closed = false;
            while (!r.eof())
            {
                char c = r.get();
                if (c == '"')
                {
                    closed = true;
                    break;
                }
                if (c == '\\')
                {
                    if (r.eof())
                        throw parse_error("bad escape" + r.where());
                    char e = r.get();
                    switch (e)
                    {
                    case 'n':
                        out += '\n';
                        break;
                    case 'r':
                        out += '\r';
                        break;
                    case 't':
                        out += '\t';
                        break;
                    default:
                        out += e;
                        break;
                    }
                }
                else
                    out += c;
            }
            if (!closed)
                throw parse_error("unterminated string" + r.where());
            auto n = make_node(out);
            attach_pos(*n, sl, sc, r.last_line, r.last_col);
            return n;
        }

        inline node_ptr parse_number(reader &r)
        {
            int sl = r.line, sc = r.col;
            std::string num;
            if (r.peek() == '+' || r.peek() == '-')
                num += r.get();
            bool is_float = false;
            while (is_digit(r.peek()))
                num += r.get();
            if (r.peek() == '.')
            {
                is_float = true;
                num += r.get();
                while (is_digit(r.peek()))
                    num += r.get();
            }
            if (r.peek() == 'e' || r.peek() == 'E')
            {
                is_float = true;
                num += r.get();
                if (r.peek() == '+' || r.peek() == '-')
                    num += r.get();
                while (is_digit(r.peek()))
                    num += r.get();
            }
            if (is_symbol_char(r.peek()))
                throw parse_error("invalid number '" + num + r.peek() + "'" + r.where());
            node_ptr n;
            try
            {
                if (is_float)
                    n = make_node(std::stod(num));
                else
                    n = make_node((int64_t)std::stoll(num));
            }
            catch (const std::logic_error &)
            {
                throw parse_error("invalid number '" + num + "'" + r.where());
            }
            attach_pos(*n, sl, sc, r.last_line, r.last_col);
            return n;
        }

        inline node_ptr parse_symbol_or_keyword(reader &r)
        {
            int sl = r.line, sc = r.col;
            bool kw = false;
            if (r.peek() == ':')
            {
                kw = true;
                r.get();
            }
            std::string s;
            while (is_symbol_char(r.peek()))
                s += r.get();
            if (s.empty())
                throw parse_error("empty symbol" + r.where());
            node_ptr n;
            if (s == "nil" && !kw)
                n = make_node(std::monostate{});
            else if (s == "true" && !kw)
                n = make_node(true);
            else if (s == "false" && !kw)
                n = make_node(false);
            else if (kw)
                n = make_node(keyword{s});
            else
                n = make_node(symbol{s});
            attach_pos(*n, sl, sc, r.last_line, r.last_col);
            return n;
        }

        inline node_ptr parse_value(reader &r)
        {
            r.skip_ws();
            if (r.eof())
                throw parse_error("unexpected end of input" + r.where());
            char c = r.peek();
            switch (c)
            {
            case '"':
                return parse_string(r);
            case '(':
            case '[':
            {
                int sl = r.line, sc = r.col;
                r.get();
                return parse_seq(r, c == '(' ? ')' : ']', sl, sc);
            }
            default:
                break;
            }
            if (is_digit(c) || ((c == '+' || c == '-') && is_digit(r.peek_next())))
                return parse_number(r);
            if (c == ':' || is_symbol_start(c))
                return parse_symbol_or_keyword(r);
            throw parse_error(std::string("unexpected character '") + c + "'" + r.where());
        }
    }

    // Parse a single EDN form (entire input) into a node tree.
    inline node_ptr parse(std::string_view input)
    {
        detail::reader r(input);
        r.skip_ws();
        auto v = detail::parse_value(r);
        r.skip_ws();
        if (!r.eof())
            throw parse_error("unexpected trailing characters" + r.where());
        return v;
    }

    // Parse every top-level form of a document.
    inline std::vector<node_ptr> parse_all(std::string_view input)
    {
        detail::reader r(input);
        std::vector<node_ptr> out;
        r.skip_ws();
        while (!r.eof())
        {
            out.push_back(detail::parse_value(r));
            r.skip_ws();
        }
        return out;
    }

    inline std::string to_string(const node &n);
    inline std::string to_string(const node_ptr &p) { return p ? to_string(*p) : std::string("<null>"); }
    inline std::string to_string(const node &n)
    {
        struct V
        {
            std::string seq(const std::vector<node_ptr> &elems, char open, char close) const
            {
                std::string out(1, open);
                bool first = true;
                for (auto &ch : elems)
                {
                    if (!first)
                        out += ' ';
                    first = false;
                    out += to_string(ch);
                }
                out += close;
                return out;
            }
            std::string operator()(std::monostate) const { return "nil"; }
            std::string operator()(bool b) const { return b ? "true" : "false"; }
            std::string operator()(int64_t i) const { return std::to_string(i); }
            std::string operator()(double d) const
            {
                std::ostringstream oss;
                oss << d;
                return oss.str();
            }
            std::string operator()(const std::string &s) const { return '"' + s + '"'; }
            std::string operator()(const keyword &k) const { return ':' + k.name; }
            std::string operator()(const symbol &s) const { return s.name; }
            std::string operator()(const list &l) const { return seq(l.elems, '(', ')'); }
            std::string operator()(const vector_t &v) const { return seq(v.elems, '[', ']'); }
        };
        return std::visit(V{}, n.data);
    }

    inline bool is_symbol(const node &n) { return std::holds_alternative<symbol>(n.data); }
    inline bool is_keyword(const node &n) { return std::holds_alternative<keyword>(n.data); }
    inline bool is_list(const node &n) { return std::holds_alternative<list>(n.data); }
    inline bool is_vector(const node &n) { return std::holds_alternative<vector_t>(n.data); }
    inline const list *as_list(const node &n) { return is_list(n) ? &std::get<list>(n.data) : nullptr; }
    inline const vector_t *as_vector(const node &n) { return is_vector(n) ? &std::get<vector_t>(n.data) : nullptr; }
    inline const symbol *as_symbol(const node &n) { return is_symbol(n) ? &std::get<symbol>(n.data) : nullptr; }
    inline int meta_int(const node &n, const std::string &k, int def = -1)
    {
        auto it = n.metadata.find(k);
        return it == n.metadata.end() ? def : it->second;
    }
    inline int line(const node &n) { return meta_int(n, "line"); }
    inline int col(const node &n) { return meta_int(n, "col"); }

    // Factory helpers for building forms without going through text.
    inline node_ptr n_sym(std::string name) { return detail::make_node(symbol{std::move(name)}); }
    inline node_ptr n_kw(std::string name) { return detail::make_node(keyword{std::move(name)}); }
    inline node_ptr n_str(std::string s) { return detail::make_node(std::move(s)); }
    inline node_ptr n_i64(int64_t v) { return detail::make_node(v); }
    inline node_ptr n_f64(double v) { return detail::make_node(v); }
    inline node_ptr n_bool(bool b) { return detail::make_node(b); }
    inline node_ptr n_nil() { return detail::make_node(std::monostate{}); }

    inline node_ptr node_list(std::initializer_list<node_ptr> xs)
    {
        list l;
        l.elems.assign(xs.begin(), xs.end());
        return detail::make_node(std::move(l));
    }
    inline node_ptr node_vec(std::initializer_list<node_ptr> xs)
    {
        vector_t v;
        v.elems.assign(xs.begin(), xs.end());
        return detail::make_node(std::move(v));
    }

    inline list &operator<<(list &l, const node_ptr &n)
    {
        l.elems.push_back(n);
        return l;
    }
    inline vector_t &operator<<(vector_t &v, const node_ptr &n)
    {
        v.elems.push_back(n);
        return v;
    }

} // namespace pmatch
