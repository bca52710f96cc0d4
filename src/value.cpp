// Structural equality and diagnostic rendering for runtime values.
#include "pmatch/value.hpp"
#include <sstream>

namespace pmatch {

double as_number(const value& v) {
    if (std::holds_alternative<int64_t>(v.data)) return static_cast<double>(std::get<int64_t>(v.data));
    return std::get<double>(v.data);
}

static bool equal_seq(const std::vector<value_ptr>& le, const std::vector<value_ptr>& re) {
    if (le.size() != re.size()) return false;
    for (size_t i = 0; i < le.size(); ++i) if (!equal(le[i], re[i])) return false;
    return true;
}

bool equal(const value_ptr& a, const value_ptr& b) {
    if (a.get() == b.get()) return true;
    if (!a || !b) return false;
    // 1 and 1.0 are the same number
    if (is_number(*a) && is_number(*b) && a->data.index() != b->data.index()) {
        if (std::holds_alternative<int64_t>(a->data))
            return static_cast<double>(std::get<int64_t>(a->data)) == std::get<double>(b->data);
        return std::get<double>(a->data) == static_cast<double>(std::get<int64_t>(b->data));
    }
    if (a->data.index() != b->data.index()) return false;

    struct Visitor {
        const value& b;
        bool operator()(std::monostate) const { return true; }
        bool operator()(bool x) const { return x == std::get<bool>(b.data); }
        bool operator()(int64_t x) const { return x == std::get<int64_t>(b.data); }
        bool operator()(double x) const { return x == std::get<double>(b.data); }
        bool operator()(const std::string& x) const { return x == std::get<std::string>(b.data); }
        bool operator()(const tagged_value& x) const {
            const auto& y = std::get<tagged_value>(b.data);
            return x.type_name == y.type_name && x.variant == y.variant && equal_seq(x.fields, y.fields);
        }
        bool operator()(const tuple_value& x) const { return equal_seq(x.elems, std::get<tuple_value>(b.data).elems); }
    };
    return std::visit(Visitor{*b}, a->data);
}

std::string to_string(const value& v) {
    struct V {
        std::string join(const std::string& head, const std::vector<value_ptr>& elems) const {
            std::string out = head + "(";
            for (size_t i = 0; i < elems.size(); ++i) {
                if (i) out += ", ";
                out += to_string(elems[i]);
            }
            return out + ")";
        }
        std::string operator()(std::monostate) const { return "nil"; }
        std::string operator()(bool b) const { return b ? "true" : "false"; }
        std::string operator()(int64_t i) const { return std::to_string(i); }
        std::string operator()(double d) const { std::ostringstream oss; oss << d; return oss.str(); }
        std::string operator()(const std::string& s) const { return '"' + s + '"'; }
        std::string operator()(const tagged_value& t) const { return t.fields.empty() ? t.variant : join(t.variant, t.fields); }
        std::string operator()(const tuple_value& t) const { return join("..", t.elems); }
    };
    return std::visit(V{}, v.data);
}

std::string describe_tag(const value& v) {
    if (auto* t = as_tagged(v)) return t->type_name + "::" + t->variant;
    if (auto* t = as_tuple(v)) return "tuple/" + std::to_string(t->elems.size());
    return to_string(v);
}

std::string kind_name(const value& v) {
    switch (v.data.index()) {
        case 0: return "nil";
        case 1: return "logical";
        case 2: return "integer";
        case 3: return "double";
        case 4: return "character";
        case 5: return std::get<tagged_value>(v.data).type_name;
        default: return "tuple";
    }
}

} // namespace pmatch
