// Runtime values: opaque leaves, tagged variant instances and joint-match tuples.
#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace pmatch
{

    struct value;
    using value_ptr = std::shared_ptr<const value>;

    // Instance of one variant of an algebraic type. Field count equals the
    // declared arity; checked once by the variant constructor.
    struct tagged_value
    {
        std::string type_name;
        std::string variant;
        std::vector<value_ptr> fields;
    };

    // Positional wrapper over independently supplied subjects (see zip_subjects).
    struct tuple_value
    {
        std::vector<value_ptr> elems;
    };

    using value_data = std::variant<std::monostate, bool, int64_t, double, std::string, tagged_value, tuple_value>;

    struct value
    {
        value_data data;
    };

    namespace detail
    {
        inline value_ptr make_value(value_data d) { return std::make_shared<const value>(value{std::move(d)}); }
    }

    inline value_ptr v_nil() { return detail::make_value(std::monostate{}); }
    inline value_ptr v_bool(bool b) { return detail::make_value(b); }
    inline value_ptr v_i64(int64_t v) { return detail::make_value(v); }
    inline value_ptr v_f64(double v) { return detail::make_value(v); }
    inline value_ptr v_str(std::string s) { return detail::make_value(std::move(s)); }

    template <typename T>
    inline value_ptr to_value(T &&x)
    {
        using D = std::decay_t<T>;
        if constexpr (std::is_convertible_v<D, value_ptr>)
            return value_ptr(std::forward<T>(x));
        else if constexpr (std::is_same_v<D, bool>)
            return v_bool(x);
        else if constexpr (std::is_integral_v<D>)
            return v_i64(static_cast<int64_t>(x));
        else if constexpr (std::is_floating_point_v<D>)
            return v_f64(static_cast<double>(x));
        else if constexpr (std::is_convertible_v<D, std::string>)
            return v_str(std::string(std::forward<T>(x)));
        else
            static_assert(sizeof(D) == 0, "to_value: unsupported host type");
    }

    inline bool is_nil(const value &v) { return std::holds_alternative<std::monostate>(v.data); }
    inline bool is_tagged(const value &v) { return std::holds_alternative<tagged_value>(v.data); }
    inline bool is_tuple(const value &v) { return std::holds_alternative<tuple_value>(v.data); }
    inline bool is_number(const value &v) { return std::holds_alternative<int64_t>(v.data) || std::holds_alternative<double>(v.data); }
    inline bool is_leaf(const value &v) { return !is_tagged(v) && !is_tuple(v); }
    inline const tagged_value *as_tagged(const value &v) { return is_tagged(v) ? &std::get<tagged_value>(v.data) : nullptr; }
    inline const tuple_value *as_tuple(const value &v) { return is_tuple(v) ? &std::get<tuple_value>(v.data) : nullptr; }

    // Numeric view of an int64 or double leaf; throws std::bad_variant_access otherwise.
    double as_number(const value &v);

    // Structural deep equality. int64 and double leaves compare by exact numeric value.
    bool equal(const value_ptr &a, const value_ptr &b);

    // Diagnostic rendering: CONS(1, NIL), "text", ..(a, b)
    std::string to_string(const value &v);
    inline std::string to_string(const value_ptr &v) { return v ? to_string(*v) : std::string("<null>"); }

    // "type::variant" for tagged values, the literal text otherwise.
    std::string describe_tag(const value &v);

    // Human name of a value's kind, used in constraint diagnostics.
    std::string kind_name(const value &v);

} // namespace pmatch
