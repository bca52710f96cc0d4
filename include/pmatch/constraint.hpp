// Per-field validator attached to a variant field position.
#pragma once
#include "pmatch/value.hpp"
#include <functional>
#include <string>

namespace pmatch {

class FieldConstraint {
public:
    using predicate_fn = std::function<bool(const value&)>;
    enum class Kind { Any, Type, Predicate };

    FieldConstraint() = default;

    static FieldConstraint any() { return FieldConstraint{}; }
    // Built-in names (numeric, integer, double, character/string, logical/bool)
    // or the name of an algebraic type, which may not be registered yet.
    static FieldConstraint of_type(std::string name);
    static FieldConstraint predicate(std::string description, predicate_fn fn);

    bool accepts(const value& v) const;
    bool is_any() const { return kind_ == Kind::Any; }
    Kind kind() const { return kind_; }
    // Type name for Kind::Type, free text for Kind::Predicate, "any" otherwise.
    const std::string& description() const { return description_; }

private:
    Kind kind_ = Kind::Any;
    std::string description_ = "any";
    predicate_fn fn_;
};

} // namespace pmatch
