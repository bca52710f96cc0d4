// Surface syntax front-end: `T := A | B(x : numeric)` declarations and
// `CONS(_, cdr)` / `..(p, q)` expressions, lowered to EDN forms.
#pragma once
#include "pmatch/edn.hpp"
#include <string>
#include <string_view>

namespace pmatch {

struct SurfaceResult {
    bool success{false};
    node_ptr form;             // lowered EDN form when success
    std::string error_message; // if !success, human-readable message
    int line{0};
    int column{0};
};

class SurfaceParser {
public:
    // Lowers to (sum :name T :variants [ (variant :name A :fields [ ... ]) ... ]).
    SurfaceResult parse_declaration(std::string_view src, std::string_view source = "<declaration>") const;
    // Lowers N(p, ...) to (N p ...), ..(p, ...) to (.. p ...); literals and names map one-to-one.
    SurfaceResult parse_expression(std::string_view src, std::string_view source = "<expression>") const;
};

} // namespace pmatch

namespace pmatch {

// Pattern or value text: EDN when it starts with '(' (e.g. `(CONS _ cdr)`), surface
// syntax otherwise (`CONS(_, cdr)`, `NIL`, `42`). Throws parse_error.
node_ptr read_expression(std::string_view src);

} // namespace pmatch
