#pragma once
#include <tao/pegtl.hpp>

namespace pmatch::surface_front::grammar {
// using-declarations rather than a using-directive: pmatch::list would otherwise hide pegtl's list
using tao::pegtl::any;
using tao::pegtl::at;
using tao::pegtl::digit;
using tao::pegtl::eof;
using tao::pegtl::eolf;
using tao::pegtl::list;
using tao::pegtl::must;
using tao::pegtl::not_at;
using tao::pegtl::not_one;
using tao::pegtl::one;
using tao::pegtl::opt;
using tao::pegtl::plus;
using tao::pegtl::ranges;
using tao::pegtl::seq;
using tao::pegtl::sor;
using tao::pegtl::space;
using tao::pegtl::star;
using tao::pegtl::string;
using tao::pegtl::two;
using tao::pegtl::until;

// Comments and whitespace (R style: '#' to end of line)
struct comment : seq< one<'#'>, until< eolf > > {};
struct sep : sor< space, comment > {};
struct skip : star< sep > {};

struct ident_first : ranges<'a','z','A','Z','_','_'> {};
struct ident_rest : ranges<'a','z','A','Z','0','9','_','_','.','.'> {};
struct ident : seq< ident_first, star< ident_rest > > {};

struct lparen : one<'('> {};
struct rparen : one<')'> {};
struct comma : one<','> {};

// Literals
struct kw_true : seq< sor< string<'T','R','U','E'>, string<'t','r','u','e'> >, not_at< ident_rest > > {};
struct kw_false : seq< sor< string<'F','A','L','S','E'>, string<'f','a','l','s','e'> >, not_at< ident_rest > > {};
struct kw_null : seq< sor< string<'N','U','L','L'>, string<'n','i','l'> >, not_at< ident_rest > > {};
struct digits : plus< digit > {};
struct number : seq< opt< one<'-'> >, digits, opt< one<'.'>, digits >, opt< one<'e','E'>, opt< one<'+','-'> >, digits >, not_at< ident_rest > > {};
struct str_char : sor< seq< one<'\\'>, any >, not_one<'"','\\'> > {};
struct string_lit : seq< one<'"'>, star< str_char >, must< one<'"'> > > {};
struct literal : sor< string_lit, number, kw_true, kw_false, kw_null > {};

// Expressions: N(p, ...), ..(p, ...), literals, bare names
struct expr;
struct args : opt< list< expr, comma, sep > > {};
struct call_close : rparen {};
struct call_head : seq< ident, at< skip, lparen > > {};
struct call : seq< call_head, skip, lparen, skip, args, skip, must< call_close > > {};
struct tuple_head : seq< two<'.'>, at< skip, lparen > > {};
struct tuple : seq< tuple_head, skip, lparen, skip, args, skip, must< call_close > > {};
struct name_ref : ident {};
struct expr : sor< tuple, literal, call, name_ref > {};
struct expression_rule : seq< skip, must< expr >, skip, must< eof > > {};

// Declarations: T := A | B(x : numeric, y)
struct assign_op : string<':','='> {};
struct decl_type_name : ident {};
struct variant_name : ident {};
struct field_name : ident {};
struct field_type : ident {};
struct field_decl : seq< field_name, skip, opt< one<':'>, skip, must< field_type > > > {};
struct field_list : seq< lparen, skip, opt< list< field_decl, comma, sep > >, skip, must< rparen > > {};
struct variant_decl : seq< variant_name, skip, opt< field_list > > {};
struct declaration_rule : seq< skip, must< decl_type_name >, skip, must< assign_op >, skip, must< variant_decl >, skip,
                               star< one<'|'>, skip, must< variant_decl >, skip >, must< eof > > {};

} // namespace pmatch::surface_front::grammar
