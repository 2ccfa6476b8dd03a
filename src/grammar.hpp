// grammar.hpp - PEGTL rules for tag interiors (loop headers, numeric literals, index segments)
#pragma once
#include <tao/pegtl.hpp>

namespace stencil::grammar {
using namespace tao::pegtl;

struct blank : one< ' ', '\t', '\r', '\n' > {};

// Loop header: `VAR in PATH`
struct ident_first : sor< alpha, one< '_', '$' > > {};
struct ident_rest : sor< alnum, one< '_', '$' > > {};
// Iteration metadata names are bound by every loop frame and cannot name the element.
struct reserved_var : seq< one< '$' >, sor< string< 'i', 'n', 'd', 'e', 'x' >, string< 'f', 'i', 'r', 's', 't' >,
                                              string< 'l', 'a', 's', 't' >, string< 'l', 'e', 'n', 'g', 't', 'h' > >,
                           not_at< ident_rest > > {};
struct loop_var : seq< not_at< reserved_var >, ident_first, star< ident_rest > > {};
struct kw_in : seq< string< 'i', 'n' >, at< blank > > {};
struct collection_path : plus< not_one< ' ', '\t', '\r', '\n' > > {};
struct loop_header : seq< star< blank >, loop_var, plus< blank >, kw_in, plus< blank >, collection_path, star< blank >, eof > {};

// Numbers: [+-] (digits [. digits*] | . digits) [(e|E) [+-] digits]
struct sign : one< '+', '-' > {};
struct fraction : seq< one< '.' >, star< digit > > {};
struct mantissa : sor< seq< plus< digit >, opt< fraction > >, seq< one< '.' >, plus< digit > > > {};
struct exponent : seq< one< 'e', 'E' >, opt< sign >, plus< digit > > {};
struct number_literal : seq< opt< sign >, mantissa, opt< exponent >, eof > {};

struct index_segment : seq< plus< digit >, eof > {};

} // namespace stencil::grammar
