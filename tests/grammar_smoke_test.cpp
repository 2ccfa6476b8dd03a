#include <cassert>
#include <string>
#include "stencil/tag_syntax.hpp"

using namespace stencil;

static void test_loop_headers(){
    {
        auto h = parse_loop_header("x in items");
        assert(h && h->var == "x" && h->collection == "items");
    }
    {
        auto h = parse_loop_header("  row   in  table.rows.0 ");
        assert(h && h->var == "row" && h->collection == "table.rows.0");
    }
    {
        auto h = parse_loop_header("$item in list");
        assert(h && h->var == "$item");
    }
    assert(!parse_loop_header("x items") && "missing 'in'");
    assert(!parse_loop_header("x inside") && "'in' must be a separate word");
    assert(!parse_loop_header("1x in y") && "variable must not start with a digit");
    assert(!parse_loop_header("x in") && "collection path required");
    assert(!parse_loop_header("x in a b") && "single collection path");
    assert(!parse_loop_header("") );
    assert(!parse_loop_header("$index in xs") && "iteration metadata names are reserved");
    assert(!parse_loop_header("$first in xs"));
    assert(!parse_loop_header("$last in xs"));
    assert(!parse_loop_header("$length in xs"));
    {
        auto h = parse_loop_header("$indexed in xs");
        assert(h && h->var == "$indexed");
    }
}

static void test_number_literals(){
    assert(parse_number_literal("42") && *parse_number_literal("42") == 42.0);
    assert(parse_number_literal("-3.5") && *parse_number_literal("-3.5") == -3.5);
    assert(parse_number_literal("1e3") && *parse_number_literal("1e3") == 1000.0);
    assert(parse_number_literal(".5") && *parse_number_literal(".5") == 0.5);
    assert(parse_number_literal("5.") && *parse_number_literal("5.") == 5.0);
    assert(!parse_number_literal("abc"));
    assert(!parse_number_literal(""));
    assert(!parse_number_literal("1.2.3"));
    assert(!parse_number_literal("+"));
    assert(!parse_number_literal("12px"));
}

static void test_segments_and_quotes(){
    assert(is_index_segment("0"));
    assert(is_index_segment("12"));
    assert(!is_index_segment("-1"));
    assert(!is_index_segment("a1"));
    assert(!is_index_segment(""));

    assert(unquote("'abc'") && *unquote("'abc'") == "abc");
    assert(unquote("\"a b\"") && *unquote("\"a b\"") == "a b");
    assert(unquote("''") && unquote("''")->empty());
    assert(!unquote("'abc\""));
    assert(!unquote("abc"));
    assert(!unquote("'"));

    assert(trim("  a b \n") == "a b");
    assert(trim(" \t ").empty());
}

void run_grammar_smoke_tests(){
    test_loop_headers();
    test_number_literals();
    test_segments_and_quotes();
}
