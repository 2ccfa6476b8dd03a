#include <gtest/gtest.h>
#include <string>
#include "stencil/ast.hpp"

using namespace stencil;

static std::string syntax_code(const std::string& tpl, size_t* position = nullptr){
    try {
        parse_template(tpl);
    } catch(const syntax_error& e){
        if(position) *position = e.position;
        return e.code;
    }
    return "";
}

TEST(TreeBuilder, FlatSequence){
    auto tree = parse_template("a{{b}}c{@d}{{?e}}{% image f %}");
    ASSERT_EQ(tree.size(), 6u);
    EXPECT_TRUE(std::holds_alternative<text_node>(tree[0]));
    EXPECT_EQ(std::get<placeholder_node>(tree[1]).path, "b");
    EXPECT_EQ(std::get<placeholder_node>(tree[1]).position, 1u);
    EXPECT_EQ(std::get<raw_splice_node>(tree[3]).path, "d");
    EXPECT_EQ(std::get<paragraph_node>(tree[4]).path, "e");
    EXPECT_EQ(std::get<module_tag_node>(tree[5]).name, "image");
    EXPECT_EQ(std::get<module_tag_node>(tree[5]).raw, "{% image f %}");
}

TEST(TreeBuilder, NestedBlocksBecomeSubtrees){
    auto tree = parse_template("{%loop a in b%}<{%if x%}y{%else%}z{%endif%}>{%endloop%}");
    ASSERT_EQ(tree.size(), 1u);
    auto& loop = std::get<loop_node>(tree[0]);
    EXPECT_EQ(loop.var, "a");
    EXPECT_EQ(loop.collection, "b");
    ASSERT_EQ(loop.body.size(), 3u);
    auto& cond = std::get<conditional_node>(loop.body[1]);
    EXPECT_EQ(cond.expr, "x");
    EXPECT_TRUE(cond.has_else);
    ASSERT_EQ(cond.then_body.size(), 1u);
    ASSERT_EQ(cond.else_body.size(), 1u);
    EXPECT_EQ(std::get<text_node>(cond.then_body[0]).text, "y");
    EXPECT_EQ(std::get<text_node>(cond.else_body[0]).text, "z");
    EXPECT_EQ(cond.position, 16u);
}

TEST(TreeBuilder, LoopsNestInsideLoops){
    auto tree = parse_template("{%loop a in b%}{%loop x in a%}{{x}}{%endloop%}{%endloop%}");
    ASSERT_EQ(tree.size(), 1u);
    auto& outer = std::get<loop_node>(tree[0]);
    ASSERT_EQ(outer.body.size(), 1u);
    auto& inner = std::get<loop_node>(outer.body[0]);
    EXPECT_EQ(inner.collection, "a");
    ASSERT_EQ(inner.body.size(), 1u);
}

TEST(TreeBuilder, FlattenReproducesSource){
    const char* inputs[] = {
        "",
        "just text",
        "{%loop a in b%}<{%if x%}y{%else%}z{%endif%}>{%endloop%}",
        "{% if a %}{{? b }}{% endif %} tail {@ raw } {% qr code %}",
    };
    for(const char* in : inputs) EXPECT_EQ(flatten(parse_template(in)), in);
}

TEST(TreeBuilder, EndWithoutOpenBlock){
    size_t pos = 99;
    EXPECT_EQ(syntax_code("abc{% endloop %}", &pos), "S0101");
    EXPECT_EQ(pos, 3u);
    EXPECT_EQ(syntax_code("{% endif %}"), "S0101");
}

TEST(TreeBuilder, MismatchedEnd){
    size_t pos = 99;
    EXPECT_EQ(syntax_code("{%if x%}{%endloop%}", &pos), "S0102");
    EXPECT_EQ(pos, 8u);
    EXPECT_EQ(syntax_code("{%loop x in y%}{%endif%}"), "S0102");
}

TEST(TreeBuilder, MisplacedElse){
    EXPECT_EQ(syntax_code("{%else%}"), "S0103");
    EXPECT_EQ(syntax_code("{%loop x in y%}{%else%}{%endloop%}"), "S0103");
    size_t pos = 99;
    EXPECT_EQ(syntax_code("{%if a%}{%else%}{%else%}{%endif%}", &pos), "S0103");
    EXPECT_EQ(pos, 16u);
}

TEST(TreeBuilder, UnterminatedBlockPointsAtOpener){
    size_t pos = 99;
    EXPECT_EQ(syntax_code("ab{%loop x in xs%}abc", &pos), "S0104");
    EXPECT_EQ(pos, 2u);
    EXPECT_EQ(syntax_code("{%if a%}{%loop x in y%}{%endloop%}", &pos), "S0104");
    EXPECT_EQ(pos, 0u);
}

TEST(TreeBuilder, MalformedLoopHeader){
    EXPECT_EQ(syntax_code("{% loop x %}{% endloop %}"), "S0105");
    EXPECT_EQ(syntax_code("{% loop %}{% endloop %}"), "S0105");
}

TEST(TreeBuilder, LoopVariableCannotShadowIterationMetadata){
    size_t pos = 0;
    EXPECT_EQ(syntax_code("ab{% loop $index in xs %}{{$index}}{% endloop %}", &pos), "S0105");
    EXPECT_EQ(pos, 2u);
    EXPECT_EQ(syntax_code("{% loop $length in xs %}{% endloop %}"), "S0105");
    EXPECT_EQ(syntax_code("{% loop $item in xs %}{% endloop %}"), "");
}

TEST(TreeBuilder, PositionOf){
    auto tree = parse_template("ab{{c}}");
    ASSERT_EQ(tree.size(), 2u);
    EXPECT_EQ(position_of(tree[0]), 0u);
    EXPECT_EQ(position_of(tree[1]), 2u);
}
