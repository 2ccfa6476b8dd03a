#include <gtest/gtest.h>
#include <string>
#include "stencil/render.hpp"

using namespace stencil;

namespace {

struct Rendered {
    std::string text;
    std::vector<StructuralHint> hints;
    std::vector<ErrorRecord> errors;
};

Rendered render_with(const std::string& tpl, const value_ptr& ctx, RenderOptions opts = {}){
    ErrorCollector errs;
    auto out = render_template(tpl, ctx, opts, errs, "unit");
    return Rendered{out.text, out.hints, errs.all()};
}

std::string render_ok(const std::string& tpl, const value_ptr& ctx){
    auto r = render_with(tpl, ctx);
    EXPECT_TRUE(r.errors.empty()) << tpl << " produced " << r.errors.size() << " errors";
    return r.text;
}

RenderOptions strict_options(){ RenderOptions o; o.strict = true; return o; }

}

// ---- scenarios ----

TEST(Renderer, SimplePlaceholder){
    EXPECT_EQ(render_ok("Hello {{name}}!", value_map({kv("name", v_str("World"))})), "Hello World!");
}

TEST(Renderer, LoopOverSequence){
    EXPECT_EQ(render_ok("{%loop x in items%}{{x}},{%endloop%}", value_map({kv("items", value_seq({v_i64(1), v_i64(2), v_i64(3)}))})), "1,2,3,");
}

TEST(Renderer, ConditionalElseBranch){
    EXPECT_EQ(render_ok("{%if age>=18%}adult{%else%}minor{%endif%}", value_map({kv("age", v_i64(15))})), "minor");
    EXPECT_EQ(render_ok("{%if age>=18%}adult{%else%}minor{%endif%}", value_map({kv("age", v_i64(18))})), "adult");
}

TEST(Renderer, EmptyParagraphPlaceholderEmitsHint){
    auto r = render_with("{{?bio}}", value_map({kv("bio", v_str(""))}));
    EXPECT_EQ(r.text, "");
    ASSERT_EQ(r.hints.size(), 1u);
    EXPECT_EQ(r.hints[0].kind, HintKind::RemoveEnclosingBlock);
    EXPECT_EQ(r.hints[0].position, 0u);
    EXPECT_EQ(r.hints[0].unit_id, "unit");
    EXPECT_TRUE(r.errors.empty());
}

TEST(Renderer, MissingPlaceholderLenient){
    auto r = render_with("{{missing}}", value_map());
    EXPECT_EQ(r.text, "");
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].kind, ErrorKind::Resolution);
    EXPECT_EQ(r.errors[0].code, "R0201");
    EXPECT_EQ(r.errors[0].severity, Severity::Recoverable);
    EXPECT_EQ(r.errors[0].unit_id, "unit");
    EXPECT_EQ(r.errors[0].position, std::optional<size_t>(0));
}

TEST(Renderer, MissingPlaceholderStrict){
    ErrorCollector errs;
    bool threw = false;
    try {
        render_template("{{missing}}", value_map(), strict_options(), errs, "unit");
    } catch(const render_error& e){
        threw = true;
        EXPECT_EQ(e.record.severity, Severity::Fatal);
        EXPECT_EQ(e.record.kind, ErrorKind::Resolution);
    }
    EXPECT_TRUE(threw);
    auto all = errs.all();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].severity, Severity::Fatal);
}

TEST(Renderer, NestedLoops){
    auto ctx = value_map({kv("b", value_seq({value_seq({v_i64(1), v_i64(2)}), value_seq({v_i64(3)})}))});
    EXPECT_EQ(render_ok("{%loop a in b%}{%loop x in a%}{{x}}{%endloop%}{%endloop%}", ctx), "123");
}

// ---- formatting ----

TEST(Renderer, ScalarAndCollectionFormatting){
    auto ctx = value_map({
        kv("f", v_f64(2.5)), kv("t", v_bool(true)), kv("n", v_i64(-4)),
        kv("m", value_map({kv("a", v_i64(1))})), kv("s", value_seq({v_str("x"), v_i64(2)})),
    });
    EXPECT_EQ(render_ok("{{f}}|{{t}}|{{n}}|{{m}}|{{s}}", ctx), R"(2.5|true|-4|{"a":1}|["x",2])");
}

TEST(Renderer, NullGetterForNullAndMissing){
    RenderOptions opts;
    opts.null_getter = [](const std::string& p){ return "[" + p + "]"; };
    auto r = render_with("{{a}} {{b.c}}", value_map({kv("a", v_null())}), opts);
    EXPECT_EQ(r.text, "[a] [b.c]");
    ASSERT_EQ(r.errors.size(), 1u) << "null is found, only the missing path is an error";
    EXPECT_NE(r.errors[0].message.find("b.c"), std::string::npos);
}

TEST(Renderer, ParagraphPlaceholderVariants){
    auto ctx = value_map({kv("empty_list", value_seq()), kv("nil", v_null()), kv("bio", v_str("Engineer"))});
    auto r = render_with("<p>{{?empty_list}}</p><p>{{?nil}}</p><p>{{?gone}}</p><p>{{?bio}}</p>", ctx);
    EXPECT_EQ(r.text, "<p></p><p></p><p></p><p>Engineer</p>");
    ASSERT_EQ(r.hints.size(), 3u);
    EXPECT_EQ(r.hints[0].position, 3u);
    EXPECT_TRUE(r.errors.empty()) << "paragraph placeholders never record resolution errors";
}

TEST(Renderer, RawSpliceNeverFails){
    auto ctx = value_map({kv("html", v_str("<b>bold</b>")), kv("nil", v_null())});
    ErrorCollector errs;
    auto out = render_template("{@ html }|{@ nil }|{@ gone }", ctx, strict_options(), errs, "unit");
    EXPECT_EQ(out.text, "<b>bold</b>||");
    EXPECT_EQ(errs.size(), 0u);
}

TEST(Renderer, ModuleTagsPassThroughVerbatim){
    EXPECT_EQ(render_ok("a{% image logo %}b{%qr  x%}", value_map()), "a{% image logo %}b{%qr  x%}");
}

// ---- loops ----

TEST(Renderer, LoopMetadataBindings){
    auto ctx = value_map({kv("xs", value_seq({v_str("a"), v_str("b"), v_str("c")}))});
    EXPECT_EQ(render_ok("{%loop x in xs%}{%if $first%}[{%endif%}{{$index}}:{{x}}/{{$length}}{%if $last%}]{%else%},{%endif%}{%endloop%}", ctx),
              "[0:a/3,1:b/3,2:c/3]");
}

TEST(Renderer, LoopBindingsInvisibleOutsideBody){
    auto r = render_with("{%loop x in xs%}{{x}}{%endloop%}|{{x}}", value_map({kv("xs", value_seq({v_i64(1)}))}));
    EXPECT_EQ(r.text, "1|");
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].code, "R0201");
}

TEST(Renderer, LoopVariableShadowsAndRestores){
    auto ctx = value_map({kv("x", v_str("outer")), kv("xs", value_seq({v_i64(1), v_i64(2)}))});
    EXPECT_EQ(render_ok("{%loop x in xs%}{{x}}{%endloop%}{{x}}", ctx), "12outer");
}

TEST(Renderer, LoopSeesOuterBindings){
    auto ctx = value_map({
        kv("rows", value_seq({value_map({kv("name", v_str("r1")), kv("cells", value_seq({v_i64(1), v_i64(2)}))})})),
        kv("sep", v_str("-")),
    });
    EXPECT_EQ(render_ok("{%loop r in rows%}{%loop c in r.cells%}{{r.name}}{{sep}}{{c}}{{$index}} {%endloop%}{%endloop%}", ctx),
              "r1-10 r1-21 ");
}

TEST(Renderer, EmptySequenceRendersNothing){
    EXPECT_EQ(render_ok("a{%loop x in xs%}{{x}}{%endloop%}b", value_map({kv("xs", value_seq())})), "ab");
}

TEST(Renderer, LoopOverNonSequenceLenient){
    auto r = render_with("a{%loop x in n%}{{x}}{%endloop%}b{%loop y in gone%}.{%endloop%}", value_map({kv("n", v_i64(3))}));
    EXPECT_EQ(r.text, "ab");
    ASSERT_EQ(r.errors.size(), 2u);
    EXPECT_EQ(r.errors[0].kind, ErrorKind::Type);
    EXPECT_EQ(r.errors[0].code, "T0301");
    EXPECT_EQ(r.errors[0].position, std::optional<size_t>(1));
    EXPECT_EQ(r.errors[1].code, "T0301");
}

TEST(Renderer, LoopOverNonSequenceStrict){
    ErrorCollector errs;
    EXPECT_THROW(render_template("{%loop x in n%}{%endloop%}", value_map({kv("n", v_str("abc"))}), strict_options(), errs), render_error);
    ASSERT_EQ(errs.size(), 1u);
    EXPECT_EQ(errs.all()[0].severity, Severity::Fatal);
}

// ---- conditionals ----

static bool cond(const std::string& expr, const value_ptr& ctx, std::vector<ErrorRecord>* errors = nullptr, RenderOptions opts = {}){
    ErrorCollector errs;
    Renderer r(opts, errs, "unit");
    Scope scope(ctx);
    bool v = r.evaluate(expr, scope);
    if(errors) *errors = errs.all();
    return v;
}

TEST(Conditional, Truthiness){
    auto ctx = value_map({kv("zero", v_i64(0)), kv("one", v_i64(1)), kv("empty", v_str("")), kv("list", value_seq({v_null()})),
                          kv("no", v_bool(false)), kv("nil", v_null())});
    EXPECT_FALSE(cond("zero", ctx));
    EXPECT_TRUE(cond("one", ctx));
    EXPECT_FALSE(cond("empty", ctx));
    EXPECT_TRUE(cond("list", ctx));
    EXPECT_FALSE(cond("no", ctx));
    EXPECT_FALSE(cond("nil", ctx));
    EXPECT_FALSE(cond("missing", ctx));
    EXPECT_FALSE(cond("", ctx));
}

TEST(Conditional, RightOperandForms){
    auto ctx = value_map({kv("name", v_str("Bob")), kv("color", v_str("red")), kv("a", v_i64(4)), kv("b", v_i64(4)),
                          kv("flag", v_bool(true)), kv("label", v_str("12"))});
    EXPECT_TRUE(cond("name == 'Bob'", ctx));
    EXPECT_TRUE(cond("name == \"Bob\"", ctx));
    EXPECT_FALSE(cond("name != 'Bob'", ctx));
    EXPECT_TRUE(cond("color == red", ctx)) << "unresolvable right side is a literal string";
    EXPECT_TRUE(cond("a == b", ctx)) << "right side path";
    EXPECT_TRUE(cond("a == 4.0", ctx));
    EXPECT_TRUE(cond("flag == true", ctx));
    EXPECT_FALSE(cond("flag == false", ctx));
    EXPECT_TRUE(cond("label == 12", ctx)) << "numeric strings compare numerically with numbers";
    EXPECT_TRUE(cond("label == '12'", ctx));
}

TEST(Conditional, Ordering){
    auto ctx = value_map({kv("n", v_i64(10)), kv("s", v_str("10")), kv("word", v_str("apple")), kv("f", v_f64(2.5))});
    EXPECT_TRUE(cond("n > 9", ctx));
    EXPECT_TRUE(cond("n >= 10", ctx));
    EXPECT_FALSE(cond("n < 10", ctx));
    EXPECT_TRUE(cond("n <= 10", ctx));
    EXPECT_TRUE(cond("s > 9", ctx)) << "numeric, not lexicographic";
    EXPECT_TRUE(cond("word < 'banana'", ctx));
    EXPECT_FALSE(cond("word > 'banana'", ctx));
    EXPECT_TRUE(cond("f < 3", ctx));
}

TEST(Conditional, NullEqualsOnlyNull){
    auto ctx = value_map({kv("nil", v_null()), kv("other", v_null()), kv("zero", v_i64(0))});
    EXPECT_TRUE(cond("nil == other", ctx));
    EXPECT_FALSE(cond("zero == nil", ctx));
    EXPECT_TRUE(cond("zero != nil", ctx));
}

TEST(Conditional, TypeMismatchIsRecoverableEvenInStrictMode){
    auto ctx = value_map({kv("m", value_map({kv("a", v_i64(1))})), kv("word", v_str("abc"))});
    std::vector<ErrorRecord> errs;
    RenderOptions strict; strict.strict = true;
    EXPECT_FALSE(cond("m > 3", ctx, &errs, strict));
    ASSERT_EQ(errs.size(), 1u);
    EXPECT_EQ(errs[0].code, "T0302");
    EXPECT_EQ(errs[0].severity, Severity::Recoverable);

    EXPECT_FALSE(cond("word == 3", ctx, &errs));
    ASSERT_EQ(errs.size(), 1u);
    EXPECT_FALSE(cond("word != 3", ctx, &errs)) << "an uncomparable pair is never taken";
}

TEST(Conditional, UnresolvedLeftIsFalseWithoutError){
    std::vector<ErrorRecord> errs;
    EXPECT_FALSE(cond("gone == 1", value_map(), &errs));
    EXPECT_FALSE(cond("gone != 1", value_map(), &errs));
    EXPECT_TRUE(errs.empty());
}

TEST(Conditional, FirstComparatorOccurrenceWins){
    auto ctx = value_map({kv("x", v_str("z")), kv("y", v_str("a>b"))});
    // '==' is scanned before '>', so this splits inside the quoted literal and the left path fails
    EXPECT_FALSE(cond("x > 'a==b'", ctx));
    EXPECT_TRUE(cond("y == 'a>b'", ctx));
}

TEST(Conditional, InsideLoop){
    auto ctx = value_map({kv("xs", value_seq({v_i64(1), v_i64(5), v_i64(9)}))});
    EXPECT_EQ(render_ok("{%loop x in xs%}{%if x > 4%}{{x}}{%endif%}{%endloop%}", ctx), "59");
}
