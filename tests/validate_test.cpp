#include <gtest/gtest.h>
#include <string>
#include "stencil/validate.hpp"
#include "stencil/pipeline.hpp"
#include "stencil/modules/image_module.hpp"

using namespace stencil;

TEST(Validate, WellFormedTemplateIsClean){
    EXPECT_TRUE(validate_template("Hi {{name}} {%loop x in xs%}{%if x%}{{x}}{%endif%}{%endloop%} {@raw}").empty());
}

TEST(Validate, UnclosedDelimiter){
    auto errs = validate_template("ok {{ name", nullptr, "tpl");
    ASSERT_EQ(errs.size(), 1u);
    EXPECT_EQ(errs[0].code, "S0106");
    EXPECT_EQ(errs[0].kind, ErrorKind::Syntax);
    EXPECT_EQ(errs[0].position, std::optional<size_t>(3));
    EXPECT_EQ(errs[0].unit_id, "tpl");
}

TEST(Validate, StructuralErrors){
    auto errs = validate_template("ab{% if x %}");
    ASSERT_EQ(errs.size(), 1u);
    EXPECT_EQ(errs[0].code, "S0104");
    EXPECT_EQ(errs[0].position, std::optional<size_t>(2));

    errs = validate_template("{% loop x of y %}{% endloop %}");
    ASSERT_EQ(errs.size(), 1u);
    EXPECT_EQ(errs[0].code, "S0105");
}

TEST(Validate, ReportsInPositionOrder){
    auto errs = validate_template("{% endif %} then {@ open");
    ASSERT_EQ(errs.size(), 2u);
    EXPECT_EQ(errs[0].code, "S0101");
    EXPECT_EQ(errs[1].code, "S0106");
    EXPECT_EQ(errs[1].position, std::optional<size_t>(17));
}

TEST(Validate, UnknownModuleTagsNeedAPipeline){
    const char* tpl = "{% image logo %}{% qrcode url %}";
    EXPECT_TRUE(validate_template(tpl).empty());

    Pipeline p;
    p.register_module(std::make_shared<ImageModule>());
    auto errs = validate_template(tpl, &p);
    ASSERT_EQ(errs.size(), 1u);
    EXPECT_EQ(errs[0].code, "S0107");
    EXPECT_EQ(errs[0].severity, Severity::Recoverable);
    EXPECT_EQ(errs[0].position, std::optional<size_t>(16));
    EXPECT_NE(errs[0].message.find("qrcode"), std::string::npos);
}
