#include <gtest/gtest.h>
#include "../glaze/directive/registry.hpp"
#include "../glaze/pipeline/context.hpp"
#include <string>
#include <vector>

using namespace glaze;

static bool compile_nothing(NodeId node, CompilationContext& ctx, std::vector<NodeId>* out) {
    (void)node; (void)ctx; (void)out;
    return true;
}

static DirectiveDef custom(const char* name, DirectiveType type = DirectiveType::CONTROL_FLOW) {
    DirectiveDef def;
    def.name = name;
    def.type = type;
    def.compile = compile_nothing;
    return def;
}

TEST(GlazeRegistry, DefaultsInRegistrationOrder) {
    DirectiveRegistry registry = DirectiveRegistry::with_defaults();
    std::vector<std::string> expected = {
        "if", "elseif", "else", "unless", "isset", "empty", "notempty",
        "switch", "case", "default", "try", "finally", "ifblock", "ifcontent",
        "foreach", "forelse", "while", "times",
        "class", "spread", "attr", "checked", "selected", "disabled", "tag",
        "text", "html", "nowrap", "slot", "bind", "raw",
    };
    EXPECT_EQ(registry.names(), expected);
    EXPECT_EQ(registry.size(), expected.size());
}

TEST(GlazeRegistry, DirectiveCapabilities) {
    DirectiveRegistry registry = DirectiveRegistry::with_defaults();

    const DirectiveDef* def = registry.lookup("if");
    ASSERT_NE(def, nullptr);
    EXPECT_EQ(def->type, DirectiveType::CONTROL_FLOW);
    EXPECT_TRUE(def->is_paired());
    EXPECT_TRUE(def->pairs_with_name("else"));
    EXPECT_TRUE(def->pairs_with_name("elseif"));
    EXPECT_FALSE(def->pairs_with_name("finally"));

    def = registry.lookup("else");
    ASSERT_NE(def, nullptr);
    EXPECT_FALSE(def->is_paired());
    EXPECT_EQ(def->follows, (std::vector<std::string>{"if", "elseif"}));

    EXPECT_EQ(registry.lookup("case")->enclosing, "switch");
    EXPECT_EQ(registry.lookup("default")->enclosing, "switch");
    EXPECT_TRUE(registry.lookup("forelse")->pairs_with_name("empty"));
    EXPECT_TRUE(registry.lookup("try")->pairs_with_name("finally"));

    EXPECT_TRUE(registry.lookup("ifblock")->claims_element());
    EXPECT_EQ(registry.lookup("ifblock")->claim_attribute, "name");
    EXPECT_TRUE(registry.lookup("ifcontent")->has_custom_extraction());
    EXPECT_TRUE(registry.lookup("tag")->has_custom_extraction());

    def = registry.lookup("class");
    EXPECT_EQ(def->type, DirectiveType::ATTRIBUTE);
    EXPECT_EQ(def->merge_mode, AttributeMergeMode::MERGE_NAMED);
    EXPECT_EQ(def->merge_target, "class");
    EXPECT_EQ(registry.lookup("spread")->merge_mode, AttributeMergeMode::EXCLUDE_NAMED);
    EXPECT_EQ(registry.lookup("attr")->merge_mode, AttributeMergeMode::EXCLUDE_NAMED);

    def = registry.lookup("nowrap");
    EXPECT_TRUE(def->wraps_content);
    EXPECT_FALSE(def->keep_wrapper);
    EXPECT_TRUE(def->compile == nullptr);

    EXPECT_EQ(registry.lookup("raw")->type, DirectiveType::PASS_THROUGH);
    EXPECT_EQ(registry.lookup("text")->type, DirectiveType::CONTENT);
}

TEST(GlazeRegistry, UnknownLookup) {
    DirectiveRegistry registry = DirectiveRegistry::with_defaults();
    EXPECT_EQ(registry.lookup("forech"), nullptr);
    EXPECT_FALSE(registry.has("s:if"));
    EXPECT_TRUE(registry.has("if"));
}

TEST(GlazeRegistry, DefineAddsAtEnd) {
    DirectiveRegistry registry;
    registry.define(custom("a"));
    registry.define(custom("b"));
    EXPECT_EQ(registry.names(), (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(registry.lookup("b")->compile == compile_nothing);
}

TEST(GlazeRegistry, ReplaceKeepsSlot) {
    DirectiveRegistry registry;
    registry.define(custom("a"));
    registry.define(custom("b"));
    registry.define(custom("a", DirectiveType::CONTENT));
    EXPECT_EQ(registry.names(), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(registry.lookup("a")->type, DirectiveType::CONTENT);
    EXPECT_EQ(registry.size(), 2u);
}

TEST(GlazeRegistry, RemoveAndRedefine) {
    DirectiveRegistry registry;
    registry.define(custom("a"));
    registry.define(custom("b"));
    EXPECT_TRUE(registry.remove("a"));
    EXPECT_FALSE(registry.remove("a"));
    EXPECT_FALSE(registry.has("a"));
    EXPECT_EQ(registry.names(), std::vector<std::string>{"b"});

    registry.define(custom("a"));
    EXPECT_EQ(registry.names(), (std::vector<std::string>{"a", "b"}));
}

TEST(GlazeRegistry, TypeNames) {
    EXPECT_STREQ(directive_type_name(DirectiveType::CONTROL_FLOW), "control-flow");
    EXPECT_STREQ(directive_type_name(DirectiveType::PASS_THROUGH), "pass-through");
}
