#include <gtest/gtest.h>
#include "../glaze/pipeline/pipeline.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace glaze;

// records "<name>:<before|after>:<node text or tag>" for every hook call
class TracePass : public AstPass {
public:
    TracePass(const char* name, std::vector<std::string>* log) : name_(name), log_(log) {}
    const char* name() const override { return name_; }
    NodeAction before(NodeId node, PipelineContext& context) override {
        log_->push_back(std::string(name_) + ":before:" + label(node, context));
        return NodeAction::none();
    }
    NodeAction after(NodeId node, PipelineContext& context) override {
        log_->push_back(std::string(name_) + ":after:" + label(node, context));
        return NodeAction::none();
    }

private:
    static std::string label(NodeId node, PipelineContext& context) {
        const Node& n = context.compilation.store.get(node);
        if (n.is(NodeType::DOCUMENT)) return "doc";
        return n.is(NodeType::TEXT) ? n.text : n.tag;
    }
    const char* name_;
    std::vector<std::string>* log_;
};

// replaces TEXT "x" with TEXT "y" and TEXT "z"
class SplitPass : public AstPass {
public:
    const char* name() const override { return "split"; }
    NodeAction before(NodeId node, PipelineContext& context) override {
        NodeStore& store = context.compilation.store;
        if (!store.get(node).is(NodeType::TEXT) || store.get(node).text != "x") return NodeAction::none();
        return NodeAction::replace({store.make_text("y", 1, 1), store.make_text("z", 1, 1)});
    }
};

// replaces every TEXT node with a fresh copy, forever
class EndlessPass : public AstPass {
public:
    const char* name() const override { return "endless"; }
    NodeAction before(NodeId node, PipelineContext& context) override {
        NodeStore& store = context.compilation.store;
        if (!store.get(node).is(NodeType::TEXT)) return NodeAction::none();
        return NodeAction::replace({store.make_text(store.get(node).text, 1, 1)}, true);
    }
};

// removes the document itself
class DropDocumentPass : public AstPass {
public:
    const char* name() const override { return "drop"; }
    NodeAction after(NodeId node, PipelineContext& context) override {
        if (context.compilation.store.get(node).is(NodeType::DOCUMENT)) return NodeAction::replace({});
        return NodeAction::none();
    }
};

class FailPass : public AstPass {
public:
    const char* name() const override { return "fail"; }
    NodeAction before(NodeId node, PipelineContext& context) override {
        if (context.compilation.store.get(node).is(NodeType::TEXT)) {
            context.compilation.fail_at(ERR_SYNTAX_ERROR, "no text here", node);
            return NodeAction::fail();
        }
        return NodeAction::none();
    }
};

// skips the children of <skip> elements
class SkipPass : public AstPass {
public:
    const char* name() const override { return "skip"; }
    NodeAction before(NodeId node, PipelineContext& context) override {
        const Node& n = context.compilation.store.get(node);
        if (n.is(NodeType::ELEMENT) && n.tag == "skip") return NodeAction::skip_children();
        return NodeAction::none();
    }
};

class GlazePipelineTest : public ::testing::Test {
protected:
    GlazePipelineTest() { ctx.config = &config; }

    NodeId document_with(const std::vector<NodeId>& children) {
        NodeId doc = ctx.store.make_document();
        ctx.store.set_children(doc, children);
        return doc;
    }
    NodeId text(const char* s) { return ctx.store.make_text(s, 1, 1); }
    NodeId element(const char* tag, const std::vector<NodeId>& children) {
        NodeId el = ctx.store.make_element(tag, 1, 1);
        ctx.store.set_children(el, children);
        return el;
    }
    std::vector<std::string> texts(NodeId parent) {
        std::vector<std::string> out;
        for (NodeId id : ctx.store.get(parent).children) out.push_back(ctx.store.get(id).text);
        return out;
    }

    Config config;
    CompilationContext ctx;
    Pipeline pipeline;
};

// ============================================================================
// Ordering
// ============================================================================

TEST_F(GlazePipelineTest, PriorityThenRegistrationOrder) {
    std::vector<std::string> log;
    pipeline.add_pass(std::unique_ptr<AstPass>(new TracePass("b", &log)), 10);
    pipeline.add_pass(std::unique_ptr<AstPass>(new TracePass("a", &log)), 5);
    pipeline.add_pass(std::unique_ptr<AstPass>(new TracePass("c", &log)), 10);
    EXPECT_EQ(pipeline.pass_names(), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(pipeline.pass_count(), 3u);
}

TEST_F(GlazePipelineTest, InsertRelativeToAnchor) {
    std::vector<std::string> log;
    pipeline.add_pass(std::unique_ptr<AstPass>(new TracePass("a", &log)), 10);
    pipeline.add_pass(std::unique_ptr<AstPass>(new TracePass("b", &log)), 10);
    EXPECT_TRUE(pipeline.add_pass_before("b", std::unique_ptr<AstPass>(new TracePass("before-b", &log))));
    EXPECT_TRUE(pipeline.add_pass_after("a", std::unique_ptr<AstPass>(new TracePass("after-a", &log))));
    EXPECT_FALSE(pipeline.add_pass_after("missing", std::unique_ptr<AstPass>(new TracePass("x", &log))));
    EXPECT_EQ(pipeline.pass_names(), (std::vector<std::string>{"a", "after-a", "before-b", "b"}));
}

TEST_F(GlazePipelineTest, HooksRunDepthFirst) {
    std::vector<std::string> log;
    pipeline.add_pass(std::unique_ptr<AstPass>(new TracePass("one", &log)), 1);
    pipeline.add_pass(std::unique_ptr<AstPass>(new TracePass("two", &log)), 2);
    NodeId doc = document_with({element("p", {text("t")})});

    EXPECT_EQ(pipeline.execute(doc, ctx), doc);
    std::vector<std::string> expected = {
        "one:before:doc", "two:before:doc",
        "one:before:p", "two:before:p",
        "one:before:t", "two:before:t", "one:after:t", "two:after:t",
        "one:after:p", "two:after:p",
        "one:after:doc", "two:after:doc",
    };
    EXPECT_EQ(log, expected);
}

TEST_F(GlazePipelineTest, SetsParentLinks) {
    std::vector<std::string> log;
    pipeline.add_pass(std::unique_ptr<AstPass>(new TracePass("t", &log)), 0);
    NodeId t = text("t");
    NodeId p = element("p", {t});
    NodeId doc = document_with({p});
    ctx.store.get(t).parent = NO_NODE;

    ASSERT_NE(pipeline.execute(doc, ctx), NO_NODE);
    EXPECT_EQ(ctx.store.get(t).parent, p);
    EXPECT_EQ(ctx.store.get(p).parent, doc);
}

// ============================================================================
// Actions
// ============================================================================

TEST_F(GlazePipelineTest, ReplaceSplicesNodes) {
    pipeline.add_pass(std::unique_ptr<AstPass>(new SplitPass()), 0);
    NodeId doc = document_with({text("a"), text("x"), text("b")});
    ASSERT_EQ(pipeline.execute(doc, ctx), doc);
    EXPECT_EQ(texts(doc), (std::vector<std::string>{"a", "y", "z", "b"}));
}

TEST_F(GlazePipelineTest, ReplacementsWalkRemainingPasses) {
    std::vector<std::string> log;
    pipeline.add_pass(std::unique_ptr<AstPass>(new SplitPass()), 0);
    pipeline.add_pass(std::unique_ptr<AstPass>(new TracePass("trace", &log)), 1);
    NodeId doc = document_with({text("x")});
    ASSERT_EQ(pipeline.execute(doc, ctx), doc);
    std::vector<std::string> expected = {
        "trace:before:doc",
        "trace:before:y", "trace:after:y",
        "trace:before:z", "trace:after:z",
        "trace:after:doc",
    };
    EXPECT_EQ(log, expected);
}

TEST_F(GlazePipelineTest, SkipChildren) {
    std::vector<std::string> log;
    pipeline.add_pass(std::unique_ptr<AstPass>(new SkipPass()), 0);
    pipeline.add_pass(std::unique_ptr<AstPass>(new TracePass("trace", &log)), 1);
    NodeId doc = document_with({element("skip", {text("hidden")})});
    ASSERT_EQ(pipeline.execute(doc, ctx), doc);
    for (const std::string& entry : log) EXPECT_EQ(entry.find("hidden"), std::string::npos);
}

TEST_F(GlazePipelineTest, FailStopsWithRecordedError) {
    pipeline.add_pass(std::unique_ptr<AstPass>(new FailPass()), 0);
    NodeId doc = document_with({text("t")});
    EXPECT_EQ(pipeline.execute(doc, ctx), NO_NODE);
    EXPECT_EQ(ctx.error.code, ERR_SYNTAX_ERROR);
    EXPECT_EQ(ctx.error.message, "no text here");
}

// ============================================================================
// Limits
// ============================================================================

TEST_F(GlazePipelineTest, RewriteLimit) {
    config.max_rewrites = 10;
    pipeline.add_pass(std::unique_ptr<AstPass>(new EndlessPass()), 0);
    NodeId doc = document_with({text("t")});
    EXPECT_EQ(pipeline.execute(doc, ctx), NO_NODE);
    EXPECT_EQ(ctx.error.code, ERR_REWRITE_LIMIT);
}

TEST_F(GlazePipelineTest, RewriteLimitCountsEachChain) {
    config.max_rewrites = 10;
    pipeline.add_pass(std::unique_ptr<AstPass>(new SplitPass()), 0);
    std::vector<NodeId> many;
    for (int i = 0; i < 25; i++) many.push_back(text("x"));
    NodeId doc = document_with(many);
    ASSERT_EQ(pipeline.execute(doc, ctx), doc);
    EXPECT_EQ(texts(doc).size(), 50u);
    EXPECT_FALSE(ctx.failed());
}

TEST_F(GlazePipelineTest, DepthLimit) {
    config.max_depth = 2;
    std::vector<std::string> log;
    pipeline.add_pass(std::unique_ptr<AstPass>(new TracePass("t", &log)), 0);

    NodeId shallow = document_with({element("a", {text("x")})});
    EXPECT_NE(pipeline.execute(shallow, ctx), NO_NODE);

    NodeId deep = document_with({element("a", {element("b", {text("x")})})});
    EXPECT_EQ(pipeline.execute(deep, ctx), NO_NODE);
    EXPECT_EQ(ctx.error.code, ERR_NESTING_TOO_DEEP);
}

TEST_F(GlazePipelineTest, ResultMustBeDocument) {
    pipeline.add_pass(std::unique_ptr<AstPass>(new DropDocumentPass()), 0);
    NodeId doc = document_with({text("t")});
    EXPECT_EQ(pipeline.execute(doc, ctx), NO_NODE);
    EXPECT_EQ(ctx.error.code, ERR_PIPELINE_RESULT);
}

TEST_F(GlazePipelineTest, EmptyPipelineReturnsDocument) {
    NodeId doc = document_with({text("t")});
    EXPECT_EQ(pipeline.execute(doc, ctx), doc);
    EXPECT_EQ(texts(doc), std::vector<std::string>{"t"});
}
