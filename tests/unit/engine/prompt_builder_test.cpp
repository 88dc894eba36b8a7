#include <gtest/gtest.h>
#include <langextract/engine/prompt_builder.h>

using namespace langextract;
using namespace langextract::engine;
using document::BasicExtractionSchema;
using document::ClassDefinition;
using document::ExampleData;
using document::Extraction;

class PromptBuilderTest : public ::testing::Test {
protected:
    PromptContext basic() {
        PromptContext ctx;
        ctx.taskDescription = "Extract people and organizations";
        ctx.text = "John Smith works at Google Inc.";
        return ctx;
    }

    PromptBuilder builder_;
};

TEST_F(PromptBuilderTest, MinimalPrompt) {
    auto prompt = builder_.build(basic());
    EXPECT_NE(prompt.find("Task: Extract people and organizations"), std::string::npos);
    EXPECT_NE(prompt.find("Text to process:\nJohn Smith works at Google Inc."), std::string::npos);
    EXPECT_NE(prompt.find(PromptBuilder::outputContract()), std::string::npos);
    EXPECT_EQ(prompt.find("Examples:"), std::string::npos);
    EXPECT_EQ(prompt.find("extraction pass"), std::string::npos);
}

TEST_F(PromptBuilderTest, SectionsAppearInOrder) {
    std::vector<ExampleData> examples;
    ExampleData ex;
    ex.text = "Alice joined Acme.";
    ex.extractions.emplace_back("person", "Alice");
    ex.extractions.emplace_back("org", "Acme");
    examples.push_back(ex);

    BasicExtractionSchema schema("people");
    schema.addClass(ClassDefinition{"person", "a human", {}});
    schema.addClass(ClassDefinition{"org", "a company", {}});

    auto ctx = basic();
    ctx.examples = &examples;
    ctx.schema = &schema;
    ctx.additionalContext = "Corporate filings";
    ctx.passNumber = 2;
    ctx.totalPasses = 3;

    auto prompt = builder_.build(ctx);
    const auto task = prompt.find("Task: ");
    const auto exampleSection = prompt.find("Examples:");
    const auto classes = prompt.find("Expected extraction classes: ");
    const auto context = prompt.find("Additional context: Corporate filings");
    const auto pass = prompt.find("This is extraction pass 2 of 3");
    const auto text = prompt.find("Text to process:\n");
    const auto contract = prompt.find("\"extractions\"");

    ASSERT_NE(task, std::string::npos);
    ASSERT_NE(exampleSection, std::string::npos);
    ASSERT_NE(classes, std::string::npos);
    ASSERT_NE(context, std::string::npos);
    ASSERT_NE(pass, std::string::npos);
    ASSERT_NE(text, std::string::npos);
    EXPECT_LT(task, exampleSection);
    EXPECT_LT(exampleSection, classes);
    EXPECT_LT(classes, context);
    EXPECT_LT(context, pass);
    EXPECT_LT(pass, text);
    EXPECT_LT(text, contract);

    EXPECT_NE(prompt.find("Example 1:\nText: Alice joined Acme."), std::string::npos);
    EXPECT_NE(prompt.find("- person: Alice"), std::string::npos);
    EXPECT_NE(prompt.find("- org: Acme"), std::string::npos);
}

TEST_F(PromptBuilderTest, EmptyOptionalSectionsAreOmitted) {
    std::vector<ExampleData> none;
    BasicExtractionSchema schema("empty");
    auto ctx = basic();
    ctx.examples = &none;
    ctx.schema = &schema;
    ctx.additionalContext = "";
    auto prompt = builder_.build(ctx);
    EXPECT_EQ(prompt.find("Examples:"), std::string::npos);
    EXPECT_EQ(prompt.find("Expected extraction classes"), std::string::npos);
    EXPECT_EQ(prompt.find("Additional context"), std::string::npos);
}

TEST_F(PromptBuilderTest, IsDeterministic) {
    EXPECT_EQ(builder_.build(basic()), builder_.build(basic()));
}

TEST_F(PromptBuilderTest, ChunkedTextGetsPartNote) {
    auto ctx = basic();
    EXPECT_EQ(builder_.build(ctx).find("part 1 of"), std::string::npos);

    ctx.chunkNumber = 2;
    ctx.totalChunks = 3;
    auto prompt = builder_.build(ctx);
    const auto note = prompt.find("part 2 of 3 of a longer document");
    ASSERT_NE(note, std::string::npos);
    EXPECT_LT(note, prompt.find("Text to process:"));
}
