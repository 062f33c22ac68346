/**
 * @file test_pdf_lexer.cpp
 * @brief Unit tests for the PDF object syntax reader
 */

#include <gtest/gtest.h>
#include <pdftrust/pdf/pdf_lexer.h>
#include <pdftrust/common/exceptions.h>

using namespace pdftrust::pdf;
using pdftrust::common::ParsingException;

namespace {

PdfValue parse(const std::string& text) {
    PdfParser parser(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    return parser.parseValue();
}

} // namespace

// ============================================================================
// Scalars
// ============================================================================

TEST(PdfLexerTest, Numbers) {
    auto i = parse("42");
    EXPECT_EQ(i.type, PdfValueType::INTEGER);
    EXPECT_EQ(i.integer, 42);

    auto neg = parse("-17");
    EXPECT_EQ(neg.type, PdfValueType::INTEGER);
    EXPECT_EQ(neg.integer, -17);

    auto r = parse("3.25");
    EXPECT_EQ(r.type, PdfValueType::REAL);
    EXPECT_DOUBLE_EQ(r.real, 3.25);

    auto leadingDot = parse("-.5");
    EXPECT_EQ(leadingDot.type, PdfValueType::REAL);
    EXPECT_DOUBLE_EQ(leadingDot.real, -0.5);
}

TEST(PdfLexerTest, KeywordsAndNull) {
    EXPECT_TRUE(parse("true").boolean);
    EXPECT_EQ(parse("false").type, PdfValueType::BOOLEAN);
    EXPECT_TRUE(parse("null").isNull());
}

TEST(PdfLexerTest, NameWithHexEscape) {
    auto name = parse("/Adobe#20PPKLite");
    EXPECT_EQ(name.type, PdfValueType::NAME);
    EXPECT_EQ(name.text, "Adobe PPKLite");
    EXPECT_TRUE(parse("/Sig").isName("Sig"));
}

TEST(PdfLexerTest, LiteralStringEscapes) {
    auto s = parse("(a\\(b\\) \\n (nested) \\101)");
    EXPECT_EQ(s.type, PdfValueType::STRING);
    EXPECT_EQ(s.text, "a(b) \n (nested) A");
    EXPECT_EQ(s.stringBytes(), s.text);
}

TEST(PdfLexerTest, LiteralStringLineContinuation) {
    EXPECT_EQ(parse("(abc\\\ndef)").text, "abcdef");
}

TEST(PdfLexerTest, HexStringSkipsWhitespaceAndPadsOddDigit) {
    auto hex = parse("<48 65 6C6C 6F>");
    EXPECT_EQ(hex.type, PdfValueType::HEX_STRING);
    EXPECT_EQ(hex.text, "48656C6C6F");
    EXPECT_EQ(hex.stringBytes(), "Hello");

    EXPECT_EQ(parse("<414>").stringBytes(), std::string("A@"));
}

// ============================================================================
// Composites and references
// ============================================================================

TEST(PdfLexerTest, ReferenceVersusIntegers) {
    auto ref = parse("12 0 R");
    ASSERT_TRUE(ref.isRef());
    EXPECT_EQ(ref.ref.number, 12);
    EXPECT_EQ(ref.ref.generation, 0);
    EXPECT_EQ(ref.ref.toString(), "12 0 R");

    auto arr = parse("[1 2 3 0 R 4]");
    ASSERT_TRUE(arr.isArray());
    ASSERT_EQ(arr.array.size(), 4u);
    EXPECT_EQ(arr.array[0].integer, 1);
    EXPECT_TRUE(arr.array[1].isNumber());
    EXPECT_TRUE(arr.array[2].isRef());
    EXPECT_EQ(arr.array[2].ref.number, 3);
    EXPECT_EQ(arr.array[3].integer, 4);
}

TEST(PdfLexerTest, DictionaryLookupAndOffsets) {
    std::string text = "<< /Type /Sig /ByteRange [0 10 20 30] /Contents <0a0b> /M (D:2024) >>";
    auto dict = parse(text);
    ASSERT_TRUE(dict.isDict());
    EXPECT_EQ(dict.offset, 0u);
    EXPECT_EQ(dict.endOffset, text.size());

    ASSERT_NE(dict.get("Type"), nullptr);
    EXPECT_TRUE(dict.get("Type")->isName("Sig"));
    EXPECT_EQ(dict.get("ByteRange")->array.size(), 4u);
    EXPECT_EQ(dict.get("Missing"), nullptr);

    const PdfValue* contents = dict.get("Contents");
    ASSERT_NE(contents, nullptr);
    EXPECT_EQ(text.substr(contents->offset, contents->endOffset - contents->offset), "<0a0b>");
    EXPECT_EQ(contents->stringBytes(), std::string("\x0a\x0b"));
}

TEST(PdfLexerTest, GetOnNonDictionaryIsNull) {
    EXPECT_EQ(parse("[1]").get("Type"), nullptr);
}

TEST(PdfLexerTest, CommentsAreSkipped) {
    auto dict = parse("<< % comment\n/A 1 %another\r/B 2 >>");
    ASSERT_TRUE(dict.isDict());
    EXPECT_EQ(dict.dict.size(), 2u);
    EXPECT_EQ(dict.get("B")->integer, 2);
}

TEST(PdfLexerTest, ObjectHeader) {
    std::string text = "7 0 obj\n<< /A 1 >>\nendobj";
    PdfParser parser(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    PdfObjectRef ref;
    ASSERT_TRUE(parser.parseObjectHeader(ref));
    EXPECT_EQ(ref.number, 7);
    auto value = parser.parseValue();
    EXPECT_TRUE(value.isDict());
    parser.skipWhitespaceAndComments();
    EXPECT_EQ(parser.readKeyword(), "endobj");
}

TEST(PdfLexerTest, ObjectHeaderFailureRestoresCursor) {
    std::string text = "7 0 R";
    PdfParser parser(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    PdfObjectRef ref;
    EXPECT_FALSE(parser.parseObjectHeader(ref));
    EXPECT_EQ(parser.position(), 0u);
}

// ============================================================================
// Malformed input
// ============================================================================

TEST(PdfLexerTest, MalformedInputThrows) {
    EXPECT_THROW(parse(""), ParsingException);
    EXPECT_THROW(parse("(unterminated"), ParsingException);
    EXPECT_THROW(parse("<abz>"), ParsingException);
    EXPECT_THROW(parse("<< /A 1"), ParsingException);
    EXPECT_THROW(parse("<< 1 2 >>"), ParsingException);
    EXPECT_THROW(parse("[1 2"), ParsingException);
    EXPECT_THROW(parse("bogus"), ParsingException);
    EXPECT_THROW(parse("-"), ParsingException);
}

TEST(PdfLexerTest, DeepNestingRejected) {
    std::string deep(100, '[');
    deep += std::string(100, ']');
    EXPECT_THROW(parse(deep), ParsingException);

    std::string ok(10, '[');
    ok += std::string(10, ']');
    EXPECT_NO_THROW(parse(ok));
}

TEST(PdfLexerTest, NullDataWithSizeRejected) {
    EXPECT_THROW(PdfParser(nullptr, 5), std::invalid_argument);
    EXPECT_NO_THROW(PdfParser(nullptr, 0));
}
