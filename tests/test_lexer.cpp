#include "test_harness.h"

#include "parser/lexer.h"

namespace {

using xpathq::Token;
using xpathq::TokenType;
using xpathq::tokenize;

bool types_are(const std::vector<Token>& tokens, const std::vector<TokenType>& expected) {
  if (tokens.size() != expected.size()) return false;
  for (size_t i = 0; i < tokens.size(); ++i) {
    if (tokens[i].type != expected[i]) return false;
  }
  return true;
}

void test_two_character_operators() {
  auto tokens = tokenize("// :: <= >= != ..");
  expect_true(types_are(tokens, {TokenType::DoubleSlash, TokenType::DoubleColon, TokenType::LessEqual,
                                 TokenType::GreaterEqual, TokenType::NotEqual, TokenType::DoubleDot,
                                 TokenType::End}),
              "two character operators");
}

void test_single_character_operators() {
  auto tokens = tokenize("/|+-=<>*()[],@$.:");
  expect_eq(tokens.size(), 18, "token count");
  expect_true(tokens[0].type == TokenType::Slash, "slash");
  expect_true(tokens[3].type == TokenType::Minus, "minus is its own token");
  expect_true(tokens[16].type == TokenType::Colon, "colon");
}

void test_numbers_have_no_sign_or_exponent() {
  auto tokens = tokenize("-12.5");
  expect_true(types_are(tokens, {TokenType::Minus, TokenType::Number, TokenType::End}), "minus then number");
  expect_true(tokens[1].text == "12.5", "number text");

  tokens = tokenize(".5");
  expect_true(tokens[0].type == TokenType::Number && tokens[0].text == ".5", "leading dot number");

  tokens = tokenize("1e3");
  expect_true(types_are(tokens, {TokenType::Number, TokenType::Name, TokenType::End}),
              "exponent is not part of the literal");
}

void test_strings_with_escapes() {
  auto tokens = tokenize("'it\\'s' \"a\\tb\\n\"");
  expect_true(tokens[0].type == TokenType::String && tokens[0].text == "it's", "escaped quote");
  expect_true(tokens[1].type == TokenType::String && tokens[1].text == "a\tb\n", "escaped tab and newline");
}

void test_unterminated_string_is_error() {
  auto tokens = tokenize("foo('abc");
  const Token& last = tokens.back();
  expect_true(last.type == TokenType::Error, "error token");
  expect_eq(last.pos, 4, "error position at opening quote");
}

void test_axis_name_needs_double_colon() {
  auto tokens = tokenize("child::a child");
  expect_true(tokens[0].type == TokenType::AxisName, "axis before ::");
  expect_true(tokens[2].type == TokenType::Name, "plain name after ::");
  expect_true(tokens[3].type == TokenType::Name, "child without :: is a name");

  tokens = tokenize("ancestor  ::x");
  expect_true(tokens[0].type == TokenType::AxisName, "whitespace before ::");
}

void test_keywords_and_node_types() {
  auto tokens = tokenize("and or mod div text comment node processing-instruction other");
  expect_true(types_are(tokens, {TokenType::KeywordAnd, TokenType::KeywordOr, TokenType::KeywordMod,
                                 TokenType::KeywordDiv, TokenType::NodeType, TokenType::NodeType,
                                 TokenType::NodeType, TokenType::NodeType, TokenType::Name, TokenType::End}),
              "keyword classification");
}

void test_unknown_character() {
  auto tokens = tokenize("a # b");
  expect_true(tokens.back().type == TokenType::Error, "error token");
  expect_true(tokens.back().text == "#", "error text");
  expect_eq(tokens.back().pos, 2, "error position");

  tokens = tokenize("a ! b");
  expect_true(tokens.back().type == TokenType::Error, "lone bang");
}

void test_positions_are_byte_offsets() {
  auto tokens = tokenize("  //a[@id = 'x']");
  expect_eq(tokens[0].pos, 2, "first token offset");
  expect_eq(tokens[2].pos, 5, "bracket offset");
}

}  // namespace

void register_lexer_tests(std::vector<TestCase>& tests) {
  tests.push_back({"lexer_two_character_operators", test_two_character_operators});
  tests.push_back({"lexer_single_character_operators", test_single_character_operators});
  tests.push_back({"lexer_numbers_have_no_sign_or_exponent", test_numbers_have_no_sign_or_exponent});
  tests.push_back({"lexer_strings_with_escapes", test_strings_with_escapes});
  tests.push_back({"lexer_unterminated_string_is_error", test_unterminated_string_is_error});
  tests.push_back({"lexer_axis_name_needs_double_colon", test_axis_name_needs_double_colon});
  tests.push_back({"lexer_keywords_and_node_types", test_keywords_and_node_types});
  tests.push_back({"lexer_unknown_character", test_unknown_character});
  tests.push_back({"lexer_positions_are_byte_offsets", test_positions_are_byte_offsets});
}
