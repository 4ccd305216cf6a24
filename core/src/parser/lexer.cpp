#include "lexer.h"

#include <cctype>

namespace xpathq {

namespace {

bool is_node_type_name(const std::string& name) {
  return name == "text" || name == "comment" || name == "node" ||
         name == "processing-instruction";
}

}  // namespace

const char* token_type_name(TokenType type) {
  switch (type) {
    case TokenType::Slash: return "'/'";
    case TokenType::DoubleSlash: return "'//'";
    case TokenType::Pipe: return "'|'";
    case TokenType::Plus: return "'+'";
    case TokenType::Minus: return "'-'";
    case TokenType::Equal: return "'='";
    case TokenType::NotEqual: return "'!='";
    case TokenType::Less: return "'<'";
    case TokenType::LessEqual: return "'<='";
    case TokenType::Greater: return "'>'";
    case TokenType::GreaterEqual: return "'>='";
    case TokenType::Star: return "'*'";
    case TokenType::LParen: return "'('";
    case TokenType::RParen: return "')'";
    case TokenType::LBracket: return "'['";
    case TokenType::RBracket: return "']'";
    case TokenType::Comma: return "','";
    case TokenType::At: return "'@'";
    case TokenType::Dollar: return "'$'";
    case TokenType::Dot: return "'.'";
    case TokenType::DoubleDot: return "'..'";
    case TokenType::Colon: return "':'";
    case TokenType::DoubleColon: return "'::'";
    case TokenType::String: return "string";
    case TokenType::Number: return "number";
    case TokenType::Name: return "name";
    case TokenType::AxisName: return "axis";
    case TokenType::NodeType: return "node type";
    case TokenType::KeywordAnd: return "'and'";
    case TokenType::KeywordOr: return "'or'";
    case TokenType::KeywordMod: return "'mod'";
    case TokenType::KeywordDiv: return "'div'";
    case TokenType::Error: return "invalid input";
    case TokenType::End: return "end of expression";
  }
  return "token";
}

Lexer::Lexer(const std::string& input) : input_(input) {}

Token Lexer::make(TokenType type, size_t start, size_t length) {
  pos_ = start + length;
  return Token{type, input_.substr(start, length), start};
}

Token Lexer::next() {
  skip_ws();
  if (pos_ >= input_.size()) {
    return Token{TokenType::End, "", pos_};
  }

  size_t start = pos_;
  char c = input_[pos_];
  char n = pos_ + 1 < input_.size() ? input_[pos_ + 1] : '\0';
  switch (c) {
    case '/':
      return n == '/' ? make(TokenType::DoubleSlash, start, 2) : make(TokenType::Slash, start, 1);
    case ':':
      return n == ':' ? make(TokenType::DoubleColon, start, 2) : make(TokenType::Colon, start, 1);
    case '<':
      return n == '=' ? make(TokenType::LessEqual, start, 2) : make(TokenType::Less, start, 1);
    case '>':
      return n == '=' ? make(TokenType::GreaterEqual, start, 2) : make(TokenType::Greater, start, 1);
    case '!':
      if (n == '=') {
        return make(TokenType::NotEqual, start, 2);
      }
      return Token{TokenType::Error, "!", start};
    case '.':
      if (n == '.') {
        return make(TokenType::DoubleDot, start, 2);
      }
      if (std::isdigit(static_cast<unsigned char>(n))) {
        return lex_number();
      }
      return make(TokenType::Dot, start, 1);
    case '|': return make(TokenType::Pipe, start, 1);
    case '+': return make(TokenType::Plus, start, 1);
    case '-': return make(TokenType::Minus, start, 1);
    case '=': return make(TokenType::Equal, start, 1);
    case '*': return make(TokenType::Star, start, 1);
    case '(': return make(TokenType::LParen, start, 1);
    case ')': return make(TokenType::RParen, start, 1);
    case '[': return make(TokenType::LBracket, start, 1);
    case ']': return make(TokenType::RBracket, start, 1);
    case ',': return make(TokenType::Comma, start, 1);
    case '@': return make(TokenType::At, start, 1);
    case '$': return make(TokenType::Dollar, start, 1);
    case '\'':
    case '"':
      return lex_string();
    default:
      break;
  }
  if (std::isdigit(static_cast<unsigned char>(c))) {
    return lex_number();
  }
  if (is_name_start(c)) {
    return lex_name();
  }
  // WHY: the position stays on the bad character so callers can point at it.
  return Token{TokenType::Error, std::string(1, c), start};
}

Token Lexer::lex_string() {
  size_t start = pos_;
  char quote = input_[pos_++];
  std::string out;
  while (pos_ < input_.size()) {
    char c = input_[pos_++];
    if (c == quote) {
      return Token{TokenType::String, out, start};
    }
    if (c == '\\' && pos_ < input_.size()) {
      char e = input_[pos_++];
      switch (e) {
        case 't': out += '\t'; break;
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        case '\\': out += '\\'; break;
        case '\'': out += '\''; break;
        case '"': out += '"'; break;
        default:
          out += '\\';
          out += e;
          break;
      }
      continue;
    }
    out += c;
  }
  pos_ = input_.size();
  return Token{TokenType::Error, input_.substr(start), start};
}

Token Lexer::lex_name() {
  size_t start = pos_;
  while (pos_ < input_.size() && is_name_char(input_[pos_])) {
    ++pos_;
  }
  std::string name = input_.substr(start, pos_ - start);
  if (followed_by_double_colon()) {
    return Token{TokenType::AxisName, name, start};
  }
  if (name == "and") return Token{TokenType::KeywordAnd, name, start};
  if (name == "or") return Token{TokenType::KeywordOr, name, start};
  if (name == "mod") return Token{TokenType::KeywordMod, name, start};
  if (name == "div") return Token{TokenType::KeywordDiv, name, start};
  if (is_node_type_name(name)) return Token{TokenType::NodeType, name, start};
  return Token{TokenType::Name, name, start};
}

Token Lexer::lex_number() {
  size_t start = pos_;
  while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_]))) {
    ++pos_;
  }
  if (pos_ < input_.size() && input_[pos_] == '.' &&
      !(pos_ + 1 < input_.size() && input_[pos_ + 1] == '.')) {
    ++pos_;
    while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_]))) {
      ++pos_;
    }
  }
  return Token{TokenType::Number, input_.substr(start, pos_ - start), start};
}

void Lexer::skip_ws() {
  while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
    ++pos_;
  }
}

bool Lexer::followed_by_double_colon() const {
  size_t i = pos_;
  while (i < input_.size() && std::isspace(static_cast<unsigned char>(input_[i]))) {
    ++i;
  }
  return i + 1 < input_.size() && input_[i] == ':' && input_[i + 1] == ':';
}

bool Lexer::is_name_start(char c) {
  unsigned char u = static_cast<unsigned char>(c);
  return std::isalpha(u) || c == '_' || u >= 0x80;
}

bool Lexer::is_name_char(char c) {
  unsigned char u = static_cast<unsigned char>(c);
  return std::isalnum(u) || c == '_' || c == '-' || c == '.' || u >= 0x80;
}

std::vector<Token> tokenize(const std::string& input) {
  Lexer lexer(input);
  std::vector<Token> out;
  while (true) {
    Token token = lexer.next();
    TokenType type = token.type;
    out.push_back(std::move(token));
    if (type == TokenType::End || type == TokenType::Error) {
      break;
    }
  }
  return out;
}

}  // namespace xpathq
