//  regen: guarded-region regeneration engine
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the regen authors
#pragma once

// Standard library includes
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <map>
#include <optional>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include <fkYAML/node.hpp>

namespace regen {

  // Specialized version of the fkYAML basic_node template. The choice of
  // fkyaml::ordered_map preserves the lexical order of the input, which
  // keeps generated output (iteration order, import lists) deterministic.
  using ordered_node = fkyaml::basic_node<
    std::vector, // sequence container
    fkyaml::ordered_map, // mapping container
    bool,
    std::int64_t,
    double,
    std::string,
    fkyaml::node_value_converter
  >;

  // Flat name -> text context used for placeholder binding
  using Bindings = std::map< std::string, std::string >;

  // Raised for conditions that cannot be evaluated against a model
  class ConditionError : public std::runtime_error {
  public:
    explicit ConditionError( const std::string& msg )
      : std::runtime_error( msg ) {}
  };

namespace internal {

  inline constexpr char PATH_DELIMITER = '.';
  inline const std::string OPEN_PLACEHOLDER = "{";
  inline const std::string CLOSE_PLACEHOLDER = "}";

  // Divide a key path string by PATH_DELIMITER instances
  inline std::vector< std::string > split_segments( const std::string& tok ) {
    std::vector< std::string > segs;
    size_t start = 0;
    while ( true ) {
      size_t pos = tok.find( PATH_DELIMITER, start );
      if ( pos == std::string::npos ) {
        segs.push_back( tok.substr(start) );
        break;
      }
      segs.push_back( tok.substr(start, pos - start) );
      start = pos + 1;
    }
    return segs;
  }

  // Connects path segments [first, last) into a full path string
  inline std::string join_path( const std::vector< std::string >& segs,
    size_t first = 0, size_t last = std::string::npos )
  {
    if ( last > segs.size() ) last = segs.size();
    std::string s;
    for ( size_t i = first; i < last; ++i ) {
      if ( i > first ) s += PATH_DELIMITER;
      s += segs[ i ];
    }
    return s;
  }

  // True if 'key' equals 'path' or names one of its ancestors or
  // descendants ("schema" vs "schema.fields")
  inline bool paths_overlap( const std::string& a, const std::string& b ) {
    if ( a == b ) return true;
    const std::string& shorter = a.size() < b.size() ? a : b;
    const std::string& longer = a.size() < b.size() ? b : a;
    return longer.size() > shorter.size()
      && longer.compare( 0, shorter.size(), shorter ) == 0
      && longer[ shorter.size() ] == PATH_DELIMITER;
  }

  // Helpers for conversions to/from the ordered_node type

  template < typename T >
  inline T to_native_checked( const ordered_node& n ) {
    T out;
    fkyaml::node_value_converter< T >::from_node( n, out );
    return out;
  }

  template < typename T >
  inline ordered_node make_node_from( const T& value ) {
    ordered_node n;
    fkyaml::node_value_converter< T >::to_node( n, value );
    return n;
  }

  inline bool is_non_null_scalar( const ordered_node& n ) {
    return ( n.is_scalar() && !n.is_null() );
  }

  inline std::string format_float( double v ) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
  }

  inline std::string to_string_any( const ordered_node& n ) {
    if ( n.is_null() ) return std::string();
    if ( n.is_string() ) return to_native_checked< std::string >( n );
    if ( n.is_integer() ) return std::to_string(
      to_native_checked< std::int64_t >( n )
    );
    if ( n.is_boolean() ) return n.get_value< bool >() ? "true" : "false";
    if ( n.is_float_number() ) return format_float(
      to_native_checked< double >( n )
    );

    // We did not match any of the scalar types, so fall back to serialization
    return ordered_node::serialize( n );
  }

  // Sequence of scalars -> vector of their text forms. A scalar counts as
  // a one-element list; null and mappings yield nothing.
  inline std::vector< std::string > to_string_list( const ordered_node& n ) {
    std::vector< std::string > out;
    if ( n.is_sequence() ) {
      for ( size_t i = 0; i < n.size(); ++i ) {
        const ordered_node& el = n.at( i );
        if ( is_non_null_scalar(el) ) out.push_back( to_string_any(el) );
      }
    }
    else if ( is_non_null_scalar(n) ) {
      out.push_back( to_string_any(n) );
    }
    return out;
  }

  inline bool is_truthy( const ordered_node& n ) {
    if ( n.is_null() ) return false;
    if ( n.is_boolean() ) return n.get_value< bool >();
    if ( n.is_integer() ) return n.get_value< std::int64_t >() != 0;
    if ( n.is_float_number() ) return n.get_value< double >() != 0.0;
    if ( n.is_string() ) {
      const std::string s = n.get_value< std::string >();
      return !s.empty() && s != "false" && s != "0";
    }
    return n.size() > 0;
  }

  // Deep merge of an overlay node onto a base node. Executes simple
  // replacement for scalars and sequences. An explicit null overlay clears
  // the corresponding base node. For an overlay and base that are both
  // mappings, deep merge the contents with an "overlay wins" policy.
  inline ordered_node deep_merge( const ordered_node& base,
    const ordered_node& overlay )
  {
    if ( overlay.is_null() ) return ordered_node();
    if ( !overlay.is_mapping() ) return overlay;
    if ( !base.is_mapping() ) return overlay;

    ordered_node result = base;
    for ( const auto& [mk, mv] : overlay.map_items() ) {
      const std::string k = mk.get_value< std::string >();
      if ( result.contains(k) ) {
        result[ k ] = deep_merge( result.at(k), mv );
      } else {
        result[ k ] = mv;
      }
    }
    return result;
  }

  // Simple replace-all utility for substrings
  inline void replace_all( std::string& s, const std::string& from,
    const std::string& to )
  {
    if ( from.empty() ) return;
    std::string::size_type pos = 0;
    while ( (pos = s.find( from, pos )) != std::string::npos ) {
      s.replace( pos, from.size(), to );
      pos += to.size();
    }
  }

  // Bind placeholders {name} using a context map.
  // Doubled placeholder delimiters OPEN_PLACEHOLDER and CLOSE_PLACEHOLDER are
  // protected and stay doubled, so several binding passes can run before
  // unescape_placeholders() turns them into literal single versions
  inline std::string protected_bind( const std::string& s,
    const Bindings& ctx )
  {
    static const std::string OPEN_PROTECTOR = "\x01";
    static const std::string CLOSE_PROTECTOR = "\x02";
    std::string t = s;
    replace_all( t, OPEN_PLACEHOLDER + OPEN_PLACEHOLDER, OPEN_PROTECTOR );
    replace_all( t, CLOSE_PLACEHOLDER + CLOSE_PLACEHOLDER, CLOSE_PROTECTOR );

    // Only names that actually occur are looked up, so large model contexts
    // cost one scan of the text rather than one scan per binding
    static const std::regex ph( R"(\{([A-Za-z_][A-Za-z0-9_.]*)\})" );
    std::string out;
    out.reserve( t.size() );
    auto begin = t.cbegin();
    std::smatch m;
    while ( std::regex_search(begin, t.cend(), m, ph) ) {
      out.append( begin, m[0].first );
      auto it = ctx.find( m[1].str() );
      if ( it != ctx.end() ) out += it->second;
      else out.append( m[0].first, m[0].second );
      begin = m[0].second;
    }
    out.append( begin, t.cend() );

    replace_all( out, OPEN_PROTECTOR, OPEN_PLACEHOLDER + OPEN_PLACEHOLDER );
    replace_all( out, CLOSE_PROTECTOR, CLOSE_PLACEHOLDER + CLOSE_PLACEHOLDER );
    return out;
  }

  // Names of placeholders like "{name}" still present after a binding pass.
  // Doubled delimiters are escapes and are not reported.
  inline std::vector< std::string > unresolved_placeholders(
    const std::string& s )
  {
    std::string t = s;
    replace_all( t, OPEN_PLACEHOLDER + OPEN_PLACEHOLDER, "\x01" );
    replace_all( t, CLOSE_PLACEHOLDER + CLOSE_PLACEHOLDER, "\x02" );

    static const std::regex ph( R"(\{([A-Za-z_][A-Za-z0-9_.]*)\})" );
    std::vector< std::string > names;
    std::smatch m;
    auto begin = t.cbegin();
    while ( std::regex_search(begin, t.cend(), m, ph) ) {
      const std::string nm = m[1].str();
      bool seen = false;
      for ( const auto& n : names ) if ( n == nm ) seen = true;
      if ( !seen ) names.push_back( nm );
      begin = m.suffix().first;
    }
    return names;
  }

  // Collapse escaped delimiters once binding is finished
  inline std::string unescape_placeholders( const std::string& s ) {
    std::string t = s;
    replace_all( t, OPEN_PLACEHOLDER + OPEN_PLACEHOLDER, OPEN_PLACEHOLDER );
    replace_all( t, CLOSE_PLACEHOLDER + CLOSE_PLACEHOLDER, CLOSE_PLACEHOLDER );
    return t;
  }

  // Add every non-null scalar below 'n' to 'out' under its dotted path.
  // Sequence elements are addressed by index ("fields.0").
  inline void flatten_scalars( const ordered_node& n, const std::string& path,
    Bindings& out )
  {
    if ( n.is_mapping() ) {
      for ( const auto& [mk, mv] : n.map_items() ) {
        const std::string k = to_string_any( mk );
        flatten_scalars( mv, path.empty() ? k : path + PATH_DELIMITER + k,
          out );
      }
      return;
    }
    if ( n.is_sequence() ) {
      for ( size_t i = 0; i < n.size(); ++i ) {
        const std::string idx = std::to_string( i );
        flatten_scalars( n.at(i), path.empty() ? idx
          : path + PATH_DELIMITER + idx, out );
      }
      return;
    }
    if ( is_non_null_scalar(n) && !path.empty() ) out[ path ] = to_string_any( n );
  }

  inline bool parse_index( const std::string& s, size_t& out ) {
    if ( s.empty() ) return false;
    for ( char c : s ) {
      if ( !std::isdigit( static_cast< unsigned char >(c) ) ) return false;
    }
    out = static_cast< size_t >( std::strtoull( s.c_str(), nullptr, 10 ) );
    return true;
  }

  // Walk segs[i..] below 'node'. Mapping keys that themselves contain
  // PATH_DELIMITER are matched greedily (longest key first).
  inline const ordered_node* lookup_segments( const ordered_node& node,
    const std::vector< std::string >& segs, size_t i )
  {
    if ( i == segs.size() ) return &node;
    if ( node.is_mapping() ) {
      for ( size_t j = segs.size(); j > i; --j ) {
        const std::string key = join_path( segs, i, j );
        if ( node.contains(key) ) {
          const ordered_node* found = lookup_segments( node.at(key), segs, j );
          if ( found ) return found;
        }
      }
      return nullptr;
    }
    if ( node.is_sequence() ) {
      size_t idx = 0;
      if ( !parse_index(segs[i], idx) || idx >= node.size() ) return nullptr;
      return lookup_segments( node.at(idx), segs, i + 1 );
    }
    return nullptr;
  }

} // namespace regen::internal

  // Immutable view of the upstream model. Values are addressed by dotted
  // key paths, e.g. "schema.fields" or "widgets.0.name".
  class ModelSnapshot {
  public:
    inline ModelSnapshot() : root_( ordered_node::mapping() ) {}
    inline explicit ModelSnapshot( ordered_node root )
      : root_( std::move(root) ) {}

    static ModelSnapshot from_yaml( const std::string& text );
    static ModelSnapshot from_yaml( std::istream& in );

    const ordered_node& root() const { return root_; }

    // Node at 'path', or nullptr. The pointer is valid for the lifetime of
    // this snapshot.
    const ordered_node* find( const std::string& path ) const;
    bool contains( const std::string& path ) const;

    // Text form of the scalar at 'path'; std::nullopt if absent or if the
    // node is not a scalar
    std::optional< std::string > text( const std::string& path ) const;

    // Every scalar in the model, keyed by dotted path
    Bindings scalar_bindings() const;

    // Evaluate a boolean condition. Throws ConditionError.
    bool evaluate( const std::string& condition ) const;

    // Evaluate an operand/expression and return its text form (used to
    // select Switch alternatives). Throws ConditionError.
    std::string evaluate_text( const std::string& expression ) const;

  private:
    ordered_node root_;
  };

namespace internal {

  // Recursive-descent evaluator for marker conditions:
  //   expr    := and ( '||' and )*
  //   and     := unary ( '&&' unary )*
  //   unary   := '!' unary | '(' expr ')' | compare
  //   compare := operand ( ( '==' | '!=' ) operand )?
  //   operand := path | 'text' | "text" | number | true | false | null
  class ConditionParser {
  public:
    inline ConditionParser( const std::string& text, const ModelSnapshot& model )
      : text_( text ), model_( model ) {}

    bool parse_condition();
    std::string parse_value();

  private:
    struct Operand {
      std::string text;
      bool truthy = false;
      bool numeric = false;
      double number = 0.0;
    };

    const std::string& text_;
    const ModelSnapshot& model_;
    size_t pos_ = 0;

    void skip_ws();
    bool eat( const std::string& tok );
    bool at_end();
    bool parse_or();
    bool parse_and();
    bool parse_unary();
    bool parse_compare();
    Operand parse_operand();
    static bool equal( const Operand& a, const Operand& b );
    [[noreturn]] void fail( const std::string& msg ) const;
  };

} // namespace regen::internal

} // namespace regen

// ModelSnapshot member function definitions

inline regen::ModelSnapshot regen::ModelSnapshot::from_yaml(
  const std::string& text )
{
  if ( text.find_first_not_of(" \t\r\n") == std::string::npos ) {
    return ModelSnapshot();
  }
  ordered_node root = ordered_node::deserialize( text );
  if ( root.is_null() ) root = ordered_node::mapping();
  return ModelSnapshot( std::move(root) );
}

inline regen::ModelSnapshot regen::ModelSnapshot::from_yaml(
  std::istream& in )
{
  std::ostringstream ss;
  ss << in.rdbuf();
  return from_yaml( ss.str() );
}

inline const regen::ordered_node* regen::ModelSnapshot::find(
  const std::string& path ) const
{
  if ( path.empty() ) return &root_;
  return internal::lookup_segments( root_, internal::split_segments(path), 0 );
}

inline bool regen::ModelSnapshot::contains( const std::string& path ) const {
  return find( path ) != nullptr;
}

inline std::optional< std::string > regen::ModelSnapshot::text(
  const std::string& path ) const
{
  const ordered_node* n = find( path );
  if ( !n || !internal::is_non_null_scalar(*n) ) return std::nullopt;
  return internal::to_string_any( *n );
}

inline regen::Bindings regen::ModelSnapshot::scalar_bindings() const {
  Bindings out;
  internal::flatten_scalars( root_, std::string(), out );
  return out;
}

inline bool regen::ModelSnapshot::evaluate(
  const std::string& condition ) const
{
  internal::ConditionParser parser( condition, *this );
  return parser.parse_condition();
}

inline std::string regen::ModelSnapshot::evaluate_text(
  const std::string& expression ) const
{
  internal::ConditionParser parser( expression, *this );
  return parser.parse_value();
}

// ConditionParser member function definitions

inline bool regen::internal::ConditionParser::parse_condition() {
  skip_ws();
  if ( at_end() ) fail( "empty condition" );
  bool v = parse_or();
  if ( !at_end() ) fail( "unexpected trailing input" );
  return v;
}

inline std::string regen::internal::ConditionParser::parse_value() {
  skip_ws();
  if ( at_end() ) fail( "empty expression" );
  Operand op = parse_operand();
  if ( !at_end() ) {
    // Not a lone operand: evaluate as a full condition instead
    pos_ = 0;
    return parse_condition() ? "true" : "false";
  }
  return op.text;
}

inline void regen::internal::ConditionParser::skip_ws() {
  while ( pos_ < text_.size()
    && std::isspace( static_cast< unsigned char >(text_[pos_]) ) ) ++pos_;
}

inline bool regen::internal::ConditionParser::at_end() {
  skip_ws();
  return pos_ >= text_.size();
}

inline bool regen::internal::ConditionParser::eat( const std::string& tok ) {
  skip_ws();
  if ( text_.compare( pos_, tok.size(), tok ) == 0 ) {
    pos_ += tok.size();
    return true;
  }
  return false;
}

inline bool regen::internal::ConditionParser::parse_or() {
  bool v = parse_and();
  while ( eat("||") ) {
    // Both sides are always parsed so that syntax errors are not hidden by
    // short-circuiting
    bool rhs = parse_and();
    v = v || rhs;
  }
  return v;
}

inline bool regen::internal::ConditionParser::parse_and() {
  bool v = parse_unary();
  while ( eat("&&") ) {
    bool rhs = parse_unary();
    v = v && rhs;
  }
  return v;
}

inline bool regen::internal::ConditionParser::parse_unary() {
  skip_ws();
  if ( text_.compare( pos_, 2, "!=" ) != 0 && eat("!") ) return !parse_unary();
  if ( eat("(") ) {
    bool v = parse_or();
    if ( !eat(")") ) fail( "expected ')'" );
    return v;
  }
  return parse_compare();
}

inline bool regen::internal::ConditionParser::parse_compare() {
  Operand lhs = parse_operand();
  if ( eat("==") ) return equal( lhs, parse_operand() );
  if ( eat("!=") ) return !equal( lhs, parse_operand() );
  return lhs.truthy;
}

inline regen::internal::ConditionParser::Operand
  regen::internal::ConditionParser::parse_operand()
{
  skip_ws();
  if ( pos_ >= text_.size() ) fail( "expected operand" );

  Operand op;
  const char c = text_[ pos_ ];

  // Quoted literal
  if ( c == '\'' || c == '"' ) {
    size_t end = text_.find( c, pos_ + 1 );
    if ( end == std::string::npos ) fail( "unterminated string literal" );
    op.text = text_.substr( pos_ + 1, end - pos_ - 1 );
    op.truthy = !op.text.empty();
    pos_ = end + 1;
    return op;
  }

  size_t start = pos_;
  while ( pos_ < text_.size() ) {
    const unsigned char ch = static_cast< unsigned char >( text_[pos_] );
    if ( std::isalnum(ch) || ch == '_' || ch == '.' || ch == '-' ) ++pos_;
    else break;
  }
  if ( pos_ == start ) fail( std::string("unexpected character '") + c + "'" );
  const std::string word = text_.substr( start, pos_ - start );

  if ( word == "true" || word == "false" ) {
    op.text = word;
    op.truthy = ( word == "true" );
    return op;
  }
  if ( word == "null" ) return op;

  // Numeric literal
  char* num_end = nullptr;
  const double num = std::strtod( word.c_str(), &num_end );
  if ( num_end && *num_end == '\0' && ( std::isdigit(
    static_cast< unsigned char >(word[0]) ) || word[0] == '-' ) )
  {
    op.text = word;
    op.numeric = true;
    op.number = num;
    op.truthy = ( num != 0.0 );
    return op;
  }

  // Model path
  const ordered_node* n = model_.find( word );
  if ( !n ) fail( "unknown model key '" + word + "'" );
  op.truthy = is_truthy( *n );
  if ( n->is_integer() || n->is_float_number() ) {
    op.numeric = true;
    op.number = n->is_integer()
      ? static_cast< double >( n->get_value< std::int64_t >() )
      : n->get_value< double >();
  }
  op.text = is_non_null_scalar( *n ) ? to_string_any( *n ) : std::string();
  return op;
}

inline bool regen::internal::ConditionParser::equal( const Operand& a,
  const Operand& b )
{
  if ( a.numeric && b.numeric ) return a.number == b.number;
  return a.text == b.text;
}

[[noreturn]] inline void regen::internal::ConditionParser::fail(
  const std::string& msg ) const
{
  std::ostringstream oss;
  oss << "condition '" << text_ << "' at offset " << pos_ << ": " << msg;
  throw ConditionError( oss.str() );
}
