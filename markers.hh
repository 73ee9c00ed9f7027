//  regen: guarded-region regeneration engine
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the regen authors
#pragma once

// Standard library includes
#include <cstddef>
#include <optional>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

#include "model.hh"
#include "profiles.hh"

namespace regen {

  using MarkerId = std::string;

  enum class MarkerKind { Guard, Generated, Conditional, Import, Template };

  enum class GenerationStrategy { Replace, Merge, IfEmpty, Append, Prepend };

  enum class ConditionalStrategy { Include, Exclude, Switch };

  enum class ImportType { Module, Dependency, Local, Namespace };

  enum class ImportMergeStrategy { KeepExisting, Replace, Merge, Interactive };

  enum class ParameterType { Any, String, Integer, Float, Boolean, List };

  // Where the text of a Generated marker comes from
  struct ContentSource {
    enum class Type { None, Static, Value, Template, Function };

    Type type = Type::None;
    std::string text;        // static text, template text, model path or
                             // function name depending on 'type'
    std::string join = ", "; // separator for Value sources over sequences
    ordered_node arguments;  // passed through to Function sources
  };

  struct Guard {
    MarkerId id;
    bool preserve_indent = true;
    std::optional< std::string > default_content;
  };

  struct Generated {
    MarkerId id;
    GenerationStrategy strategy = GenerationStrategy::Replace;
    std::vector< std::string > dependency_keys;
    ContentSource source;
  };

  struct Conditional {
    MarkerId id;
    std::string condition = "true";
    ConditionalStrategy strategy = ConditionalStrategy::Include;
    std::string body;
    // Switch alternatives in declaration order
    std::vector< std::pair< std::string, std::string > > alternatives;
    std::vector< std::string > dependency_keys; // in addition to condition paths
  };

  struct Import {
    MarkerId id;
    ImportType import_type = ImportType::Module;
    ImportMergeStrategy merge_strategy = ImportMergeStrategy::Merge;
    std::vector< std::string > required; // literal entries
    std::string source;                  // model path of more entries
    std::string format;                  // e.g. "import {item};" (optional)
    std::vector< std::string > dependency_keys;
  };

  struct TemplateParameter {
    std::string name;
    ParameterType type = ParameterType::Any;
    std::string from;                           // model path
    std::optional< std::string > default_value; // literal fallback
    bool required = true;
  };

  struct IterationSettings {
    std::string data_source;
    std::string item_var = "item";
    std::optional< std::string > index_var;
    std::string separator = "\n";
  };

  struct Template {
    MarkerId id;
    std::vector< TemplateParameter > parameters;
    std::optional< IterationSettings > iteration;
    std::string body;
    std::vector< std::string > dependency_keys;
  };

  // Closed set of marker kinds. Each alternative carries only its own
  // attributes.
  using MarkerType = std::variant< Guard, Generated, Conditional, Import,
    Template >;

  // Location of a Region in the source text. Offsets are byte offsets,
  // lines are 1-based; the span covers both delimiter lines.
  struct Span {
    std::size_t begin = 0;
    std::size_t end = 0;
    std::size_t start_line = 0;
    std::size_t end_line = 0;
  };

  struct Region {
    MarkerType marker;
    Span span;
    std::string start_delimiter; // full delimiter line incl. line ending
    std::string end_delimiter;
    std::string indent;          // leading whitespace of the start delimiter
    std::string raw_content;     // text between the delimiter lines
    bool is_modified = false;
    std::optional< std::string > baseline_content;
  };

  // A document is a sequence of verbatim text runs and managed regions
  struct Segment {
    enum class Type { Verbatim, Marker };

    Type type = Type::Verbatim;
    std::string text;       // Verbatim only
    std::size_t region = 0; // Marker only: index into ParsedDocument::regions
  };

  struct ParsedDocument {
    std::string file;
    const LanguageProfile* profile = nullptr;
    std::string line_ending = "\n";
    std::vector< Segment > segments;
    std::vector< Region > regions;

    Region* find( const MarkerId& id );
    const Region* find( const MarkerId& id ) const;
    std::vector< const Region* > regions_of( MarkerKind kind ) const;
  };

  class ParseError : public std::runtime_error {
  public:
    enum class Kind { UnbalancedMarker, DuplicateId, UnknownKind, NestedMarker };

    ParseError( Kind kind, std::size_t line, const std::string& msg )
      : std::runtime_error( msg ), kind_( kind ), line_( line ) {}

    Kind kind() const { return kind_; }
    std::size_t line() const { return line_; }

  private:
    Kind kind_;
    std::size_t line_;
  };

  enum class TokenEdge { Start, End };

  // Kind <-> keyword used in delimiter tokens
  const char* kind_name( MarkerKind kind );
  std::optional< MarkerKind > parse_kind( const std::string& keyword );
  const char* parse_error_name( ParseError::Kind kind );

  MarkerKind kind_of( const MarkerType& marker );
  const MarkerId& id_of( const MarkerType& marker );

  // Marker of the given kind with default attributes
  MarkerType default_marker( MarkerKind kind, const MarkerId& id );

  // Render a delimiter line (without indentation or line ending) in the
  // comment syntax of 'profile'. Line comments are preferred.
  std::string format_token( const LanguageProfile& profile, MarkerKind kind,
    const MarkerId& id, TokenEdge edge );

  class MarkerParser {
  public:
    // Scan 'text' into regions and verbatim runs. Throws ParseError; nothing
    // is returned for a malformed document.
    static ParsedDocument parse( const std::string& text,
      const LanguageProfile& profile, const std::string& file = std::string() );

    // Reassemble a document. Delimiter lines and verbatim text are written
    // back exactly as parsed.
    static std::string serialize( const ParsedDocument& doc );
  };

namespace internal {

  struct DelimiterToken {
    std::string kind;
    MarkerId id;
    TokenEdge edge = TokenEdge::Start;
    std::string indent;
  };

  inline std::size_t skip_blanks( const std::string& s, std::size_t pos ) {
    while ( pos < s.size() && (s[pos] == ' ' || s[pos] == '\t') ) ++pos;
    return pos;
  }

  inline bool only_blanks_from( const std::string& s, std::size_t pos ) {
    return skip_blanks( s, pos ) == s.size();
  }

  // Recognize "<kind:id:start>" / "<kind:id:end>" at 'pos'. On success
  // 'pos' is moved past the token.
  inline bool match_token_body( const std::string& s, std::size_t& pos,
    DelimiterToken& tok )
  {
    static const std::regex token_re(
      R"(^<([A-Za-z]+):([A-Za-z0-9_.\-]+):(start|end)>)" );
    std::smatch m;
    const std::string rest = s.substr( pos );
    if ( !std::regex_search(rest, m, token_re) ) return false;
    tok.kind = m[1].str();
    tok.id = m[2].str();
    tok.edge = ( m[3].str() == "start" ) ? TokenEdge::Start : TokenEdge::End;
    pos += static_cast< std::size_t >( m[0].length() );
    return true;
  }

  // Match a whole line (without its line ending) against the delimiter
  // grammar of 'profile'
  inline std::optional< DelimiterToken > match_delimiter_line(
    const std::string& line, const LanguageProfile& profile )
  {
    DelimiterToken tok;
    std::size_t pos = skip_blanks( line, 0 );
    tok.indent = line.substr( 0, pos );

    if ( profile.has_line_comments()
      && line.compare( pos, profile.line_prefix.size(),
        profile.line_prefix ) == 0 )
    {
      std::size_t p = skip_blanks( line, pos + profile.line_prefix.size() );
      if ( match_token_body(line, p, tok) && only_blanks_from(line, p) ) {
        return tok;
      }
    }

    if ( profile.has_block_comments()
      && line.compare( pos, profile.block_open.size(),
        profile.block_open ) == 0 )
    {
      std::size_t p = skip_blanks( line, pos + profile.block_open.size() );
      if ( match_token_body(line, p, tok) ) {
        p = skip_blanks( line, p );
        if ( line.compare( p, profile.block_close.size(),
          profile.block_close ) == 0
          && only_blanks_from(line, p + profile.block_close.size()) )
        {
          return tok;
        }
      }
    }
    return std::nullopt;
  }

  // Split into lines, each keeping its own line ending (the last line may
  // have none)
  inline std::vector< std::string > split_lines_keep_endings(
    const std::string& text )
  {
    std::vector< std::string > lines;
    std::size_t start = 0;
    while ( start < text.size() ) {
      std::size_t nl = text.find( '\n', start );
      if ( nl == std::string::npos ) {
        lines.push_back( text.substr(start) );
        break;
      }
      lines.push_back( text.substr(start, nl - start + 1) );
      start = nl + 1;
    }
    return lines;
  }

  inline std::string strip_line_ending( const std::string& line ) {
    std::size_t n = line.size();
    if ( n > 0 && line[n - 1] == '\n' ) --n;
    if ( n > 0 && line[n - 1] == '\r' ) --n;
    return line.substr( 0, n );
  }

  inline std::string detect_line_ending( const std::string& text ) {
    std::size_t nl = text.find( '\n' );
    if ( nl != std::string::npos && nl > 0 && text[nl - 1] == '\r' ) {
      return "\r\n";
    }
    return "\n";
  }

} // namespace regen::internal

} // namespace regen

// Free function definitions

inline const char* regen::kind_name( MarkerKind kind ) {
  switch ( kind ) {
    case MarkerKind::Guard: return "guard";
    case MarkerKind::Generated: return "generated";
    case MarkerKind::Conditional: return "conditional";
    case MarkerKind::Import: return "import";
    case MarkerKind::Template: return "template";
  }
  return "unknown";
}

inline std::optional< regen::MarkerKind > regen::parse_kind(
  const std::string& keyword )
{
  if ( keyword == "guard" ) return MarkerKind::Guard;
  if ( keyword == "generated" ) return MarkerKind::Generated;
  if ( keyword == "conditional" ) return MarkerKind::Conditional;
  if ( keyword == "import" ) return MarkerKind::Import;
  if ( keyword == "template" ) return MarkerKind::Template;
  return std::nullopt;
}

inline const char* regen::parse_error_name( ParseError::Kind kind ) {
  switch ( kind ) {
    case ParseError::Kind::UnbalancedMarker: return "UnbalancedMarker";
    case ParseError::Kind::DuplicateId: return "DuplicateId";
    case ParseError::Kind::UnknownKind: return "UnknownKind";
    case ParseError::Kind::NestedMarker: return "NestedMarker";
  }
  return "ParseError";
}

inline regen::MarkerKind regen::kind_of( const MarkerType& marker ) {
  return static_cast< MarkerKind >( marker.index() );
}

inline const regen::MarkerId& regen::id_of( const MarkerType& marker ) {
  return std::visit( []( const auto& m ) -> const MarkerId& { return m.id; },
    marker );
}

inline regen::MarkerType regen::default_marker( MarkerKind kind,
  const MarkerId& id )
{
  switch ( kind ) {
    case MarkerKind::Guard: { Guard m; m.id = id; return m; }
    case MarkerKind::Generated: { Generated m; m.id = id; return m; }
    case MarkerKind::Conditional: { Conditional m; m.id = id; return m; }
    case MarkerKind::Import: { Import m; m.id = id; return m; }
    case MarkerKind::Template: { Template m; m.id = id; return m; }
  }
  throw std::logic_error( "unhandled marker kind" );
}

inline std::string regen::format_token( const LanguageProfile& profile,
  MarkerKind kind, const MarkerId& id, TokenEdge edge )
{
  std::ostringstream tok;
  tok << '<' << kind_name( kind ) << ':' << id << ':'
    << ( edge == TokenEdge::Start ? "start" : "end" ) << '>';
  if ( profile.has_line_comments() ) {
    return profile.line_prefix + " " + tok.str();
  }
  return profile.block_open + " " + tok.str() + " " + profile.block_close;
}

// ParsedDocument member function definitions

inline regen::Region* regen::ParsedDocument::find( const MarkerId& id ) {
  for ( auto& r : regions ) {
    if ( id_of(r.marker) == id ) return &r;
  }
  return nullptr;
}

inline const regen::Region* regen::ParsedDocument::find(
  const MarkerId& id ) const
{
  for ( const auto& r : regions ) {
    if ( id_of(r.marker) == id ) return &r;
  }
  return nullptr;
}

inline std::vector< const regen::Region* > regen::ParsedDocument::regions_of(
  MarkerKind kind ) const
{
  std::vector< const Region* > out;
  for ( const auto& r : regions ) {
    if ( kind_of(r.marker) == kind ) out.push_back( &r );
  }
  return out;
}

// MarkerParser member function definitions

inline regen::ParsedDocument regen::MarkerParser::parse(
  const std::string& text, const LanguageProfile& profile,
  const std::string& file )
{
  ParsedDocument doc;
  doc.file = file;
  doc.profile = &profile;
  doc.line_ending = internal::detect_line_ending( text );

  // An opened region waiting for its end token. Nesting is rejected, so the
  // stack never holds more than one entry, but matching is still strictly
  // last-in first-out.
  struct Open {
    MarkerKind kind;
    MarkerId id;
    std::size_t line;
    std::size_t offset;
    std::size_t content_begin;
    std::string delimiter;
    std::string indent;
  };
  std::vector< Open > stack;
  std::unordered_set< MarkerId > seen_ids;

  std::string verbatim;
  std::size_t offset = 0;
  std::size_t line_no = 0;

  auto fail = [&]( ParseError::Kind kind, const std::string& msg ) {
    std::ostringstream oss;
    if ( !file.empty() ) oss << file << ':';
    oss << line_no << ": " << msg;
    throw ParseError( kind, line_no, oss.str() );
  };

  for ( const std::string& line : internal::split_lines_keep_endings(text) ) {
    ++line_no;
    const std::size_t line_offset = offset;
    offset += line.size();

    auto tok = internal::match_delimiter_line(
      internal::strip_line_ending(line), profile );
    if ( !tok ) {
      if ( stack.empty() ) verbatim += line;
      continue;
    }

    auto kind = parse_kind( tok->kind );
    if ( !kind ) {
      fail( ParseError::Kind::UnknownKind, "unknown marker kind '"
        + tok->kind + "' for id '" + tok->id + "'" );
    }

    if ( tok->edge == TokenEdge::Start ) {
      if ( !stack.empty() ) {
        std::ostringstream msg;
        msg << "marker '" << tok->id << "' starts inside marker '"
          << stack.back().id << "' opened at line " << stack.back().line
          << "; nested markers are not supported";
        fail( ParseError::Kind::NestedMarker, msg.str() );
      }
      if ( !seen_ids.insert(tok->id).second ) {
        fail( ParseError::Kind::DuplicateId, "duplicate marker id '"
          + tok->id + "'" );
      }
      stack.push_back( Open{ *kind, tok->id, line_no, line_offset, offset,
        line, tok->indent } );
      continue;
    }

    // End token: must close the most recently opened region
    if ( stack.empty() ) {
      fail( ParseError::Kind::UnbalancedMarker, "end of marker '" + tok->id
        + "' without a matching start" );
    }
    const Open open = stack.back();
    if ( open.id != tok->id || open.kind != *kind ) {
      std::ostringstream msg;
      msg << "end of marker '" << tok->kind << ':' << tok->id
        << "' does not match open marker '" << kind_name( open.kind ) << ':'
        << open.id << "' from line " << open.line;
      fail( ParseError::Kind::UnbalancedMarker, msg.str() );
    }
    stack.pop_back();

    if ( !verbatim.empty() ) {
      Segment seg;
      seg.type = Segment::Type::Verbatim;
      seg.text = std::move( verbatim );
      doc.segments.push_back( std::move(seg) );
      verbatim.clear();
    }

    Region region;
    region.marker = default_marker( open.kind, open.id );
    region.span.begin = open.offset;
    region.span.end = offset;
    region.span.start_line = open.line;
    region.span.end_line = line_no;
    region.start_delimiter = open.delimiter;
    region.end_delimiter = line;
    region.indent = open.indent;
    region.raw_content = text.substr( open.content_begin,
      line_offset - open.content_begin );

    Segment seg;
    seg.type = Segment::Type::Marker;
    seg.region = doc.regions.size();
    doc.segments.push_back( seg );
    doc.regions.push_back( std::move(region) );
  }

  if ( !stack.empty() ) {
    std::ostringstream msg;
    msg << "marker '" << kind_name( stack.back().kind ) << ':'
      << stack.back().id << "' opened at line " << stack.back().line
      << " is never closed";
    line_no = stack.back().line;
    fail( ParseError::Kind::UnbalancedMarker, msg.str() );
  }

  if ( !verbatim.empty() ) {
    Segment seg;
    seg.type = Segment::Type::Verbatim;
    seg.text = std::move( verbatim );
    doc.segments.push_back( std::move(seg) );
  }

  spdlog::debug( "parsed {}: {} region(s), {} segment(s)",
    file.empty() ? "<text>" : file, doc.regions.size(), doc.segments.size() );
  return doc;
}

inline std::string regen::MarkerParser::serialize( const ParsedDocument& doc ) {
  std::string out;
  for ( const auto& seg : doc.segments ) {
    if ( seg.type == Segment::Type::Verbatim ) {
      out += seg.text;
      continue;
    }
    const Region& r = doc.regions.at( seg.region );
    out += r.start_delimiter;
    out += r.raw_content;
    out += r.end_delimiter;
  }
  return out;
}
