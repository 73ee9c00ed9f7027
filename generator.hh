//  regen: guarded-region regeneration engine
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the regen authors
#pragma once

// Standard library includes
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdlib>
#include <functional>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

#include <spdlog/spdlog.h>

#include "markers.hh"
#include "model.hh"

namespace regen {

  class GenerationError : public std::runtime_error {
  public:
    enum class Kind {
      MissingParameter,
      MissingDataSource,
      UnevaluableCondition,
      MissingContentSource,
      FunctionFailed,
      UnknownFunction,
      DelimiterInContent
    };

    GenerationError( Kind kind, const std::string& msg )
      : std::runtime_error( msg ), kind_( kind ) {}

    Kind kind() const { return kind_; }

  private:
    Kind kind_;
  };

  const char* generation_error_name( GenerationError::Kind kind );

  // Literal text substitution. Implementations replace "{name}" placeholders
  // found in 'bindings', leave unknown placeholders untouched and keep
  // doubled delimiters ("{{", "}}") doubled.
  class TemplateRenderer {
  public:
    virtual ~TemplateRenderer() = default;
    virtual std::string render( const std::string& text,
      const Bindings& bindings ) const = 0;
  };

  class PlaceholderRenderer : public TemplateRenderer {
  public:
    std::string render( const std::string& text,
      const Bindings& bindings ) const override
    {
      return internal::protected_bind( text, bindings );
    }
  };

  // What a user generator function gets to look at
  struct FunctionContext {
    const MarkerId& id;
    const ordered_node& arguments;
    const std::string& existing;
    const ModelSnapshot& model;
  };

  using GeneratorFunction = std::function< std::string(
    const FunctionContext& ) >;

  // Named generator functions for Generated markers. Functions must be pure:
  // they may be called from several file tasks at once.
  class FunctionRegistry {
  public:
    void add( const std::string& name, GeneratorFunction fn );
    bool contains( const std::string& name ) const;
    const GeneratorFunction* find( const std::string& name ) const;
    std::vector< std::string > names() const;

  private:
    std::map< std::string, GeneratorFunction > functions_;
  };

  // Computes fresh content for one non-Guard marker. Bodies are handled
  // as '\n'-separated lines without indentation; the Rewriter takes care of
  // line endings and the marker column.
  class ContentGenerator {
  public:
    // Without a renderer a PlaceholderRenderer is used
    explicit ContentGenerator( const TemplateRenderer* renderer = nullptr,
      const FunctionRegistry* functions = nullptr );

    ContentGenerator( const ContentGenerator& ) = delete;
    ContentGenerator& operator=( const ContentGenerator& ) = delete;

    // Throws GenerationError
    std::string generate( const MarkerType& marker,
      const std::string& existing, const ModelSnapshot& model ) const;

    // Number of generate() calls so far
    std::size_t invocations() const { return invocations_.load(); }

  private:
    PlaceholderRenderer default_renderer_;
    const TemplateRenderer* renderer_;
    const FunctionRegistry* functions_;
    mutable std::atomic< std::size_t > invocations_{ 0 };

    std::string generate_generated( const Generated& m,
      const std::string& existing, const ModelSnapshot& model ) const;
    std::string generate_conditional( const Conditional& m,
      const ModelSnapshot& model ) const;
    std::string generate_import( const Import& m,
      const std::string& existing, const ModelSnapshot& model ) const;
    std::string generate_template( const Template& m,
      const ModelSnapshot& model ) const;

    std::string source_text( const Generated& m, const std::string& existing,
      const ModelSnapshot& model ) const;

    // Render with model bindings and fail on leftover placeholders
    std::string render_strict( const MarkerId& id, const std::string& text,
      const Bindings& bindings ) const;
  };

namespace internal {

  // Split text into lines without terminators. A trailing line ending does
  // not produce an empty last line.
  inline std::vector< std::string > split_lines( const std::string& text ) {
    std::vector< std::string > lines;
    std::size_t start = 0;
    while ( start < text.size() ) {
      std::size_t nl = text.find( '\n', start );
      std::size_t stop = ( nl == std::string::npos ) ? text.size() : nl;
      std::string line = text.substr( start, stop - start );
      if ( !line.empty() && line.back() == '\r' ) line.pop_back();
      lines.push_back( std::move(line) );
      if ( nl == std::string::npos ) break;
      start = nl + 1;
    }
    return lines;
  }

  inline std::string join_lines( const std::vector< std::string >& lines ) {
    std::string out;
    for ( std::size_t i = 0; i < lines.size(); ++i ) {
      if ( i > 0 ) out += '\n';
      out += lines[ i ];
    }
    return out;
  }

  inline std::string trim( const std::string& s ) {
    const char* ws = " \t\r\n";
    std::size_t b = s.find_first_not_of( ws );
    if ( b == std::string::npos ) return std::string();
    std::size_t e = s.find_last_not_of( ws );
    return s.substr( b, e - b + 1 );
  }

  inline bool is_blank( const std::string& s ) {
    return s.find_first_not_of( " \t\r\n" ) == std::string::npos;
  }

  inline std::string rtrim( const std::string& s ) {
    std::size_t e = s.find_last_not_of( " \t\r" );
    return ( e == std::string::npos ) ? std::string() : s.substr( 0, e + 1 );
  }

  // Lines of 'text' without surrounding blank lines
  inline std::vector< std::string > content_lines( const std::string& text ) {
    std::vector< std::string > lines = split_lines( text );
    while ( !lines.empty() && is_blank(lines.back()) ) lines.pop_back();
    std::size_t first = 0;
    while ( first < lines.size() && is_blank(lines[first]) ) ++first;
    lines.erase( lines.begin(), lines.begin() + first );
    return lines;
  }

  inline bool ends_with_lines( const std::vector< std::string >& body,
    const std::vector< std::string >& tail )
  {
    if ( tail.size() > body.size() ) return false;
    const std::size_t off = body.size() - tail.size();
    for ( std::size_t i = 0; i < tail.size(); ++i ) {
      if ( rtrim(body[off + i]) != rtrim(tail[i]) ) return false;
    }
    return true;
  }

  inline bool starts_with_lines( const std::vector< std::string >& body,
    const std::vector< std::string >& head )
  {
    if ( head.size() > body.size() ) return false;
    for ( std::size_t i = 0; i < head.size(); ++i ) {
      if ( rtrim(body[i]) != rtrim(head[i]) ) return false;
    }
    return true;
  }

  // Import entries of a body: trimmed, non-blank lines
  inline std::vector< std::string > import_entries( const std::string& body ) {
    std::vector< std::string > out;
    for ( const auto& line : split_lines(body) ) {
      const std::string t = trim( line );
      if ( !t.empty() ) out.push_back( t );
    }
    return out;
  }

  inline bool parse_integer( const std::string& s ) {
    if ( s.empty() ) return false;
    char* end = nullptr;
    std::strtoll( s.c_str(), &end, 10 );
    return end && *end == '\0';
  }

  inline bool parse_float( const std::string& s ) {
    if ( s.empty() ) return false;
    char* end = nullptr;
    std::strtod( s.c_str(), &end );
    return end && *end == '\0';
  }

} // namespace regen::internal

} // namespace regen

inline const char* regen::generation_error_name( GenerationError::Kind kind ) {
  switch ( kind ) {
    case GenerationError::Kind::MissingParameter: return "MissingParameter";
    case GenerationError::Kind::MissingDataSource: return "MissingDataSource";
    case GenerationError::Kind::UnevaluableCondition:
      return "UnevaluableCondition";
    case GenerationError::Kind::MissingContentSource:
      return "MissingContentSource";
    case GenerationError::Kind::FunctionFailed: return "FunctionFailed";
    case GenerationError::Kind::UnknownFunction: return "UnknownFunction";
    case GenerationError::Kind::DelimiterInContent: return "DelimiterInContent";
  }
  return "GenerationError";
}

// FunctionRegistry member function definitions

inline void regen::FunctionRegistry::add( const std::string& name,
  GeneratorFunction fn )
{
  if ( name.empty() ) {
    throw std::invalid_argument( "generator function name must not be empty" );
  }
  if ( !fn ) {
    throw std::invalid_argument( "generator function '" + name
      + "' has no target" );
  }
  functions_[ name ] = std::move( fn );
}

inline bool regen::FunctionRegistry::contains( const std::string& name ) const {
  return functions_.count( name ) > 0;
}

inline const regen::GeneratorFunction* regen::FunctionRegistry::find(
  const std::string& name ) const
{
  auto it = functions_.find( name );
  return ( it == functions_.end() ) ? nullptr : &it->second;
}

inline std::vector< std::string > regen::FunctionRegistry::names() const {
  std::vector< std::string > out;
  for ( const auto& kv : functions_ ) out.push_back( kv.first );
  return out;
}

// ContentGenerator member function definitions

inline regen::ContentGenerator::ContentGenerator(
  const TemplateRenderer* renderer, const FunctionRegistry* functions )
  : renderer_( renderer ? renderer : &default_renderer_ ),
  functions_( functions ) {}

inline std::string regen::ContentGenerator::generate( const MarkerType& marker,
  const std::string& existing, const ModelSnapshot& model ) const
{
  ++invocations_;
  spdlog::debug( "generating {} marker '{}'", kind_name( kind_of(marker) ),
    id_of( marker ) );

  switch ( kind_of(marker) ) {
    case MarkerKind::Generated:
      return generate_generated( std::get< Generated >(marker), existing,
        model );
    case MarkerKind::Conditional:
      return generate_conditional( std::get< Conditional >(marker), model );
    case MarkerKind::Import:
      return generate_import( std::get< Import >(marker), existing, model );
    case MarkerKind::Template:
      return generate_template( std::get< Template >(marker), model );
    case MarkerKind::Guard:
      break;
  }
  throw std::logic_error( "guard marker '" + id_of(marker)
    + "' passed to the content generator" );
}

inline std::string regen::ContentGenerator::render_strict( const MarkerId& id,
  const std::string& text, const Bindings& bindings ) const
{
  const std::string rendered = renderer_->render( text, bindings );
  const auto missing = internal::unresolved_placeholders( rendered );
  if ( !missing.empty() ) {
    std::ostringstream oss;
    oss << "marker '" << id << "': no value for placeholder";
    if ( missing.size() > 1 ) oss << 's';
    for ( std::size_t i = 0; i < missing.size(); ++i ) {
      oss << ( i == 0 ? " " : ", " ) << '{' << missing[i] << '}';
    }
    throw GenerationError( GenerationError::Kind::MissingParameter, oss.str() );
  }
  return internal::unescape_placeholders( rendered );
}

inline std::string regen::ContentGenerator::source_text( const Generated& m,
  const std::string& existing, const ModelSnapshot& model ) const
{
  const ContentSource& src = m.source;
  switch ( src.type ) {

    case ContentSource::Type::Static:
      return src.text;

    case ContentSource::Type::Value: {
      const ordered_node* n = model.find( src.text );
      if ( !n ) {
        throw GenerationError( GenerationError::Kind::MissingDataSource,
          "marker '" + m.id + "': model has no value at '" + src.text + "'" );
      }
      if ( n->is_mapping() ) {
        throw GenerationError( GenerationError::Kind::MissingDataSource,
          "marker '" + m.id + "': '" + src.text
          + "' is a mapping, expected a scalar or a sequence" );
      }
      if ( n->is_sequence() ) {
        const auto items = internal::to_string_list( *n );
        std::string out;
        for ( std::size_t i = 0; i < items.size(); ++i ) {
          if ( i > 0 ) out += src.join;
          out += items[ i ];
        }
        return out;
      }
      return internal::to_string_any( *n );
    }

    case ContentSource::Type::Template:
      return render_strict( m.id, src.text, model.scalar_bindings() );

    case ContentSource::Type::Function: {
      const GeneratorFunction* fn = functions_ ? functions_->find( src.text )
        : nullptr;
      if ( !fn ) {
        throw GenerationError( GenerationError::Kind::UnknownFunction,
          "marker '" + m.id + "': no generator function named '" + src.text
          + "'" );
      }
      try {
        return (*fn)( FunctionContext{ m.id, src.arguments, existing, model } );
      }
      catch ( const GenerationError& ) {
        throw;
      }
      catch ( const std::exception& ex ) {
        throw GenerationError( GenerationError::Kind::FunctionFailed,
          "marker '" + m.id + "': function '" + src.text + "' failed: "
          + ex.what() );
      }
    }

    case ContentSource::Type::None:
      break;
  }
  throw GenerationError( GenerationError::Kind::MissingContentSource,
    "marker '" + m.id + "' has no content source (text, value, template or"
    " function)" );
}

inline std::string regen::ContentGenerator::generate_generated(
  const Generated& m, const std::string& existing,
  const ModelSnapshot& model ) const
{
  // IfEmpty never needs the source when there is something to keep
  if ( m.strategy == GenerationStrategy::IfEmpty
    && !internal::is_blank(existing) )
  {
    return existing;
  }

  const std::string fresh = source_text( m, existing, model );
  const auto fresh_lines = internal::content_lines( fresh );
  const auto old_lines = internal::content_lines( existing );

  switch ( m.strategy ) {
    case GenerationStrategy::Replace:
    case GenerationStrategy::IfEmpty:
      return fresh;

    case GenerationStrategy::Merge: {
      std::vector< std::string > merged;
      std::unordered_set< std::string > seen;
      for ( const auto& line : old_lines ) {
        if ( internal::is_blank(line) ) {
          merged.push_back( line );
          continue;
        }
        if ( seen.insert(internal::rtrim(line)).second ) merged.push_back( line );
      }
      for ( const auto& line : fresh_lines ) {
        if ( internal::is_blank(line) ) continue;
        if ( seen.insert(internal::rtrim(line)).second ) merged.push_back( line );
      }
      return internal::join_lines( merged );
    }

    case GenerationStrategy::Append: {
      if ( old_lines.empty() ) return fresh;
      if ( fresh_lines.empty()
        || internal::ends_with_lines(old_lines, fresh_lines) )
      {
        return internal::join_lines( old_lines );
      }
      std::vector< std::string > out = old_lines;
      out.insert( out.end(), fresh_lines.begin(), fresh_lines.end() );
      return internal::join_lines( out );
    }

    case GenerationStrategy::Prepend: {
      if ( old_lines.empty() ) return fresh;
      if ( fresh_lines.empty()
        || internal::starts_with_lines(old_lines, fresh_lines) )
      {
        return internal::join_lines( old_lines );
      }
      std::vector< std::string > out = fresh_lines;
      out.insert( out.end(), old_lines.begin(), old_lines.end() );
      return internal::join_lines( out );
    }
  }
  return fresh;
}

inline std::string regen::ContentGenerator::generate_conditional(
  const Conditional& m, const ModelSnapshot& model ) const
{
  const Bindings bindings = model.scalar_bindings();
  auto render = [&]( const std::string& body ) {
    return internal::unescape_placeholders( renderer_->render(body, bindings) );
  };

  try {
    if ( m.strategy == ConditionalStrategy::Switch ) {
      const std::string value = model.evaluate_text( m.condition );
      const std::string* fallback = nullptr;
      for ( const auto& [name, body] : m.alternatives ) {
        if ( name == value ) return render( body );
        if ( name == "default" ) fallback = &body;
      }
      if ( fallback ) return render( *fallback );
      throw GenerationError( GenerationError::Kind::UnevaluableCondition,
        "marker '" + m.id + "': no alternative for value '" + value
        + "' and no 'default'" );
    }

    const bool value = model.evaluate( m.condition );
    const bool emit = ( m.strategy == ConditionalStrategy::Include ) ? value
      : !value;
    return emit ? render( m.body ) : std::string();
  }
  catch ( const ConditionError& err ) {
    throw GenerationError( GenerationError::Kind::UnevaluableCondition,
      "marker '" + m.id + "': " + err.what() );
  }
}

inline std::string regen::ContentGenerator::generate_import( const Import& m,
  const std::string& existing, const ModelSnapshot& model ) const
{
  std::vector< std::string > required = m.required;
  if ( !m.source.empty() ) {
    const ordered_node* n = model.find( m.source );
    if ( !n ) {
      throw GenerationError( GenerationError::Kind::MissingDataSource,
        "marker '" + m.id + "': model has no value at '" + m.source + "'" );
    }
    if ( n->is_mapping() ) {
      throw GenerationError( GenerationError::Kind::MissingDataSource,
        "marker '" + m.id + "': import source '" + m.source
        + "' must be a sequence or a scalar" );
    }
    for ( const auto& item : internal::to_string_list(*n) ) {
      required.push_back( item );
    }
  }

  // Requirements rendered into import lines
  std::vector< std::string > wanted;
  for ( const auto& item : required ) {
    std::string line = internal::trim( item );
    if ( line.empty() ) continue;
    if ( !m.format.empty() ) {
      line = internal::unescape_placeholders( renderer_->render( m.format,
        Bindings{ { "item", line } } ) );
    }
    wanted.push_back( line );
  }

  const auto manual = internal::import_entries( existing );
  std::vector< std::string > out;
  std::unordered_set< std::string > seen;
  auto add = [&]( const std::string& line ) {
    if ( seen.insert(line).second ) out.push_back( line );
  };

  switch ( m.merge_strategy ) {
    case ImportMergeStrategy::KeepExisting:
      for ( const auto& line : manual ) add( line );
      for ( const auto& line : wanted ) add( line );
      break;

    case ImportMergeStrategy::Replace:
      for ( const auto& line : wanted ) add( line );
      break;

    case ImportMergeStrategy::Merge:
    case ImportMergeStrategy::Interactive: {
      std::set< std::string > sorted( manual.begin(), manual.end() );
      sorted.insert( wanted.begin(), wanted.end() );
      out.assign( sorted.begin(), sorted.end() );
      break;
    }
  }
  return internal::join_lines( out );
}

inline std::string regen::ContentGenerator::generate_template(
  const Template& m, const ModelSnapshot& model ) const
{
  Bindings bindings = model.scalar_bindings();

  for ( const auto& p : m.parameters ) {
    std::optional< std::string > value;
    if ( !p.from.empty() ) {
      if ( const ordered_node* n = model.find(p.from) ) {
        if ( n->is_sequence() ) {
          const auto items = internal::to_string_list( *n );
          std::string joined;
          for ( std::size_t i = 0; i < items.size(); ++i ) {
            if ( i > 0 ) joined += ", ";
            joined += items[ i ];
          }
          value = joined;
        }
        else if ( internal::is_non_null_scalar(*n) ) {
          value = internal::to_string_any( *n );
        }
      }
    }
    if ( !value && p.default_value ) value = p.default_value;
    if ( !value ) {
      if ( p.required ) {
        throw GenerationError( GenerationError::Kind::MissingParameter,
          "marker '" + m.id + "': required parameter '" + p.name
          + "' has no value" + ( p.from.empty() ? std::string()
            : " at '" + p.from + "'" ) );
      }
      value = std::string();
    }

    bool type_ok = true;
    if ( p.type == ParameterType::Integer ) {
      type_ok = internal::parse_integer( *value );
    }
    else if ( p.type == ParameterType::Float ) {
      type_ok = internal::parse_float( *value );
    }
    else if ( p.type == ParameterType::Boolean ) {
      type_ok = ( *value == "true" || *value == "false" );
    }
    if ( !type_ok && !( value->empty() && !p.required ) ) {
      throw GenerationError( GenerationError::Kind::MissingParameter,
        "marker '" + m.id + "': parameter '" + p.name + "' value '" + *value
        + "' does not have the declared type" );
    }
    bindings[ p.name ] = *value;
  }

  if ( !m.iteration ) return render_strict( m.id, m.body, bindings );

  const IterationSettings& it = *m.iteration;
  const ordered_node* data = model.find( it.data_source );
  if ( !data ) {
    throw GenerationError( GenerationError::Kind::MissingDataSource,
      "marker '" + m.id + "': model has no data source '" + it.data_source
      + "'" );
  }
  if ( !data->is_sequence() ) {
    throw GenerationError( GenerationError::Kind::MissingDataSource,
      "marker '" + m.id + "': data source '" + it.data_source
      + "' is not a sequence" );
  }

  std::string out;
  for ( std::size_t i = 0; i < data->size(); ++i ) {
    const ordered_node& item = data->at( i );
    Bindings local = bindings;
    if ( item.is_mapping() || item.is_sequence() ) {
      internal::flatten_scalars( item, it.item_var, local );
    }
    else {
      local[ it.item_var ] = internal::to_string_any( item );
    }
    if ( it.index_var ) local[ *it.index_var ] = std::to_string( i );

    if ( i > 0 ) out += it.separator;
    out += render_strict( m.id, m.body, local );
  }
  return out;
}
