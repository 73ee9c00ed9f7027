//  regen: guarded-region regeneration engine
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the regen authors
#pragma once

// Standard library includes
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

#include "markers.hh"
#include "model.hh"

namespace regen {

  // Engine-wide settings read from the "settings" section
  struct Settings {
    std::size_t workers = 1;      // parallel file tasks, 1 = sequential
    bool indent_generated = true; // indent generated text to the marker column
  };

  class ManifestError : public std::runtime_error {
  public:
    explicit ManifestError( const std::string& msg )
      : std::runtime_error( msg ) {}
  };

  // Out-of-band marker attributes. Entries under "markers" apply to every
  // file; entries under "files.<path>.markers" are deep-merged over them.
  // A marker with no entry gets the defaults of its kind.
  class Manifest {
  public:
    inline Manifest()
      : markers_( ordered_node::mapping() ), files_( ordered_node::mapping() ) {}

    // Every entry is validated here, so a bad manifest fails before any file
    // is read. Throws ManifestError.
    static Manifest from_node( const ordered_node& root );
    static Manifest from_yaml( const std::string& text );
    static Manifest from_yaml( std::istream& in );

    const Settings& settings() const { return settings_; }
    Settings& settings() { return settings_; }

    // Merged attribute mapping for one marker (null node if none)
    ordered_node entry_for( const std::string& file, const MarkerId& id ) const;

    // Typed marker for a delimiter of kind 'kind'. Throws ManifestError if
    // the entry names a different kind.
    MarkerType marker_for( const std::string& file, MarkerKind kind,
      const MarkerId& id ) const;

    // Attach attributes to every Region of a parsed document
    void apply( ParsedDocument& doc ) const;

    // Paths listed under "files"
    std::vector< std::string > files() const;

  private:
    Settings settings_;
    ordered_node markers_;
    ordered_node files_;
  };

namespace internal {

  // Manifest keys
  inline const std::string SETTINGS = "settings";
  inline const std::string MARKERS = "markers";
  inline const std::string FILES = "files";
  inline const std::string WORKERS = "workers";
  inline const std::string INDENT_GENERATED = "indent_generated";
  inline const std::string KIND = "kind";
  inline const std::string DEPENDS_ON = "depends_on";
  inline const std::string PRESERVE_INDENT = "preserve_indent";
  inline const std::string DEFAULT = "default";
  inline const std::string STRATEGY = "strategy";
  inline const std::string TEXT = "text";
  inline const std::string VALUE = "value";
  inline const std::string JOIN = "join";
  inline const std::string TEMPLATE = "template";
  inline const std::string FUNCTION = "function";
  inline const std::string ARGS = "args";
  inline const std::string CONDITION = "condition";
  inline const std::string BODY = "body";
  inline const std::string ALTERNATIVES = "alternatives";
  inline const std::string IMPORT_TYPE = "import_type";
  inline const std::string MERGE = "merge";
  inline const std::string REQUIRED = "required";
  inline const std::string SOURCE = "source";
  inline const std::string FORMAT = "format";
  inline const std::string PARAMETERS = "parameters";
  inline const std::string NAME = "name";
  inline const std::string TYPE = "type";
  inline const std::string FROM = "from";
  inline const std::string ITERATION = "iteration";
  inline const std::string DATA_SOURCE = "data_source";
  inline const std::string ITEM_VAR = "item_var";
  inline const std::string INDEX_VAR = "index_var";
  inline const std::string SEPARATOR = "separator";

  // Builds typed markers from attribute mappings, reporting the offending
  // manifest location on failure
  class MarkerReader {
  public:
    inline MarkerReader( const std::string& where, const ordered_node& entry )
      : where_( where ), entry_( entry ) {}

    MarkerType read( MarkerKind kind, const MarkerId& id ) const;

    [[noreturn]] void fail( const std::string& msg,
      const std::string& key = std::string() ) const;

  private:
    const std::string& where_;
    const ordered_node& entry_;

    void check_keys( const std::unordered_set< std::string >& allowed ) const;
    bool has( const std::string& key ) const;
    std::string text( const std::string& key ) const;
    std::string text_of( const ordered_node& n, const std::string& key ) const;
    bool flag( const std::string& key ) const;
    std::vector< std::string > text_list( const std::string& key ) const;

    Guard read_guard( const MarkerId& id ) const;
    Generated read_generated( const MarkerId& id ) const;
    Conditional read_conditional( const MarkerId& id ) const;
    Import read_import( const MarkerId& id ) const;
    Template read_template( const MarkerId& id ) const;
    TemplateParameter read_parameter( const ordered_node& n,
      const std::string& fallback_name ) const;
  };

  inline GenerationStrategy parse_generation_strategy( const std::string& s,
    bool& ok )
  {
    ok = true;
    if ( s == "replace" ) return GenerationStrategy::Replace;
    if ( s == "merge" ) return GenerationStrategy::Merge;
    if ( s == "if_empty" ) return GenerationStrategy::IfEmpty;
    if ( s == "append" ) return GenerationStrategy::Append;
    if ( s == "prepend" ) return GenerationStrategy::Prepend;
    ok = false;
    return GenerationStrategy::Replace;
  }

  inline ConditionalStrategy parse_conditional_strategy( const std::string& s,
    bool& ok )
  {
    ok = true;
    if ( s == "include" ) return ConditionalStrategy::Include;
    if ( s == "exclude" ) return ConditionalStrategy::Exclude;
    if ( s == "switch" ) return ConditionalStrategy::Switch;
    ok = false;
    return ConditionalStrategy::Include;
  }

  inline ImportType parse_import_type( const std::string& s, bool& ok ) {
    ok = true;
    if ( s == "module" ) return ImportType::Module;
    if ( s == "dependency" ) return ImportType::Dependency;
    if ( s == "local" ) return ImportType::Local;
    if ( s == "namespace" ) return ImportType::Namespace;
    ok = false;
    return ImportType::Module;
  }

  inline ImportMergeStrategy parse_import_merge( const std::string& s,
    bool& ok )
  {
    ok = true;
    if ( s == "keep_existing" ) return ImportMergeStrategy::KeepExisting;
    if ( s == "replace" ) return ImportMergeStrategy::Replace;
    if ( s == "merge" ) return ImportMergeStrategy::Merge;
    if ( s == "interactive" ) return ImportMergeStrategy::Interactive;
    ok = false;
    return ImportMergeStrategy::Merge;
  }

  inline ParameterType parse_parameter_type( const std::string& s, bool& ok ) {
    ok = true;
    if ( s == "any" ) return ParameterType::Any;
    if ( s == "string" ) return ParameterType::String;
    if ( s == "integer" ) return ParameterType::Integer;
    if ( s == "float" ) return ParameterType::Float;
    if ( s == "boolean" ) return ParameterType::Boolean;
    if ( s == "list" ) return ParameterType::List;
    ok = false;
    return ParameterType::Any;
  }

} // namespace regen::internal

} // namespace regen

// Manifest member function definitions

inline regen::Manifest regen::Manifest::from_node( const ordered_node& root ) {
  using namespace internal;

  Manifest manifest;
  if ( root.is_null() ) return manifest;
  if ( !root.is_mapping() ) {
    throw ManifestError( "manifest: top level must be a mapping" );
  }

  for ( const auto& [mk, mv] : root.map_items() ) {
    const std::string k = to_string_any( mk );
    if ( k != SETTINGS && k != MARKERS && k != FILES ) {
      throw ManifestError( "manifest: unknown top-level key '" + k + "'" );
    }
  }

  if ( root.contains(SETTINGS) && !root.at(SETTINGS).is_null() ) {
    const ordered_node& s = root.at( SETTINGS );
    if ( !s.is_mapping() ) {
      throw ManifestError( "manifest: 'settings' must be a mapping" );
    }
    for ( const auto& [sk, sv] : s.map_items() ) {
      const std::string k = to_string_any( sk );
      if ( k == WORKERS ) {
        if ( !sv.is_integer() || sv.get_value< std::int64_t >() < 1 ) {
          throw ManifestError( "manifest: settings.workers must be a positive"
            " integer" );
        }
        manifest.settings_.workers = static_cast< std::size_t >(
          sv.get_value< std::int64_t >() );
      }
      else if ( k == INDENT_GENERATED ) {
        if ( !sv.is_boolean() ) {
          throw ManifestError( "manifest: settings.indent_generated must be a"
            " boolean" );
        }
        manifest.settings_.indent_generated = sv.get_value< bool >();
      }
      else {
        throw ManifestError( "manifest: unknown setting '" + k + "'" );
      }
    }
  }

  if ( root.contains(MARKERS) && !root.at(MARKERS).is_null() ) {
    if ( !root.at(MARKERS).is_mapping() ) {
      throw ManifestError( "manifest: 'markers' must be a mapping" );
    }
    manifest.markers_ = root.at( MARKERS );
  }

  if ( root.contains(FILES) && !root.at(FILES).is_null() ) {
    const ordered_node& files = root.at( FILES );
    if ( !files.is_mapping() ) {
      throw ManifestError( "manifest: 'files' must be a mapping" );
    }
    for ( const auto& [fk, fv] : files.map_items() ) {
      const std::string file = to_string_any( fk );
      if ( fv.is_null() ) continue;
      if ( !fv.is_mapping() ) {
        throw ManifestError( "manifest: files." + file + " must be a mapping" );
      }
      for ( const auto& [ek, ev] : fv.map_items() ) {
        if ( to_string_any(ek) != MARKERS ) {
          throw ManifestError( "manifest: unknown key '" + to_string_any(ek)
            + "' under files." + file );
        }
        if ( !ev.is_null() && !ev.is_mapping() ) {
          throw ManifestError( "manifest: files." + file
            + ".markers must be a mapping" );
        }
      }
    }
    manifest.files_ = files;
  }

  // Validate every global entry and every per-file merged entry that
  // declares its kind
  auto validate = [&]( const std::string& file, const std::string& id ) {
    const ordered_node entry = manifest.entry_for( file, id );
    if ( entry.is_null() ) return;
    const std::string where = file.empty() ? MARKERS + '.' + id
      : FILES + '.' + file + '.' + MARKERS + '.' + id;
    MarkerReader reader( where, entry );
    if ( !entry.is_mapping() ) reader.fail( "entry must be a mapping" );
    if ( !entry.contains(KIND) ) return;
    auto kind = parse_kind( to_string_any(entry.at(KIND)) );
    if ( !kind ) {
      reader.fail( "unknown marker kind '" + to_string_any(entry.at(KIND))
        + "'", KIND );
    }
    reader.read( *kind, id );
  };

  for ( const auto& [mk, mv] : manifest.markers_.map_items() ) {
    validate( std::string(), to_string_any(mk) );
  }
  for ( const auto& [fk, fv] : manifest.files_.map_items() ) {
    if ( !fv.is_mapping() || !fv.contains(MARKERS) ) continue;
    const ordered_node& fm = fv.at( MARKERS );
    if ( !fm.is_mapping() ) continue;
    for ( const auto& [mk, mv] : fm.map_items() ) {
      validate( to_string_any(fk), to_string_any(mk) );
    }
  }

  return manifest;
}

inline regen::Manifest regen::Manifest::from_yaml( const std::string& text ) {
  if ( text.find_first_not_of(" \t\r\n") == std::string::npos ) {
    return Manifest();
  }
  return from_node( ordered_node::deserialize(text) );
}

inline regen::Manifest regen::Manifest::from_yaml( std::istream& in ) {
  std::ostringstream ss;
  ss << in.rdbuf();
  return from_yaml( ss.str() );
}

inline regen::ordered_node regen::Manifest::entry_for( const std::string& file,
  const MarkerId& id ) const
{
  using namespace internal;

  ordered_node entry;
  if ( markers_.is_mapping() && markers_.contains(id) ) {
    entry = markers_.at( id );
  }
  if ( !file.empty() && files_.is_mapping() && files_.contains(file) ) {
    const ordered_node& f = files_.at( file );
    if ( f.is_mapping() && f.contains(MARKERS) && f.at(MARKERS).is_mapping()
      && f.at(MARKERS).contains(id) )
    {
      const ordered_node& overlay = f.at( MARKERS ).at( id );
      entry = entry.is_null() ? overlay : deep_merge( entry, overlay );
    }
  }
  return entry;
}

inline regen::MarkerType regen::Manifest::marker_for( const std::string& file,
  MarkerKind kind, const MarkerId& id ) const
{
  const ordered_node entry = entry_for( file, id );
  if ( entry.is_null() ) return default_marker( kind, id );

  const std::string where = ( file.empty() ? std::string( "<any file>" ) : file )
    + ": marker '" + id + "'";
  internal::MarkerReader reader( where, entry );
  if ( !entry.is_mapping() ) reader.fail( "entry must be a mapping" );
  if ( entry.contains(internal::KIND) ) {
    const std::string declared = internal::to_string_any(
      entry.at(internal::KIND) );
    if ( declared != kind_name(kind) ) {
      reader.fail( "declared kind '" + declared + "' does not match the '"
        + kind_name( kind ) + "' delimiter in the file", internal::KIND );
    }
  }
  return reader.read( kind, id );
}

inline void regen::Manifest::apply( ParsedDocument& doc ) const {
  for ( auto& region : doc.regions ) {
    const MarkerId id = id_of( region.marker );
    region.marker = marker_for( doc.file, kind_of(region.marker), id );
  }
}

inline std::vector< std::string > regen::Manifest::files() const {
  std::vector< std::string > out;
  if ( !files_.is_mapping() ) return out;
  for ( const auto& [fk, fv] : files_.map_items() ) {
    out.push_back( internal::to_string_any(fk) );
  }
  return out;
}

// MarkerReader member function definitions

[[noreturn]] inline void regen::internal::MarkerReader::fail(
  const std::string& msg, const std::string& key ) const
{
  std::ostringstream oss;
  oss << "manifest: " << where_;
  if ( !key.empty() ) oss << '.' << key;
  oss << ": " << msg;
  throw ManifestError( oss.str() );
}

inline void regen::internal::MarkerReader::check_keys(
  const std::unordered_set< std::string >& allowed ) const
{
  for ( const auto& [mk, mv] : entry_.map_items() ) {
    const std::string k = to_string_any( mk );
    if ( k == KIND || k == DEPENDS_ON ) continue;
    if ( !allowed.count(k) ) fail( "unknown attribute '" + k + "'" );
  }
}

inline bool regen::internal::MarkerReader::has( const std::string& key ) const {
  return entry_.contains( key ) && !entry_.at( key ).is_null();
}

inline std::string regen::internal::MarkerReader::text_of(
  const ordered_node& n, const std::string& key ) const
{
  if ( !is_non_null_scalar(n) ) fail( "expected a scalar value", key );
  return to_string_any( n );
}

inline std::string regen::internal::MarkerReader::text(
  const std::string& key ) const
{
  return text_of( entry_.at(key), key );
}

inline bool regen::internal::MarkerReader::flag(
  const std::string& key ) const
{
  const ordered_node& n = entry_.at( key );
  if ( !n.is_boolean() ) fail( "expected a boolean", key );
  return n.get_value< bool >();
}

inline std::vector< std::string > regen::internal::MarkerReader::text_list(
  const std::string& key ) const
{
  const ordered_node& n = entry_.at( key );
  if ( n.is_null() ) return {};
  if ( n.is_sequence() ) {
    std::vector< std::string > out;
    for ( size_t i = 0; i < n.size(); ++i ) out.push_back( text_of(n.at(i), key) );
    return out;
  }
  return { text_of( n, key ) };
}

inline regen::MarkerType regen::internal::MarkerReader::read( MarkerKind kind,
  const MarkerId& id ) const
{
  switch ( kind ) {
    case MarkerKind::Guard: return read_guard( id );
    case MarkerKind::Generated: return read_generated( id );
    case MarkerKind::Conditional: return read_conditional( id );
    case MarkerKind::Import: return read_import( id );
    case MarkerKind::Template: return read_template( id );
  }
  fail( "unhandled marker kind" );
}

inline regen::Guard regen::internal::MarkerReader::read_guard(
  const MarkerId& id ) const
{
  check_keys( { PRESERVE_INDENT, DEFAULT } );
  if ( has(DEPENDS_ON) ) fail( "guard markers have no dependencies", DEPENDS_ON );
  Guard m;
  m.id = id;
  if ( has(PRESERVE_INDENT) ) m.preserve_indent = flag( PRESERVE_INDENT );
  if ( has(DEFAULT) ) m.default_content = text( DEFAULT );
  return m;
}

inline regen::Generated regen::internal::MarkerReader::read_generated(
  const MarkerId& id ) const
{
  check_keys( { STRATEGY, TEXT, VALUE, JOIN, TEMPLATE, FUNCTION, ARGS } );
  Generated m;
  m.id = id;
  if ( has(STRATEGY) ) {
    bool ok = false;
    m.strategy = parse_generation_strategy( text(STRATEGY), ok );
    if ( !ok ) {
      fail( "unknown generation strategy '" + text(STRATEGY) + "'", STRATEGY );
    }
  }
  if ( has(DEPENDS_ON) ) m.dependency_keys = text_list( DEPENDS_ON );

  int n_sources = 0;
  if ( has(TEXT) ) {
    ++n_sources;
    m.source.type = ContentSource::Type::Static;
    m.source.text = text( TEXT );
  }
  if ( has(VALUE) ) {
    ++n_sources;
    m.source.type = ContentSource::Type::Value;
    m.source.text = text( VALUE );
    if ( has(JOIN) ) m.source.join = text( JOIN );
  }
  else if ( has(JOIN) ) {
    fail( "'join' is only meaningful with 'value'", JOIN );
  }
  if ( has(TEMPLATE) ) {
    ++n_sources;
    m.source.type = ContentSource::Type::Template;
    m.source.text = text( TEMPLATE );
  }
  if ( has(FUNCTION) ) {
    ++n_sources;
    m.source.type = ContentSource::Type::Function;
    m.source.text = text( FUNCTION );
    if ( has(ARGS) ) m.source.arguments = entry_.at( ARGS );
  }
  else if ( has(ARGS) ) {
    fail( "'args' is only meaningful with 'function'", ARGS );
  }
  if ( n_sources > 1 ) {
    fail( "at most one of 'text', 'value', 'template' and 'function' may be"
      " given" );
  }
  return m;
}

inline regen::Conditional regen::internal::MarkerReader::read_conditional(
  const MarkerId& id ) const
{
  check_keys( { CONDITION, STRATEGY, BODY, ALTERNATIVES } );
  Conditional m;
  m.id = id;
  if ( has(CONDITION) ) m.condition = text( CONDITION );
  if ( has(STRATEGY) ) {
    bool ok = false;
    m.strategy = parse_conditional_strategy( text(STRATEGY), ok );
    if ( !ok ) {
      fail( "unknown conditional strategy '" + text(STRATEGY) + "'", STRATEGY );
    }
  }
  if ( has(BODY) ) m.body = text( BODY );
  if ( has(ALTERNATIVES) ) {
    const ordered_node& alts = entry_.at( ALTERNATIVES );
    if ( !alts.is_mapping() ) fail( "expected a mapping", ALTERNATIVES );
    for ( const auto& [ak, av] : alts.map_items() ) {
      m.alternatives.emplace_back( to_string_any(ak),
        av.is_null() ? std::string() : text_of(av, ALTERNATIVES) );
    }
  }
  if ( m.strategy == ConditionalStrategy::Switch && m.alternatives.empty() ) {
    fail( "switch strategy requires 'alternatives'" );
  }
  if ( has(DEPENDS_ON) ) m.dependency_keys = text_list( DEPENDS_ON );
  return m;
}

inline regen::Import regen::internal::MarkerReader::read_import(
  const MarkerId& id ) const
{
  check_keys( { IMPORT_TYPE, MERGE, REQUIRED, SOURCE, FORMAT } );
  Import m;
  m.id = id;
  bool ok = false;
  if ( has(IMPORT_TYPE) ) {
    m.import_type = parse_import_type( text(IMPORT_TYPE), ok );
    if ( !ok ) fail( "unknown import type '" + text(IMPORT_TYPE) + "'",
      IMPORT_TYPE );
  }
  if ( has(MERGE) ) {
    m.merge_strategy = parse_import_merge( text(MERGE), ok );
    if ( !ok ) fail( "unknown import merge strategy '" + text(MERGE) + "'",
      MERGE );
  }
  if ( has(REQUIRED) ) m.required = text_list( REQUIRED );
  if ( has(SOURCE) ) m.source = text( SOURCE );
  if ( has(FORMAT) ) m.format = text( FORMAT );
  if ( has(DEPENDS_ON) ) m.dependency_keys = text_list( DEPENDS_ON );
  return m;
}

inline regen::TemplateParameter regen::internal::MarkerReader::read_parameter(
  const ordered_node& n, const std::string& fallback_name ) const
{
  TemplateParameter p;
  p.name = fallback_name;
  if ( n.is_null() ) return p;

  // Shorthand "name: model.path"
  if ( is_non_null_scalar(n) ) {
    p.from = text_of( n, PARAMETERS );
    return p;
  }
  if ( !n.is_mapping() ) fail( "parameter must be a mapping", PARAMETERS );

  for ( const auto& [pk, pv] : n.map_items() ) {
    const std::string k = to_string_any( pk );
    if ( k != NAME && k != TYPE && k != FROM && k != DEFAULT && k != REQUIRED ) {
      fail( "unknown parameter attribute '" + k + "'", PARAMETERS );
    }
  }
  if ( n.contains(NAME) ) p.name = text_of( n.at(NAME), PARAMETERS );
  if ( p.name.empty() ) fail( "parameter without a name", PARAMETERS );
  if ( n.contains(TYPE) ) {
    bool ok = false;
    const std::string t = text_of( n.at(TYPE), PARAMETERS );
    p.type = parse_parameter_type( t, ok );
    if ( !ok ) fail( "unknown parameter type '" + t + "'", PARAMETERS );
  }
  if ( n.contains(FROM) ) p.from = text_of( n.at(FROM), PARAMETERS );
  if ( n.contains(DEFAULT) && !n.at(DEFAULT).is_null() ) {
    p.default_value = text_of( n.at(DEFAULT), PARAMETERS );
  }
  if ( n.contains(REQUIRED) ) {
    if ( !n.at(REQUIRED).is_boolean() ) {
      fail( "'required' must be a boolean", PARAMETERS );
    }
    p.required = n.at( REQUIRED ).get_value< bool >();
  }
  return p;
}

inline regen::Template regen::internal::MarkerReader::read_template(
  const MarkerId& id ) const
{
  check_keys( { BODY, PARAMETERS, ITERATION } );
  Template m;
  m.id = id;
  if ( has(BODY) ) m.body = text( BODY );

  if ( has(PARAMETERS) ) {
    const ordered_node& params = entry_.at( PARAMETERS );
    if ( params.is_mapping() ) {
      for ( const auto& [pk, pv] : params.map_items() ) {
        m.parameters.push_back( read_parameter(pv, to_string_any(pk)) );
      }
    }
    else if ( params.is_sequence() ) {
      for ( size_t i = 0; i < params.size(); ++i ) {
        m.parameters.push_back( read_parameter(params.at(i), std::string()) );
      }
    }
    else {
      fail( "expected a mapping or sequence", PARAMETERS );
    }
  }

  if ( has(ITERATION) ) {
    const ordered_node& it = entry_.at( ITERATION );
    if ( !it.is_mapping() ) fail( "expected a mapping", ITERATION );
    IterationSettings iter;
    for ( const auto& [ik, iv] : it.map_items() ) {
      const std::string k = to_string_any( ik );
      if ( k == DATA_SOURCE ) iter.data_source = text_of( iv, ITERATION );
      else if ( k == ITEM_VAR ) iter.item_var = text_of( iv, ITERATION );
      else if ( k == INDEX_VAR ) iter.index_var = text_of( iv, ITERATION );
      else if ( k == SEPARATOR ) {
        // An empty separator is written as "" and arrives as a string
        iter.separator = iv.is_null() ? std::string() : text_of( iv, ITERATION );
      }
      else fail( "unknown iteration attribute '" + k + "'", ITERATION );
    }
    if ( iter.data_source.empty() ) fail( "missing 'data_source'", ITERATION );
    if ( iter.item_var.empty() ) fail( "empty 'item_var'", ITERATION );
    m.iteration = iter;
  }

  if ( has(DEPENDS_ON) ) m.dependency_keys = text_list( DEPENDS_ON );
  return m;
}
