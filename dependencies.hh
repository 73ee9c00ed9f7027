//  regen: guarded-region regeneration engine
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the regen authors
#pragma once

// Standard library includes
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "markers.hh"
#include "model.hh"

namespace regen {

  // A marker in a specific file
  struct MarkerRef {
    std::string file;
    MarkerId id;

    bool operator<( const MarkerRef& o ) const {
      return std::tie( file, id ) < std::tie( o.file, o.id );
    }
    bool operator==( const MarkerRef& o ) const {
      return file == o.file && id == o.id;
    }
  };

  // Model keys a marker reads: explicit depends_on entries plus the paths
  // found in its condition, parameters, iteration source, import source and
  // placeholders. Guards have none.
  std::vector< std::string > dependency_keys_of( const MarkerType& marker );

  // Bidirectional index between model keys and markers. A changed key
  // affects a recorded key when they are equal or one is a dotted-path
  // ancestor of the other.
  class DependencyTracker {
  public:
    using Entries = std::vector< std::pair< MarkerId,
      std::vector< std::string > > >;

    void record( const std::string& file, const MarkerId& id,
      const std::vector< std::string >& keys );

    // Replace everything known about 'file'
    void record_file( const std::string& file, const Entries& entries );

    void forget( const std::string& file );

    std::set< MarkerRef > affected(
      const std::vector< std::string >& changed_keys ) const;
    std::set< MarkerId > affected_in( const std::string& file,
      const std::vector< std::string >& changed_keys ) const;

    std::vector< std::string > dependencies_of( const std::string& file,
      const MarkerId& id ) const;
    std::set< MarkerRef > dependents_of( const std::string& key ) const;

    bool knows( const std::string& file ) const;
    std::size_t marker_count() const { return by_marker_.size(); }
    std::size_t edge_count() const;

    // YAML form: a sequence of {key, file, marker} mappings
    ordered_node save() const;
    void load( const ordered_node& node );

  private:
    std::map< std::string, std::set< MarkerRef > > by_key_;
    std::map< MarkerRef, std::set< std::string > > by_marker_;

    void erase_marker( const MarkerRef& ref );
    void collect( const std::string& changed,
      std::set< MarkerRef >& out ) const;
  };

  // Last content the engine wrote into each non-Guard marker. Content is
  // held in memory; only digests are persisted, so a restored entry can
  // still detect divergence but cannot show the old text.
  class BaselineStore {
  public:
    std::optional< std::string > content( const std::string& file,
      const MarkerId& id ) const;
    bool has( const std::string& file, const MarkerId& id ) const;

    // std::nullopt when nothing is known about the marker
    std::optional< bool > matches( const std::string& file, const MarkerId& id,
      const std::string& text ) const;

    void set( const std::string& file, const MarkerId& id,
      const std::string& text );
    void erase( const std::string& file, const MarkerId& id );
    void forget( const std::string& file );
    // Drop the entries of 'file' whose marker is not in 'keep'
    void retain( const std::string& file, const std::set< MarkerId >& keep );
    std::size_t size() const { return entries_.size(); }

    // Copy of the entries of one file
    BaselineStore slice( const std::string& file ) const;

    // YAML form: a sequence of {file, marker, digest} mappings
    ordered_node save() const;
    void load( const ordered_node& node );

    // 64-bit FNV-1a, as "fnv1a:" followed by 16 hex digits
    static std::string digest( const std::string& text );

  private:
    struct Entry {
      std::optional< std::string > content;
      std::string digest;
    };
    std::map< MarkerRef, Entry > entries_;
  };

namespace internal {

  inline const std::string STATE_KEY = "key";
  inline const std::string STATE_FILE = "file";
  inline const std::string STATE_MARKER = "marker";
  inline const std::string STATE_DIGEST = "digest";

  inline bool is_keyword_or_number( const std::string& word ) {
    if ( word == "true" || word == "false" || word == "null" ) return true;
    const unsigned char c = static_cast< unsigned char >( word[0] );
    return std::isdigit( c ) || c == '-';
  }

  // Model paths mentioned in a condition expression
  inline std::vector< std::string > condition_paths( const std::string& expr ) {
    std::vector< std::string > out;
    std::size_t pos = 0;
    while ( pos < expr.size() ) {
      const char c = expr[ pos ];
      if ( c == '\'' || c == '"' ) {
        std::size_t end = expr.find( c, pos + 1 );
        pos = ( end == std::string::npos ) ? expr.size() : end + 1;
        continue;
      }
      const std::size_t start = pos;
      while ( pos < expr.size() ) {
        const unsigned char ch = static_cast< unsigned char >( expr[pos] );
        if ( std::isalnum(ch) || ch == '_' || ch == '.' || ch == '-' ) ++pos;
        else break;
      }
      if ( pos == start ) {
        ++pos;
        continue;
      }
      const std::string word = expr.substr( start, pos - start );
      if ( !is_keyword_or_number(word) ) out.push_back( word );
    }
    return out;
  }

  inline void add_unique( std::vector< std::string >& out,
    const std::string& key )
  {
    if ( key.empty() ) return;
    for ( const auto& k : out ) if ( k == key ) return;
    out.push_back( key );
  }

  inline MarkerRef ref_from_node( const ordered_node& n,
    const std::string& what )
  {
    if ( !n.is_mapping() || !n.contains(STATE_FILE)
      || !n.contains(STATE_MARKER) )
    {
      throw std::runtime_error( "state: " + what
        + " entries need 'file' and 'marker'" );
    }
    return MarkerRef{ to_string_any( n.at(STATE_FILE) ),
      to_string_any( n.at(STATE_MARKER) ) };
  }

} // namespace regen::internal

} // namespace regen

inline std::vector< std::string > regen::dependency_keys_of(
  const MarkerType& marker )
{
  using namespace internal;
  std::vector< std::string > keys;

  auto add_placeholders = [&]( const std::string& text,
    const std::vector< std::string >& locals )
  {
    for ( const auto& name : unresolved_placeholders(text) ) {
      bool local = false;
      for ( const auto& l : locals ) {
        if ( name == l || paths_overlap(name, l) ) local = true;
      }
      if ( !local ) add_unique( keys, name );
    }
  };

  switch ( kind_of(marker) ) {
    case MarkerKind::Guard:
      break;

    case MarkerKind::Generated: {
      const auto& m = std::get< Generated >( marker );
      for ( const auto& k : m.dependency_keys ) add_unique( keys, k );
      if ( m.source.type == ContentSource::Type::Value ) {
        add_unique( keys, m.source.text );
      }
      else if ( m.source.type == ContentSource::Type::Template ) {
        add_placeholders( m.source.text, {} );
      }
      break;
    }

    case MarkerKind::Conditional: {
      const auto& m = std::get< Conditional >( marker );
      for ( const auto& k : m.dependency_keys ) add_unique( keys, k );
      for ( const auto& k : condition_paths(m.condition) ) add_unique( keys, k );
      add_placeholders( m.body, {} );
      for ( const auto& alt : m.alternatives ) add_placeholders( alt.second, {} );
      break;
    }

    case MarkerKind::Import: {
      const auto& m = std::get< Import >( marker );
      for ( const auto& k : m.dependency_keys ) add_unique( keys, k );
      add_unique( keys, m.source );
      break;
    }

    case MarkerKind::Template: {
      const auto& m = std::get< Template >( marker );
      for ( const auto& k : m.dependency_keys ) add_unique( keys, k );
      std::vector< std::string > locals;
      for ( const auto& p : m.parameters ) {
        add_unique( keys, p.from );
        locals.push_back( p.name );
      }
      if ( m.iteration ) {
        add_unique( keys, m.iteration->data_source );
        locals.push_back( m.iteration->item_var );
        if ( m.iteration->index_var ) locals.push_back( *m.iteration->index_var );
      }
      add_placeholders( m.body, locals );
      break;
    }
  }
  return keys;
}

// DependencyTracker member function definitions

inline void regen::DependencyTracker::erase_marker( const MarkerRef& ref ) {
  auto it = by_marker_.find( ref );
  if ( it == by_marker_.end() ) return;
  for ( const auto& key : it->second ) {
    auto kit = by_key_.find( key );
    if ( kit == by_key_.end() ) continue;
    kit->second.erase( ref );
    if ( kit->second.empty() ) by_key_.erase( kit );
  }
  by_marker_.erase( it );
}

inline void regen::DependencyTracker::record( const std::string& file,
  const MarkerId& id, const std::vector< std::string >& keys )
{
  const MarkerRef ref{ file, id };
  erase_marker( ref );
  auto& own = by_marker_[ ref ];
  for ( const auto& key : keys ) {
    if ( key.empty() ) continue;
    own.insert( key );
    by_key_[ key ].insert( ref );
  }
}

inline void regen::DependencyTracker::record_file( const std::string& file,
  const Entries& entries )
{
  forget( file );
  for ( const auto& [id, keys] : entries ) record( file, id, keys );
}

inline void regen::DependencyTracker::forget( const std::string& file ) {
  std::vector< MarkerRef > doomed;
  for ( auto it = by_marker_.lower_bound( MarkerRef{ file, MarkerId() } );
    it != by_marker_.end() && it->first.file == file; ++it )
  {
    doomed.push_back( it->first );
  }
  for ( const auto& ref : doomed ) erase_marker( ref );
}

// Recorded keys equal to 'changed', below it, or above it
inline void regen::DependencyTracker::collect( const std::string& changed,
  std::set< MarkerRef >& out ) const
{
  for ( auto it = by_key_.lower_bound( changed ); it != by_key_.end(); ++it ) {
    if ( it->first.compare( 0, changed.size(), changed ) != 0 ) break;
    if ( internal::paths_overlap(it->first, changed) ) {
      out.insert( it->second.begin(), it->second.end() );
    }
  }
  for ( std::size_t dot = changed.rfind( internal::PATH_DELIMITER );
    dot != std::string::npos && dot > 0;
    dot = changed.rfind( internal::PATH_DELIMITER, dot - 1 ) )
  {
    auto it = by_key_.find( changed.substr(0, dot) );
    if ( it != by_key_.end() ) out.insert( it->second.begin(), it->second.end() );
  }
}

inline std::set< regen::MarkerRef > regen::DependencyTracker::affected(
  const std::vector< std::string >& changed_keys ) const
{
  std::set< MarkerRef > out;
  for ( const auto& key : changed_keys ) {
    if ( !key.empty() ) collect( key, out );
  }
  return out;
}

inline std::set< regen::MarkerId > regen::DependencyTracker::affected_in(
  const std::string& file, const std::vector< std::string >& changed_keys ) const
{
  std::set< MarkerId > out;
  for ( const auto& ref : affected(changed_keys) ) {
    if ( ref.file == file ) out.insert( ref.id );
  }
  return out;
}

inline std::vector< std::string > regen::DependencyTracker::dependencies_of(
  const std::string& file, const MarkerId& id ) const
{
  auto it = by_marker_.find( MarkerRef{ file, id } );
  if ( it == by_marker_.end() ) return {};
  return std::vector< std::string >( it->second.begin(), it->second.end() );
}

inline std::set< regen::MarkerRef > regen::DependencyTracker::dependents_of(
  const std::string& key ) const
{
  return affected( { key } );
}

inline bool regen::DependencyTracker::knows( const std::string& file ) const {
  auto it = by_marker_.lower_bound( MarkerRef{ file, MarkerId() } );
  return it != by_marker_.end() && it->first.file == file;
}

inline std::size_t regen::DependencyTracker::edge_count() const {
  std::size_t n = 0;
  for ( const auto& kv : by_marker_ ) n += kv.second.size();
  return n;
}

inline regen::ordered_node regen::DependencyTracker::save() const {
  std::vector< ordered_node > triples;
  for ( const auto& [key, refs] : by_key_ ) {
    for ( const auto& ref : refs ) {
      ordered_node t = ordered_node::mapping();
      t[ internal::STATE_KEY ] = internal::make_node_from( key );
      t[ internal::STATE_FILE ] = internal::make_node_from( ref.file );
      t[ internal::STATE_MARKER ] = internal::make_node_from( ref.id );
      triples.push_back( t );
    }
  }
  return internal::make_node_from( triples );
}

inline void regen::DependencyTracker::load( const ordered_node& node ) {
  by_key_.clear();
  by_marker_.clear();
  if ( node.is_null() ) return;
  if ( !node.is_sequence() ) {
    throw std::runtime_error( "state: 'dependencies' must be a sequence" );
  }
  for ( size_t i = 0; i < node.size(); ++i ) {
    const ordered_node& t = node.at( i );
    const MarkerRef ref = internal::ref_from_node( t, "dependency" );
    if ( !t.contains(internal::STATE_KEY) ) {
      throw std::runtime_error( "state: dependency entries need a 'key'" );
    }
    const std::string key = internal::to_string_any( t.at(internal::STATE_KEY) );
    by_marker_[ ref ].insert( key );
    by_key_[ key ].insert( ref );
  }
}

// BaselineStore member function definitions

inline std::string regen::BaselineStore::digest( const std::string& text ) {
  std::uint64_t h = 14695981039346656037ULL;
  for ( unsigned char c : text ) {
    h ^= c;
    h *= 1099511628211ULL;
  }
  // The prefix keeps the digest a string when written to YAML
  char buf[ 17 ];
  std::snprintf( buf, sizeof(buf), "%016llx",
    static_cast< unsigned long long >( h ) );
  return "fnv1a:" + std::string( buf );
}

inline std::optional< std::string > regen::BaselineStore::content(
  const std::string& file, const MarkerId& id ) const
{
  auto it = entries_.find( MarkerRef{ file, id } );
  if ( it == entries_.end() ) return std::nullopt;
  return it->second.content;
}

inline bool regen::BaselineStore::has( const std::string& file,
  const MarkerId& id ) const
{
  return entries_.count( MarkerRef{ file, id } ) > 0;
}

inline std::optional< bool > regen::BaselineStore::matches(
  const std::string& file, const MarkerId& id, const std::string& text ) const
{
  auto it = entries_.find( MarkerRef{ file, id } );
  if ( it == entries_.end() ) return std::nullopt;
  if ( it->second.content ) return *it->second.content == text;
  return it->second.digest == digest( text );
}

inline void regen::BaselineStore::set( const std::string& file,
  const MarkerId& id, const std::string& text )
{
  entries_[ MarkerRef{ file, id } ] = Entry{ text, digest( text ) };
}

inline void regen::BaselineStore::erase( const std::string& file,
  const MarkerId& id )
{
  entries_.erase( MarkerRef{ file, id } );
}

inline void regen::BaselineStore::forget( const std::string& file ) {
  for ( auto it = entries_.lower_bound( MarkerRef{ file, MarkerId() } );
    it != entries_.end() && it->first.file == file; )
  {
    it = entries_.erase( it );
  }
}

inline void regen::BaselineStore::retain( const std::string& file,
  const std::set< MarkerId >& keep )
{
  for ( auto it = entries_.lower_bound( MarkerRef{ file, MarkerId() } );
    it != entries_.end() && it->first.file == file; )
  {
    if ( keep.count(it->first.id) ) ++it;
    else it = entries_.erase( it );
  }
}

inline regen::BaselineStore regen::BaselineStore::slice(
  const std::string& file ) const
{
  BaselineStore out;
  for ( auto it = entries_.lower_bound( MarkerRef{ file, MarkerId() } );
    it != entries_.end() && it->first.file == file; ++it )
  {
    out.entries_.insert( *it );
  }
  return out;
}

inline regen::ordered_node regen::BaselineStore::save() const {
  std::vector< ordered_node > rows;
  for ( const auto& [ref, entry] : entries_ ) {
    ordered_node row = ordered_node::mapping();
    row[ internal::STATE_FILE ] = internal::make_node_from( ref.file );
    row[ internal::STATE_MARKER ] = internal::make_node_from( ref.id );
    row[ internal::STATE_DIGEST ] = internal::make_node_from( entry.digest );
    rows.push_back( row );
  }
  return internal::make_node_from( rows );
}

inline void regen::BaselineStore::load( const ordered_node& node ) {
  entries_.clear();
  if ( node.is_null() ) return;
  if ( !node.is_sequence() ) {
    throw std::runtime_error( "state: 'baselines' must be a sequence" );
  }
  for ( size_t i = 0; i < node.size(); ++i ) {
    const ordered_node& row = node.at( i );
    const MarkerRef ref = internal::ref_from_node( row, "baseline" );
    if ( !row.contains(internal::STATE_DIGEST) ) {
      throw std::runtime_error( "state: baseline entries need a 'digest'" );
    }
    entries_[ ref ] = Entry{ std::nullopt,
      internal::to_string_any( row.at(internal::STATE_DIGEST) ) };
  }
}
