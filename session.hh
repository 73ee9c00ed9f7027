//  regen: guarded-region regeneration engine
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the regen authors
#pragma once

// Standard library includes
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <fstream>
#include <map>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "dependencies.hh"
#include "generator.hh"
#include "manifest.hh"
#include "markers.hh"
#include "model.hh"
#include "profiles.hh"
#include "rewriter.hh"

namespace regen {

  struct FileInput {
    std::string path;
    std::string text;
  };

  enum class FileStatus { Unchanged, Rewritten, Failed, Skipped };

  const char* file_status_name( FileStatus status );

  struct FileResult {
    std::string file;
    FileStatus status = FileStatus::Unchanged;
    std::string text; // the input text unless the file was rewritten
    std::vector< Conflict > conflicts;
    std::vector< MarkerError > errors;
    std::string error; // parse, profile or manifest problem
    std::size_t regenerated = 0;
  };

  struct Statistics {
    std::size_t files_processed = 0;
    std::size_t files_rewritten = 0;
    std::size_t files_failed = 0;
    std::size_t files_skipped = 0;
    std::size_t markers_regenerated = 0;
    std::size_t conflicts = 0;
    std::size_t errors = 0;
    std::size_t tracked_markers = 0;
    std::size_t dependency_edges = 0;
  };

  // Owns the dependency graph and the baselines for the lifetime of a tool
  // run and drives parse -> generate -> rewrite for each file
  class Session {
  public:
    explicit Session( Manifest manifest,
      const TemplateRenderer* renderer = nullptr,
      const FunctionRegistry* functions = nullptr );

    Session( const Session& ) = delete;
    Session& operator=( const Session& ) = delete;

    // Regenerate the markers of one file affected by 'changed_keys'
    FileResult regenerate( const FileInput& input, const ModelSnapshot& model,
      const std::vector< std::string >& changed_keys );

    // Regenerate every non-Guard marker of one file
    FileResult regenerate_all( const FileInput& input,
      const ModelSnapshot& model );

    // Per-file tasks, run on up to settings().workers threads. Results come
    // back in input order; files not started before cancel() are Skipped.
    // With 'all' set, 'changed_keys' is ignored.
    std::vector< FileResult > regenerate_files(
      const std::vector< FileInput >& inputs, const ModelSnapshot& model,
      const std::vector< std::string >& changed_keys, bool all = false );

    // Take a caller-resolved version of a marker as its new baseline
    void accept_proposed( const std::string& file, const MarkerId& id,
      const std::string& content );

    void cancel() { cancelled_ = true; }
    bool cancelled() const { return cancelled_.load(); }
    void reset_cancel() { cancelled_ = false; }

    Statistics statistics() const;

    // Everything reported so far, in completion order
    ConflictReporter conflicts() const;
    void clear_conflicts();

    std::set< MarkerRef > affected(
      const std::vector< std::string >& changed_keys ) const;
    std::vector< std::string > dependencies_of( const std::string& file,
      const MarkerId& id ) const;

    const Manifest& manifest() const { return manifest_; }
    std::size_t generator_invocations() const {
      return generator_.invocations();
    }

    // State file: {dependencies: [...], baselines: [...]}
    ordered_node state() const;
    void restore( const ordered_node& state );
    void save_state( const std::string& path ) const;
    void load_state( const std::string& path );

  private:
    Manifest manifest_;
    ContentGenerator generator_;

    mutable std::shared_mutex mutex_; // guards everything below
    DependencyTracker tracker_;
    BaselineStore baselines_;
    ConflictReporter reporter_;
    Statistics stats_;

    std::atomic< bool > cancelled_{ false };

    FileResult process( const FileInput& input, const ModelSnapshot& model,
      const std::vector< std::string >* changed_keys );
    void commit( const FileResult& result,
      const std::map< MarkerId, std::string >& baselines );
  };

namespace internal {

  inline const std::string DEPENDENCIES = "dependencies";
  inline const std::string BASELINES = "baselines";

} // namespace regen::internal

} // namespace regen

inline const char* regen::file_status_name( FileStatus status ) {
  switch ( status ) {
    case FileStatus::Unchanged: return "unchanged";
    case FileStatus::Rewritten: return "rewritten";
    case FileStatus::Failed: return "failed";
    case FileStatus::Skipped: return "skipped";
  }
  return "unknown";
}

// Session member function definitions

inline regen::Session::Session( Manifest manifest,
  const TemplateRenderer* renderer, const FunctionRegistry* functions )
  : manifest_( std::move(manifest) ), generator_( renderer, functions ) {}

inline regen::FileResult regen::Session::regenerate( const FileInput& input,
  const ModelSnapshot& model, const std::vector< std::string >& changed_keys )
{
  return process( input, model, &changed_keys );
}

inline regen::FileResult regen::Session::regenerate_all(
  const FileInput& input, const ModelSnapshot& model )
{
  return process( input, model, nullptr );
}

inline std::vector< regen::FileResult > regen::Session::regenerate_files(
  const std::vector< FileInput >& inputs, const ModelSnapshot& model,
  const std::vector< std::string >& changed_keys, bool all )
{
  std::vector< FileResult > results( inputs.size() );
  for ( std::size_t i = 0; i < inputs.size(); ++i ) {
    results[ i ].file = inputs[ i ].path;
    results[ i ].text = inputs[ i ].text;
    results[ i ].status = FileStatus::Skipped;
    results[ i ].error = "cancelled";
  }

  std::atomic< std::size_t > next{ 0 };
  auto worker = [&]() {
    while ( !cancelled_ ) {
      const std::size_t i = next++;
      if ( i >= inputs.size() ) break;
      results[ i ] = process( inputs[i], model, all ? nullptr : &changed_keys );
    }
  };

  const std::size_t n_threads = std::min( manifest_.settings().workers,
    inputs.size() );
  if ( n_threads <= 1 ) {
    worker();
  }
  else {
    spdlog::debug( "processing {} files on {} threads", inputs.size(),
      n_threads );
    std::vector< std::thread > threads;
    for ( std::size_t t = 0; t < n_threads; ++t ) threads.emplace_back( worker );
    for ( auto& t : threads ) if ( t.joinable() ) t.join();
  }

  if ( cancelled_ ) {
    std::size_t skipped = 0;
    for ( const auto& r : results ) {
      if ( r.status == FileStatus::Skipped && r.error == "cancelled" ) ++skipped;
    }
    spdlog::info( "cancelled with {} file(s) not processed", skipped );
    std::unique_lock< std::shared_mutex > lock( mutex_ );
    stats_.files_skipped += skipped;
  }
  return results;
}

inline regen::FileResult regen::Session::process( const FileInput& input,
  const ModelSnapshot& model, const std::vector< std::string >* changed_keys )
{
  FileResult result;
  result.file = input.path;
  result.text = input.text;

  const LanguageProfile* profile = find_profile(
    internal::extension_of(input.path) );
  if ( !profile ) {
    result.status = FileStatus::Skipped;
    result.error = ProfileNotFound( internal::extension_of(input.path) ).what();
    spdlog::warn( "{}: {}", input.path, result.error );
    commit( result, {} );
    return result;
  }

  try {
    ParsedDocument doc = MarkerParser::parse( input.text, *profile,
      input.path );
    manifest_.apply( doc );

    // Refresh the graph from this parse, then read back what to regenerate
    DependencyTracker::Entries entries;
    std::set< MarkerId > present;
    for ( const auto& region : doc.regions ) {
      if ( kind_of(region.marker) == MarkerKind::Guard ) continue;
      entries.emplace_back( id_of(region.marker),
        dependency_keys_of(region.marker) );
      present.insert( id_of(region.marker) );
    }

    // Baselines of markers removed from the file go with them
    std::set< MarkerId > ids = changed_keys ? std::set< MarkerId >() : present;
    BaselineStore baselines;
    {
      std::unique_lock< std::shared_mutex > lock( mutex_ );
      tracker_.record_file( input.path, entries );
      baselines_.retain( input.path, present );
    }
    {
      std::shared_lock< std::shared_mutex > lock( mutex_ );
      if ( changed_keys ) ids = tracker_.affected_in( input.path, *changed_keys );
      baselines = baselines_.slice( input.path );
    }

    if ( changed_keys && ids.empty() ) {
      result.status = FileStatus::Unchanged;
      spdlog::debug( "{}: no marker reads the changed keys", input.path );
      commit( result, {} );
      return result;
    }
    for ( auto& region : doc.regions ) {
      region.baseline_content = baselines.content( input.path,
        id_of(region.marker) );
    }

    RewriteOptions options;
    options.indent_generated = manifest_.settings().indent_generated;
    Rewriter rewriter( generator_, &baselines, options );
    RewriteResult rewritten = rewriter.rewrite_markers( doc, model, ids );

    result.text = std::move( rewritten.text );
    result.status = ( rewritten.status == RewriteStatus::Rewritten )
      ? FileStatus::Rewritten : FileStatus::Unchanged;
    result.conflicts = std::move( rewritten.conflicts );
    result.errors = std::move( rewritten.errors );
    result.regenerated = rewritten.regenerated.size();

    spdlog::info( "{}: {} ({} marker(s) regenerated, {} conflict(s), {}"
      " error(s))", input.path, file_status_name( result.status ),
      result.regenerated, result.conflicts.size(), result.errors.size() );
    commit( result, rewritten.baselines );
  }
  catch ( const ParseError& err ) {
    result.status = FileStatus::Failed;
    result.text = input.text;
    result.error = err.what();
    spdlog::error( "{} ({})", err.what(), parse_error_name( err.kind() ) );
    commit( result, {} );
  }
  catch ( const ManifestError& err ) {
    result.status = FileStatus::Failed;
    result.text = input.text;
    result.error = err.what();
    spdlog::error( "{}: {}", input.path, err.what() );
    commit( result, {} );
  }
  catch ( const std::exception& err ) {
    // Anything else (a renderer or a model lookup gone wrong) fails only
    // this file
    result.status = FileStatus::Failed;
    result.text = input.text;
    result.conflicts.clear();
    result.errors.clear();
    result.error = err.what();
    spdlog::error( "{}: {}", input.path, err.what() );
    commit( result, {} );
  }
  return result;
}

inline void regen::Session::commit( const FileResult& result,
  const std::map< MarkerId, std::string >& baselines )
{
  std::unique_lock< std::shared_mutex > lock( mutex_ );
  for ( const auto& [id, content] : baselines ) {
    baselines_.set( result.file, id, content );
  }
  for ( const auto& c : result.conflicts ) reporter_.add_conflict( c );
  for ( const auto& e : result.errors ) reporter_.add_error( e );

  ++stats_.files_processed;
  switch ( result.status ) {
    case FileStatus::Rewritten: ++stats_.files_rewritten; break;
    case FileStatus::Failed: ++stats_.files_failed; break;
    case FileStatus::Skipped: ++stats_.files_skipped; break;
    case FileStatus::Unchanged: break;
  }
  stats_.markers_regenerated += result.regenerated;
  stats_.conflicts += result.conflicts.size();
  stats_.errors += result.errors.size();
}

inline void regen::Session::accept_proposed( const std::string& file,
  const MarkerId& id, const std::string& content )
{
  std::unique_lock< std::shared_mutex > lock( mutex_ );
  baselines_.set( file, id, content );
}

inline regen::Statistics regen::Session::statistics() const {
  std::shared_lock< std::shared_mutex > lock( mutex_ );
  Statistics s = stats_;
  s.tracked_markers = tracker_.marker_count();
  s.dependency_edges = tracker_.edge_count();
  return s;
}

inline regen::ConflictReporter regen::Session::conflicts() const {
  std::shared_lock< std::shared_mutex > lock( mutex_ );
  return reporter_;
}

inline void regen::Session::clear_conflicts() {
  std::unique_lock< std::shared_mutex > lock( mutex_ );
  reporter_.clear();
}

inline std::set< regen::MarkerRef > regen::Session::affected(
  const std::vector< std::string >& changed_keys ) const
{
  std::shared_lock< std::shared_mutex > lock( mutex_ );
  return tracker_.affected( changed_keys );
}

inline std::vector< std::string > regen::Session::dependencies_of(
  const std::string& file, const MarkerId& id ) const
{
  std::shared_lock< std::shared_mutex > lock( mutex_ );
  return tracker_.dependencies_of( file, id );
}

inline regen::ordered_node regen::Session::state() const {
  std::shared_lock< std::shared_mutex > lock( mutex_ );
  ordered_node root = ordered_node::mapping();
  root[ internal::DEPENDENCIES ] = tracker_.save();
  root[ internal::BASELINES ] = baselines_.save();
  return root;
}

inline void regen::Session::restore( const ordered_node& state ) {
  if ( !state.is_null() && !state.is_mapping() ) {
    throw std::runtime_error( "state: top level must be a mapping" );
  }
  DependencyTracker tracker;
  BaselineStore baselines;
  if ( state.is_mapping() && state.contains(internal::DEPENDENCIES) ) {
    tracker.load( state.at(internal::DEPENDENCIES) );
  }
  if ( state.is_mapping() && state.contains(internal::BASELINES) ) {
    baselines.load( state.at(internal::BASELINES) );
  }

  std::unique_lock< std::shared_mutex > lock( mutex_ );
  tracker_ = std::move( tracker );
  baselines_ = std::move( baselines );
}

inline void regen::Session::save_state( const std::string& path ) const {
  std::ofstream out( path );
  if ( !out ) {
    throw std::runtime_error( "cannot write state file '" + path + "'" );
  }
  out << ordered_node::serialize( state() );
  spdlog::debug( "saved state to {}", path );
}

inline void regen::Session::load_state( const std::string& path ) {
  std::ifstream in( path );
  if ( !in ) {
    throw std::runtime_error( "cannot read state file '" + path + "'" );
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  const std::string text = ss.str();
  if ( text.find_first_not_of(" \t\r\n") == std::string::npos ) {
    restore( ordered_node() );
    return;
  }
  restore( ordered_node::deserialize(text) );
  spdlog::debug( "loaded state from {}", path );
}
