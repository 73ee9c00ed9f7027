//  regen: guarded-region regeneration engine
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the regen authors
#pragma once

// Standard library includes
#include <cstddef>
#include <map>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "dependencies.hh"
#include "generator.hh"
#include "markers.hh"
#include "model.hh"

namespace regen {

  // A manual edit that collides with regeneration. Never resolved here.
  struct Conflict {
    std::string file;
    MarkerId marker_id;
    std::string existing;
    std::string proposed;
    std::string reason;
  };

  // A marker whose content could not be generated
  struct MarkerError {
    std::string file;
    MarkerId marker_id;
    GenerationError::Kind kind;
    std::string message;
  };

  class ConflictReporter {
  public:
    void add_conflict( Conflict conflict );
    void add_error( MarkerError error );
    void merge( const ConflictReporter& other );

    const std::vector< Conflict >& report() const { return conflicts_; }
    const std::vector< MarkerError >& errors() const { return errors_; }

    bool empty() const { return conflicts_.empty() && errors_.empty(); }
    void clear();

    // Human-readable listing with both versions of each conflict
    void print( std::ostream& os ) const;

  private:
    std::vector< Conflict > conflicts_;
    std::vector< MarkerError > errors_;
  };

  enum class RewriteStatus { Unchanged, Rewritten };

  struct RewriteResult {
    std::string text;
    RewriteStatus status = RewriteStatus::Unchanged;
    std::vector< Conflict > conflicts;
    std::vector< MarkerError > errors;
    // New baseline content per non-Guard marker, to be committed by the
    // caller
    std::map< MarkerId, std::string > baselines;
    // Markers for which the generator was invoked
    std::vector< MarkerId > regenerated;
  };

  struct RewriteOptions {
    bool indent_generated = true;
  };

  // Merges fresh content into the Regions of one document and reserializes
  // it. Operates only in memory.
  class Rewriter {
  public:
    explicit Rewriter( const ContentGenerator& generator,
      const BaselineStore* baselines = nullptr,
      RewriteOptions options = RewriteOptions() );

    // Regenerate the markers whose dependency keys intersect 'changed_keys'.
    // When none do, the document is returned as is and no Guard is seeded.
    RewriteResult rewrite( ParsedDocument& doc, const ModelSnapshot& model,
      const std::vector< std::string >& changed_keys ) const;

    // Regenerate exactly the listed markers (Guards in the list are ignored)
    RewriteResult rewrite_markers( ParsedDocument& doc,
      const ModelSnapshot& model, const std::set< MarkerId >& ids ) const;

  private:
    const ContentGenerator& generator_;
    const BaselineStore* baselines_;
    RewriteOptions options_;

    std::optional< bool > matches_baseline( const ParsedDocument& doc,
      const Region& region ) const;
    void seed_guard( const ParsedDocument& doc, Region& region,
      ConflictReporter& reporter ) const;
    void regenerate( const ParsedDocument& doc, Region& region,
      const ModelSnapshot& model, ConflictReporter& reporter,
      RewriteResult& result ) const;
  };

namespace internal {

  // Convert every line ending to '\n'
  inline std::string to_lf( const std::string& text ) {
    std::string out;
    out.reserve( text.size() );
    for ( std::size_t i = 0; i < text.size(); ++i ) {
      if ( text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n' ) {
        continue;
      }
      out += text[ i ];
    }
    return out;
  }

  // Strip 'indent' from the start of every line of a '\n' body
  inline std::string dedent( const std::string& body, const std::string& indent )
  {
    if ( indent.empty() ) return body;
    std::vector< std::string > lines = split_lines( body );
    for ( auto& line : lines ) {
      if ( line.compare(0, indent.size(), indent) == 0 ) {
        line.erase( 0, indent.size() );
      }
      else if ( is_blank(line) ) {
        line.clear();
      }
    }
    std::string out = join_lines( lines );
    if ( !out.empty() || !body.empty() ) out += '\n';
    return out;
  }

  // Lay out generated text inside a region: one line ending per line,
  // 'indent' in front of every non-empty line. Blank text gives an empty
  // region.
  inline std::string format_body( const std::string& text,
    const std::string& indent, const std::string& eol )
  {
    if ( is_blank(text) ) return std::string();
    std::string out;
    for ( const auto& line : split_lines(text) ) {
      if ( !line.empty() ) out += indent + line;
      out += eol;
    }
    return out;
  }

  // First line of 'text' the parser would read as a marker delimiter
  inline std::optional< std::string > delimiter_line( const std::string& text,
    const LanguageProfile& profile )
  {
    for ( const auto& line : split_lines(text) ) {
      if ( match_delimiter_line(line, profile) ) return line;
    }
    return std::nullopt;
  }

  inline bool tolerates_manual_edits( const MarkerType& marker ) {
    if ( kind_of(marker) != MarkerKind::Import ) return false;
    const auto s = std::get< Import >( marker ).merge_strategy;
    return s == ImportMergeStrategy::KeepExisting
      || s == ImportMergeStrategy::Merge;
  }

  inline bool is_interactive_import( const MarkerType& marker ) {
    return kind_of( marker ) == MarkerKind::Import
      && std::get< Import >( marker ).merge_strategy
        == ImportMergeStrategy::Interactive;
  }

} // namespace regen::internal

} // namespace regen

// ConflictReporter member function definitions

inline void regen::ConflictReporter::add_conflict( Conflict conflict ) {
  conflicts_.push_back( std::move(conflict) );
}

inline void regen::ConflictReporter::add_error( MarkerError error ) {
  errors_.push_back( std::move(error) );
}

inline void regen::ConflictReporter::merge( const ConflictReporter& other ) {
  conflicts_.insert( conflicts_.end(), other.conflicts_.begin(),
    other.conflicts_.end() );
  errors_.insert( errors_.end(), other.errors_.begin(), other.errors_.end() );
}

inline void regen::ConflictReporter::clear() {
  conflicts_.clear();
  errors_.clear();
}

inline void regen::ConflictReporter::print( std::ostream& os ) const {
  for ( const auto& c : conflicts_ ) {
    os << "conflict: " << c.file << ": marker '" << c.marker_id << "': "
      << c.reason << '\n';
    os << "--- existing\n" << c.existing;
    if ( !c.existing.empty() && c.existing.back() != '\n' ) os << '\n';
    os << "+++ proposed\n" << c.proposed;
    if ( !c.proposed.empty() && c.proposed.back() != '\n' ) os << '\n';
  }
  for ( const auto& e : errors_ ) {
    os << "error: " << e.file << ": marker '" << e.marker_id << "': "
      << generation_error_name( e.kind ) << ": " << e.message << '\n';
  }
}

// Rewriter member function definitions

inline regen::Rewriter::Rewriter( const ContentGenerator& generator,
  const BaselineStore* baselines, RewriteOptions options )
  : generator_( generator ), baselines_( baselines ), options_( options ) {}

inline std::optional< bool > regen::Rewriter::matches_baseline(
  const ParsedDocument& doc, const Region& region ) const
{
  if ( region.baseline_content ) {
    return region.raw_content == *region.baseline_content;
  }
  if ( baselines_ ) {
    return baselines_->matches( doc.file, id_of(region.marker),
      region.raw_content );
  }
  return std::nullopt;
}

inline void regen::Rewriter::seed_guard( const ParsedDocument& doc,
  Region& region, ConflictReporter& reporter ) const
{
  const Guard& guard = std::get< Guard >( region.marker );
  if ( !internal::is_blank(region.raw_content) || !guard.default_content ) {
    return;
  }
  if ( const auto line = internal::delimiter_line( *guard.default_content,
    *doc.profile ) )
  {
    const std::string msg = "guard '" + guard.id + "': default line '" + *line
      + "' would be read as a marker delimiter";
    spdlog::warn( "{}: {}", doc.file, msg );
    reporter.add_error( MarkerError{ doc.file, guard.id,
      GenerationError::Kind::DelimiterInContent, msg } );
    return;
  }
  const std::string seeded = internal::format_body( *guard.default_content,
    guard.preserve_indent ? region.indent : std::string(), doc.line_ending );
  if ( seeded == region.raw_content ) return;

  spdlog::debug( "{}: seeding guard '{}'", doc.file, guard.id );
  region.raw_content = seeded;
  region.is_modified = true;
}

inline void regen::Rewriter::regenerate( const ParsedDocument& doc,
  Region& region, const ModelSnapshot& model, ConflictReporter& reporter,
  RewriteResult& result ) const
{
  const MarkerId& id = id_of( region.marker );
  const std::string indent = options_.indent_generated ? region.indent
    : std::string();

  const std::optional< bool > clean = matches_baseline( doc, region );

  result.regenerated.push_back( id );
  std::string fresh;
  try {
    const std::string existing = internal::dedent(
      internal::to_lf(region.raw_content), indent );
    fresh = generator_.generate( region.marker, existing, model );
    if ( const auto line = internal::delimiter_line(fresh, *doc.profile) ) {
      throw GenerationError( GenerationError::Kind::DelimiterInContent,
        "marker '" + id + "': generated line '" + *line
        + "' would be read as a marker delimiter" );
    }
  }
  catch ( const GenerationError& err ) {
    spdlog::warn( "{}: {}", doc.file, err.what() );
    reporter.add_error( MarkerError{ doc.file, id, err.kind(), err.what() } );
    return;
  }

  const std::string proposed = internal::format_body( fresh, indent,
    doc.line_ending );

  const bool tolerant = internal::tolerates_manual_edits( region.marker )
    || internal::is_interactive_import( region.marker );

  // Without a baseline only an empty body or the proposal itself is taken
  // over
  if ( !clean && !tolerant && proposed != region.raw_content
    && !internal::is_blank(region.raw_content) )
  {
    spdlog::warn( "{}: marker '{}' has no known baseline; keeping its content",
      doc.file, id );
    reporter.add_conflict( Conflict{ doc.file, id, region.raw_content,
      proposed, "no baseline known" } );
    return;
  }

  // A hand edit that already equals the proposal is simply adopted
  if ( clean && !*clean && !internal::tolerates_manual_edits(region.marker)
    && proposed != region.raw_content )
  {
    spdlog::warn( "{}: marker '{}' was edited by hand; keeping the edit",
      doc.file, id );
    reporter.add_conflict( Conflict{ doc.file, id, region.raw_content,
      proposed, "content differs from the last generated version" } );
    return;
  }

  if ( internal::is_interactive_import(region.marker)
    && proposed != region.raw_content
    && !internal::is_blank(region.raw_content) )
  {
    reporter.add_conflict( Conflict{ doc.file, id, region.raw_content,
      proposed, "import list change needs confirmation" } );
    return;
  }

  result.baselines[ id ] = proposed;
  region.baseline_content = proposed;
  if ( proposed != region.raw_content ) {
    spdlog::debug( "{}: regenerated marker '{}'", doc.file, id );
    region.raw_content = proposed;
    region.is_modified = true;
  }
}

inline regen::RewriteResult regen::Rewriter::rewrite( ParsedDocument& doc,
  const ModelSnapshot& model,
  const std::vector< std::string >& changed_keys ) const
{
  std::set< MarkerId > ids;
  for ( const auto& region : doc.regions ) {
    if ( kind_of(region.marker) == MarkerKind::Guard ) continue;
    bool hit = false;
    for ( const auto& dep : dependency_keys_of(region.marker) ) {
      for ( const auto& key : changed_keys ) {
        if ( internal::paths_overlap(dep, key) ) hit = true;
      }
    }
    if ( hit ) ids.insert( id_of(region.marker) );
  }

  // Nothing affected: the document goes back byte for byte
  if ( ids.empty() ) {
    RewriteResult result;
    result.text = MarkerParser::serialize( doc );
    return result;
  }
  return rewrite_markers( doc, model, ids );
}

inline regen::RewriteResult regen::Rewriter::rewrite_markers(
  ParsedDocument& doc, const ModelSnapshot& model,
  const std::set< MarkerId >& ids ) const
{
  RewriteResult result;
  ConflictReporter reporter;

  for ( auto& region : doc.regions ) {
    const MarkerId& id = id_of( region.marker );

    if ( kind_of(region.marker) == MarkerKind::Guard ) {
      seed_guard( doc, region, reporter );
      continue;
    }

    if ( ids.count(id) ) regenerate( doc, region, model, reporter, result );
  }

  bool modified = false;
  for ( const auto& region : doc.regions ) modified |= region.is_modified;

  result.text = MarkerParser::serialize( doc );
  result.status = modified ? RewriteStatus::Rewritten
    : RewriteStatus::Unchanged;
  result.conflicts = reporter.report();
  result.errors = reporter.errors();
  return result;
}
