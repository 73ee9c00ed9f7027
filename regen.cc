//  regen: guarded-region regeneration engine
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the regen authors

// Standard library includes
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "regen.hh"

namespace {

  struct Options {
    std::string manifest;
    std::string model;
    std::vector< std::string > files;
    std::vector< std::string > changed;
    std::string state;
    bool all = false;
    bool write = false;
    bool verbose = false;
  };

  void print_usage( std::ostream& os ) {
    os << "usage: regen [options] <manifest.yaml> <model.yaml> <file>...\n"
      << "  --changed KEY   regenerate markers depending on KEY (repeatable)\n"
      << "  --all           regenerate every non-guard marker (default when no"
      << " --changed is given)\n"
      << "  --state PATH    load and save dependencies and baselines\n"
      << "  --write         rewrite files in place instead of printing them\n"
      << "  --verbose       debug logging (see also SPDLOG_LEVEL)\n"
      << "  --version       print the version and exit\n";
  }

  Options parse_options( int argc, char** argv ) {
    Options opt;
    std::vector< std::string > positional;
    for ( int i = 1; i < argc; ++i ) {
      const std::string arg = argv[ i ];
      auto value = [&]() -> std::string {
        if ( i + 1 >= argc ) {
          throw std::runtime_error( "option " + arg + " needs a value" );
        }
        return argv[ ++i ];
      };
      if ( arg == "--changed" ) opt.changed.push_back( value() );
      else if ( arg == "--state" ) opt.state = value();
      else if ( arg == "--all" ) opt.all = true;
      else if ( arg == "--write" ) opt.write = true;
      else if ( arg == "--verbose" || arg == "-v" ) opt.verbose = true;
      else if ( arg.size() > 1 && arg[0] == '-' ) {
        throw std::runtime_error( "unknown option '" + arg + "'" );
      }
      else positional.push_back( arg );
    }
    if ( positional.size() < 3 ) {
      throw std::runtime_error( "expected a manifest, a model and at least one"
        " file" );
    }
    opt.manifest = positional[ 0 ];
    opt.model = positional[ 1 ];
    opt.files.assign( positional.begin() + 2, positional.end() );
    if ( opt.changed.empty() ) opt.all = true;
    return opt;
  }

  std::string read_file( const std::string& path ) {
    std::ifstream in( path, std::ios::binary );
    if ( !in ) throw std::runtime_error( "cannot read '" + path + "'" );
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

  void write_file( const std::string& path, const std::string& text ) {
    std::ofstream out( path, std::ios::binary | std::ios::trunc );
    if ( !out ) throw std::runtime_error( "cannot write '" + path + "'" );
    out << text;
    if ( !out ) throw std::runtime_error( "error writing '" + path + "'" );
  }

} // namespace

int main( int argc, char** argv ) {
  try {
    for ( int i = 1; i < argc; ++i ) {
      const std::string arg = argv[ i ];
      if ( arg == "--help" || arg == "-h" ) {
        print_usage( std::cout );
        return 0;
      }
      if ( arg == "--version" ) {
        std::cout << "regen " << REGEN_VERSION_STRING << '\n';
        return 0;
      }
    }

    // Logs go to stderr so that rewritten text on stdout stays clean
    spdlog::set_default_logger( spdlog::stderr_color_mt("regen") );
    spdlog::set_level( spdlog::level::warn );
    spdlog::cfg::load_env_levels();

    const Options opt = parse_options( argc, argv );
    if ( opt.verbose ) spdlog::set_level( spdlog::level::debug );

    std::ifstream manifest_in( opt.manifest );
    if ( !manifest_in ) {
      throw std::runtime_error( "cannot read '" + opt.manifest + "'" );
    }
    regen::Manifest manifest = regen::Manifest::from_yaml( manifest_in );

    std::ifstream model_in( opt.model );
    if ( !model_in ) throw std::runtime_error( "cannot read '" + opt.model + "'" );
    const regen::ModelSnapshot model = regen::ModelSnapshot::from_yaml( model_in );

    std::vector< regen::FileInput > inputs;
    for ( const auto& path : opt.files ) {
      inputs.push_back( regen::FileInput{ path, read_file(path) } );
    }

    regen::Session session( std::move(manifest) );
    if ( !opt.state.empty() && std::filesystem::exists(opt.state) ) {
      session.load_state( opt.state );
    }

    const auto results = session.regenerate_files( inputs, model, opt.changed,
      opt.all );

    // Files that could not be parsed are reported before any output
    bool problems = false;
    for ( const auto& r : results ) {
      if ( r.status == regen::FileStatus::Failed
        || r.status == regen::FileStatus::Skipped )
      {
        std::cerr << "[regen] " << regen::file_status_name( r.status ) << ": "
          << r.file << ": " << r.error << '\n';
        problems = true;
      }
    }

    for ( const auto& r : results ) {
      if ( r.status == regen::FileStatus::Failed
        || r.status == regen::FileStatus::Skipped ) continue;
      if ( opt.write ) {
        if ( r.status == regen::FileStatus::Rewritten ) write_file( r.file, r.text );
        continue;
      }
      if ( results.size() > 1 ) std::cout << "==> " << r.file << " <==\n";
      std::cout << r.text;
    }

    const regen::ConflictReporter reporter = session.conflicts();
    if ( !reporter.empty() ) {
      reporter.print( std::cerr );
      problems = true;
    }

    if ( !opt.state.empty() ) session.save_state( opt.state );

    const regen::Statistics stats = session.statistics();
    spdlog::info( "{} file(s): {} rewritten, {} failed, {} skipped; {}"
      " marker(s) regenerated, {} conflict(s), {} error(s)",
      stats.files_processed, stats.files_rewritten, stats.files_failed,
      stats.files_skipped, stats.markers_regenerated, stats.conflicts,
      stats.errors );

    return problems ? 2 : 0;
  }
  catch ( const std::exception& ex ) {
    std::cerr << "[regen] error: " << ex.what() << "\n";
    return 1;
  }
}
