//  regen: guarded-region regeneration engine
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the regen authors
#pragma once

// Standard library includes
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>

namespace regen {

  // Comment syntax of one target language. Marker delimiters are written
  // inside these comments, so this is all the parser needs to know about a
  // language.
  struct LanguageProfile {
    std::string id;
    std::vector< std::string > extensions;
    std::string line_prefix;  // empty if the language has no line comments
    std::string block_open;   // empty if the language has no block comments
    std::string block_close;

    inline bool has_line_comments() const { return !line_prefix.empty(); }
    inline bool has_block_comments() const {
      return !block_open.empty() && !block_close.empty();
    }
  };

  class ProfileNotFound : public std::runtime_error {
  public:
    explicit ProfileNotFound( const std::string& extension )
      : std::runtime_error( "no language profile for extension '"
        + extension + "'" ), extension_( extension ) {}

    const std::string& extension() const { return extension_; }

  private:
    std::string extension_;
  };

  // The full table. Adding a language only means adding a row here.
  inline const std::vector< LanguageProfile >& language_profiles();

  // Lookup by extension ("ts", ".ts" and "TS" are equivalent). Returns
  // nullptr when the extension is unknown.
  inline const LanguageProfile* find_profile( const std::string& extension );

  // Same as find_profile() but throws ProfileNotFound
  inline const LanguageProfile& profile_for( const std::string& extension );

  // Lookup by the extension of a file path
  inline const LanguageProfile& profile_for_path( const std::string& path );

  // Lookup by profile id ("cpp", "python", ...)
  inline const LanguageProfile* find_profile_by_id( const std::string& id );

namespace internal {

  inline std::string normalize_extension( const std::string& ext ) {
    std::string out = ext;
    if ( !out.empty() && out[0] == '.' ) out.erase( 0, 1 );
    std::transform( out.begin(), out.end(), out.begin(),
      []( unsigned char c ) { return static_cast< char >( std::tolower(c) ); } );
    return out;
  }

  inline std::string extension_of( const std::string& path ) {
    const std::size_t slash = path.find_last_of( "/\\" );
    const std::size_t dot = path.rfind( '.' );
    if ( dot == std::string::npos ) return std::string();
    if ( slash != std::string::npos && dot < slash ) return std::string();
    return path.substr( dot + 1 );
  }

} // namespace regen::internal

} // namespace regen

inline const std::vector< regen::LanguageProfile >&
  regen::language_profiles()
{
  static const std::vector< LanguageProfile > table = {
    // id          extensions                          line   block
    { "c",          { "c", "h" },                       "//",  "/*", "*/" },
    { "cpp",        { "cpp", "cc", "cxx", "hpp", "hh", "hxx", "ipp" },
                                                        "//",  "/*", "*/" },
    { "csharp",     { "cs" },                           "//",  "/*", "*/" },
    { "java",       { "java" },                         "//",  "/*", "*/" },
    { "javascript", { "js", "mjs", "cjs", "jsx" },      "//",  "/*", "*/" },
    { "typescript", { "ts", "tsx" },                    "//",  "/*", "*/" },
    { "rust",       { "rs" },                           "//",  "/*", "*/" },
    { "go",         { "go" },                           "//",  "/*", "*/" },
    { "swift",      { "swift" },                        "//",  "/*", "*/" },
    { "kotlin",     { "kt", "kts" },                    "//",  "/*", "*/" },
    { "dart",       { "dart" },                         "//",  "/*", "*/" },
    { "python",     { "py", "pyi" },                    "#",   "",   ""   },
    { "ruby",       { "rb" },                           "#",   "",   ""   },
    { "shell",      { "sh", "bash", "zsh" },            "#",   "",   ""   },
    { "yaml",       { "yaml", "yml" },                  "#",   "",   ""   },
    { "toml",       { "toml" },                         "#",   "",   ""   },
    { "cmake",      { "cmake" },                        "#",   "",   ""   },
    { "html",       { "html", "htm" },                  "",    "<!--", "-->" },
    { "xml",        { "xml", "xaml", "svg" },           "",    "<!--", "-->" },
    { "css",        { "css" },                          "",    "/*", "*/" },
    { "scss",       { "scss", "less" },                 "//",  "/*", "*/" },
    { "sql",        { "sql" },                          "--",  "/*", "*/" },
    { "lua",        { "lua" },                          "--",  "",   ""   },
  };
  return table;
}

inline const regen::LanguageProfile* regen::find_profile(
  const std::string& extension )
{
  const std::string ext = internal::normalize_extension( extension );
  if ( ext.empty() ) return nullptr;
  for ( const auto& profile : language_profiles() ) {
    for ( const auto& e : profile.extensions ) {
      if ( e == ext ) return &profile;
    }
  }
  return nullptr;
}

inline const regen::LanguageProfile& regen::profile_for(
  const std::string& extension )
{
  const LanguageProfile* p = find_profile( extension );
  if ( !p ) throw ProfileNotFound( extension );
  return *p;
}

inline const regen::LanguageProfile& regen::profile_for_path(
  const std::string& path )
{
  return profile_for( internal::extension_of(path) );
}

inline const regen::LanguageProfile* regen::find_profile_by_id(
  const std::string& id )
{
  for ( const auto& profile : language_profiles() ) {
    if ( profile.id == id ) return &profile;
  }
  return nullptr;
}
