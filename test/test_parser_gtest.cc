//  regen: guarded-region regeneration engine
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the regen authors
#include <gtest/gtest.h>

#include <string>

#include "../markers.hh"
#include "../profiles.hh"

// Test suite for marker parsing and serialization

class ParserTest : public ::testing::Test {
protected:
  const regen::LanguageProfile* cpp = nullptr;
  const regen::LanguageProfile* python = nullptr;
  const regen::LanguageProfile* css = nullptr;
  const regen::LanguageProfile* html = nullptr;

  void SetUp() override {
    cpp = &regen::profile_for( "cpp" );
    python = &regen::profile_for( "py" );
    css = &regen::profile_for( "css" );
    html = &regen::profile_for( "html" );
  }

  regen::ParseError::Kind parse_error_kind( const std::string& text,
    std::size_t* line = nullptr )
  {
    try {
      regen::MarkerParser::parse( text, *cpp, "test.cpp" );
    }
    catch ( const regen::ParseError& err ) {
      if ( line ) *line = err.line();
      return err.kind();
    }
    ADD_FAILURE() << "text parsed without error:\n" << text;
    return regen::ParseError::Kind::UnbalancedMarker;
  }
};

// ==== Regions ====

TEST_F(ParserTest, FindsRegionsInOrder) {
  const std::string text =
    "#include <string>\n"
    "class View {\n"
    "  // <guard:logic:start>\n"
    "  void handle() { custom(); }\n"
    "  // <guard:logic:end>\n"
    "  // <generated:props:start>\n"
    "  int id;\n"
    "  // <generated:props:end>\n"
    "};\n";

  const regen::ParsedDocument doc = regen::MarkerParser::parse( text, *cpp,
    "view.cpp" );
  ASSERT_EQ( doc.regions.size(), 2u );
  EXPECT_EQ( doc.file, "view.cpp" );
  EXPECT_EQ( doc.profile, cpp );

  const regen::Region& logic = doc.regions[ 0 ];
  EXPECT_EQ( regen::kind_of(logic.marker), regen::MarkerKind::Guard );
  EXPECT_EQ( regen::id_of(logic.marker), "logic" );
  EXPECT_EQ( logic.raw_content, "  void handle() { custom(); }\n" );
  EXPECT_EQ( logic.indent, "  " );
  EXPECT_EQ( logic.span.start_line, 3u );
  EXPECT_EQ( logic.span.end_line, 5u );
  EXPECT_FALSE( logic.is_modified );
  EXPECT_FALSE( logic.baseline_content.has_value() );

  const regen::Region& props = doc.regions[ 1 ];
  EXPECT_EQ( regen::kind_of(props.marker), regen::MarkerKind::Generated );
  EXPECT_EQ( props.raw_content, "  int id;\n" );
  EXPECT_EQ( text.substr(props.span.begin, props.span.end - props.span.begin),
    "  // <generated:props:start>\n  int id;\n  // <generated:props:end>\n" );

  // verbatim, guard, generated, verbatim
  ASSERT_EQ( doc.segments.size(), 4u );
  EXPECT_EQ( doc.segments[0].type, regen::Segment::Type::Verbatim );
  EXPECT_EQ( doc.segments[0].text, "#include <string>\nclass View {\n" );
  EXPECT_EQ( doc.segments[3].text, "};\n" );
}

TEST_F(ParserTest, QueryHelpers) {
  const std::string text =
    "// <generated:a:start>\n"
    "// <generated:a:end>\n"
    "// <import:deps:start>\n"
    "// <import:deps:end>\n"
    "// <generated:b:start>\n"
    "// <generated:b:end>\n";
  regen::ParsedDocument doc = regen::MarkerParser::parse( text, *cpp );

  ASSERT_NE( doc.find("deps"), nullptr );
  EXPECT_EQ( regen::kind_of(doc.find("deps")->marker),
    regen::MarkerKind::Import );
  EXPECT_EQ( doc.find("missing"), nullptr );

  const auto generated = doc.regions_of( regen::MarkerKind::Generated );
  ASSERT_EQ( generated.size(), 2u );
  EXPECT_EQ( regen::id_of(generated[0]->marker), "a" );
  EXPECT_EQ( regen::id_of(generated[1]->marker), "b" );
  EXPECT_TRUE( doc.regions_of(regen::MarkerKind::Template).empty() );
  EXPECT_EQ( doc.find("a")->raw_content, "" );
}

TEST_F(ParserTest, EmptyAndMarkerFreeText) {
  EXPECT_TRUE( regen::MarkerParser::parse( "", *cpp ).regions.empty() );
  const std::string text = "int main() {\n  // just a comment <b>\n}\n";
  const auto doc = regen::MarkerParser::parse( text, *cpp );
  EXPECT_TRUE( doc.regions.empty() );
  EXPECT_EQ( regen::MarkerParser::serialize(doc), text );
}

TEST_F(ParserTest, TokenMustBeAloneOnItsLine) {
  const std::string text =
    "x = 1; // <generated:a:start>\n"
    "// <generated:a:start> and more\n"
    "/* <generated:a:start> */ y = 2;\n";
  EXPECT_TRUE( regen::MarkerParser::parse( text, *cpp ).regions.empty() );
}

// ==== Comment syntaxes ====

TEST_F(ParserTest, PythonLineComments) {
  const std::string text =
    "def render():\n"
    "    #<template:rows:start>\n"
    "    pass\n"
    "    #   <template:rows:end>   \n";
  const auto doc = regen::MarkerParser::parse( text, *python );
  ASSERT_EQ( doc.regions.size(), 1u );
  EXPECT_EQ( regen::kind_of(doc.regions[0].marker),
    regen::MarkerKind::Template );
  EXPECT_EQ( doc.regions[0].indent, "    " );
  EXPECT_EQ( regen::MarkerParser::serialize(doc), text );
}

TEST_F(ParserTest, BlockComments) {
  const std::string css_text =
    ".a { color: red; }\n"
    "/* <generated:theme:start> */\n"
    ".b { color: blue; }\n"
    "/*<generated:theme:end>*/\n";
  const auto css_doc = regen::MarkerParser::parse( css_text, *css );
  ASSERT_EQ( css_doc.regions.size(), 1u );
  EXPECT_EQ( css_doc.regions[0].raw_content, ".b { color: blue; }\n" );

  const std::string html_text =
    "<body>\n"
    "  <!-- <conditional:banner:start> -->\n"
    "  <div>beta</div>\n"
    "  <!-- <conditional:banner:end> -->\n"
    "</body>\n";
  const auto html_doc = regen::MarkerParser::parse( html_text, *html );
  ASSERT_EQ( html_doc.regions.size(), 1u );
  EXPECT_EQ( regen::kind_of(html_doc.regions[0].marker),
    regen::MarkerKind::Conditional );
  EXPECT_EQ( regen::MarkerParser::serialize(html_doc), html_text );
}

TEST_F(ParserTest, BlockCommentNeedsClose) {
  const std::string text = "/* <generated:theme:start>\n";
  EXPECT_TRUE( regen::MarkerParser::parse( text, *css ).regions.empty() );
}

TEST_F(ParserTest, FormatToken) {
  EXPECT_EQ( regen::format_token( *cpp, regen::MarkerKind::Guard, "logic",
    regen::TokenEdge::Start ), "// <guard:logic:start>" );
  EXPECT_EQ( regen::format_token( *css, regen::MarkerKind::Generated, "theme",
    regen::TokenEdge::End ), "/* <generated:theme:end> */" );
  EXPECT_EQ( regen::format_token( *html, regen::MarkerKind::Import, "deps",
    regen::TokenEdge::Start ), "<!-- <import:deps:start> -->" );

  // A formatted token is recognized by the parser
  const std::string text =
    regen::format_token( *python, regen::MarkerKind::Template, "t",
      regen::TokenEdge::Start ) + "\n" +
    regen::format_token( *python, regen::MarkerKind::Template, "t",
      regen::TokenEdge::End ) + "\n";
  EXPECT_EQ( regen::MarkerParser::parse( text, *python ).regions.size(), 1u );
}

// ==== Round trip ====

TEST_F(ParserTest, SerializeReproducesInput) {
  const std::string text =
    "a\n"
    "  // <guard:g:start>\n"
    "\tkeep   this  \n"
    "\n"
    "  // <guard:g:end>  \n"
    "b";
  const auto doc = regen::MarkerParser::parse( text, *cpp );
  EXPECT_EQ( regen::MarkerParser::serialize(doc), text );
}

TEST_F(ParserTest, CrlfLineEndings) {
  const std::string text =
    "a\r\n"
    "// <generated:g:start>\r\n"
    "old\r\n"
    "// <generated:g:end>\r\n"
    "z\r\n";
  const auto doc = regen::MarkerParser::parse( text, *cpp );
  EXPECT_EQ( doc.line_ending, "\r\n" );
  ASSERT_EQ( doc.regions.size(), 1u );
  EXPECT_EQ( doc.regions[0].raw_content, "old\r\n" );
  EXPECT_EQ( regen::MarkerParser::serialize(doc), text );
}

TEST_F(ParserTest, MissingFinalNewline) {
  const std::string text =
    "// <generated:g:start>\n"
    "x\n"
    "// <generated:g:end>";
  const auto doc = regen::MarkerParser::parse( text, *cpp );
  ASSERT_EQ( doc.regions.size(), 1u );
  EXPECT_EQ( doc.regions[0].end_delimiter, "// <generated:g:end>" );
  EXPECT_EQ( regen::MarkerParser::serialize(doc), text );
}

// ==== Malformed documents ====

TEST_F(ParserTest, StartWithoutEnd) {
  std::size_t line = 0;
  EXPECT_EQ( parse_error_kind( "x\n// <generated:a:start>\ny\n", &line ),
    regen::ParseError::Kind::UnbalancedMarker );
  EXPECT_EQ( line, 2u );
}

TEST_F(ParserTest, EndWithoutStart) {
  std::size_t line = 0;
  EXPECT_EQ( parse_error_kind( "x\ny\n// <generated:a:end>\n", &line ),
    regen::ParseError::Kind::UnbalancedMarker );
  EXPECT_EQ( line, 3u );
}

TEST_F(ParserTest, MismatchedEnd) {
  EXPECT_EQ( parse_error_kind(
    "// <generated:a:start>\n// <generated:b:end>\n" ),
    regen::ParseError::Kind::UnbalancedMarker );
  EXPECT_EQ( parse_error_kind(
    "// <generated:a:start>\n// <guard:a:end>\n" ),
    regen::ParseError::Kind::UnbalancedMarker );
}

TEST_F(ParserTest, DuplicateId) {
  std::size_t line = 0;
  EXPECT_EQ( parse_error_kind(
    "// <generated:a:start>\n// <generated:a:end>\n"
    "// <guard:a:start>\n// <guard:a:end>\n", &line ),
    regen::ParseError::Kind::DuplicateId );
  EXPECT_EQ( line, 3u );
}

TEST_F(ParserTest, UnknownKind) {
  EXPECT_EQ( parse_error_kind( "// <widget:a:start>\n// <widget:a:end>\n" ),
    regen::ParseError::Kind::UnknownKind );
}

TEST_F(ParserTest, NestedMarkers) {
  std::size_t line = 0;
  EXPECT_EQ( parse_error_kind(
    "// <generated:outer:start>\n"
    "// <guard:inner:start>\n"
    "// <guard:inner:end>\n"
    "// <generated:outer:end>\n", &line ),
    regen::ParseError::Kind::NestedMarker );
  EXPECT_EQ( line, 2u );
}

TEST_F(ParserTest, ErrorMessageNamesFileAndLine) {
  try {
    regen::MarkerParser::parse( "\n// <guard:g:start>\n", *cpp, "src/a.cpp" );
    FAIL() << "expected ParseError";
  }
  catch ( const regen::ParseError& err ) {
    const std::string msg = err.what();
    EXPECT_NE( msg.find("src/a.cpp:2:"), std::string::npos ) << msg;
    EXPECT_NE( msg.find("never closed"), std::string::npos ) << msg;
  }
}
