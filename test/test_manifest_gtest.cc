//  regen: guarded-region regeneration engine
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the regen authors
#include <gtest/gtest.h>

#include <string>
#include <variant>

#include "../manifest.hh"
#include "../markers.hh"
#include "../profiles.hh"

// Test suite for manifest loading and marker attribute resolution

namespace {

  const std::string MANIFEST =
    "settings:\n"
    "  workers: 3\n"
    "  indent_generated: false\n"
    "markers:\n"
    "  props:\n"
    "    kind: generated\n"
    "    strategy: merge\n"
    "    value: schema.fields\n"
    "    join: \"; \"\n"
    "    depends_on: [schema]\n"
    "  banner:\n"
    "    kind: conditional\n"
    "    condition: theme.mode\n"
    "    strategy: switch\n"
    "    alternatives:\n"
    "      dark: \"<dark/>\"\n"
    "      default: \"<light/>\"\n"
    "  deps:\n"
    "    kind: import\n"
    "    import_type: local\n"
    "    merge: keep_existing\n"
    "    required: [a, b]\n"
    "    source: imports\n"
    "    format: \"import {item};\"\n"
    "  rows:\n"
    "    kind: template\n"
    "    body: \"<li>{item.name}</li>\"\n"
    "    parameters:\n"
    "      title: page.title\n"
    "      count:\n"
    "        type: integer\n"
    "        from: page.count\n"
    "        default: 0\n"
    "        required: false\n"
    "    iteration:\n"
    "      data_source: page.items\n"
    "      index_var: i\n"
    "      separator: \",\"\n"
    "files:\n"
    "  src/view.ts:\n"
    "    markers:\n"
    "      props:\n"
    "        strategy: append\n"
    "      logic:\n"
    "        kind: guard\n"
    "        preserve_indent: false\n"
    "        default: \"// fill in\"\n";

  std::string load_error( const std::string& yaml ) {
    try {
      regen::Manifest::from_yaml( yaml );
    }
    catch ( const regen::ManifestError& err ) {
      return err.what();
    }
    return std::string();
  }

} // namespace

class ManifestTest : public ::testing::Test {
protected:
  regen::Manifest manifest;

  void SetUp() override {
    manifest = regen::Manifest::from_yaml( MANIFEST );
  }
};

// ==== Loading ====

TEST_F(ManifestTest, Settings) {
  EXPECT_EQ( manifest.settings().workers, 3u );
  EXPECT_FALSE( manifest.settings().indent_generated );
  EXPECT_EQ( manifest.files(), std::vector< std::string >{ "src/view.ts" } );

  const regen::Manifest empty = regen::Manifest::from_yaml( "" );
  EXPECT_EQ( empty.settings().workers, 1u );
  EXPECT_TRUE( empty.settings().indent_generated );
}

TEST_F(ManifestTest, GeneratedEntry) {
  const auto marker = manifest.marker_for( "other.ts",
    regen::MarkerKind::Generated, "props" );
  const auto& m = std::get< regen::Generated >( marker );
  EXPECT_EQ( m.id, "props" );
  EXPECT_EQ( m.strategy, regen::GenerationStrategy::Merge );
  EXPECT_EQ( m.source.type, regen::ContentSource::Type::Value );
  EXPECT_EQ( m.source.text, "schema.fields" );
  EXPECT_EQ( m.source.join, "; " );
  EXPECT_EQ( m.dependency_keys, std::vector< std::string >{ "schema" } );
}

TEST_F(ManifestTest, PerFileEntriesAreMerged) {
  const auto marker = manifest.marker_for( "src/view.ts",
    regen::MarkerKind::Generated, "props" );
  const auto& m = std::get< regen::Generated >( marker );
  EXPECT_EQ( m.strategy, regen::GenerationStrategy::Append );
  EXPECT_EQ( m.source.text, "schema.fields" );

  const auto guard = std::get< regen::Guard >( manifest.marker_for(
    "src/view.ts", regen::MarkerKind::Guard, "logic" ) );
  EXPECT_FALSE( guard.preserve_indent );
  ASSERT_TRUE( guard.default_content.has_value() );
  EXPECT_EQ( *guard.default_content, "// fill in" );
}

TEST_F(ManifestTest, ConditionalEntry) {
  const auto m = std::get< regen::Conditional >( manifest.marker_for(
    "x.html", regen::MarkerKind::Conditional, "banner" ) );
  EXPECT_EQ( m.condition, "theme.mode" );
  EXPECT_EQ( m.strategy, regen::ConditionalStrategy::Switch );
  ASSERT_EQ( m.alternatives.size(), 2u );
  EXPECT_EQ( m.alternatives[0].first, "dark" );
  EXPECT_EQ( m.alternatives[0].second, "<dark/>" );
  EXPECT_EQ( m.alternatives[1].first, "default" );
}

TEST_F(ManifestTest, ImportEntry) {
  const auto m = std::get< regen::Import >( manifest.marker_for(
    "x.ts", regen::MarkerKind::Import, "deps" ) );
  EXPECT_EQ( m.import_type, regen::ImportType::Local );
  EXPECT_EQ( m.merge_strategy, regen::ImportMergeStrategy::KeepExisting );
  EXPECT_EQ( m.required, ( std::vector< std::string >{ "a", "b" } ) );
  EXPECT_EQ( m.source, "imports" );
  EXPECT_EQ( m.format, "import {item};" );
}

TEST_F(ManifestTest, TemplateEntry) {
  const auto m = std::get< regen::Template >( manifest.marker_for(
    "x.html", regen::MarkerKind::Template, "rows" ) );
  EXPECT_EQ( m.body, "<li>{item.name}</li>" );
  ASSERT_EQ( m.parameters.size(), 2u );
  EXPECT_EQ( m.parameters[0].name, "title" );
  EXPECT_EQ( m.parameters[0].from, "page.title" );
  EXPECT_TRUE( m.parameters[0].required );
  EXPECT_EQ( m.parameters[1].name, "count" );
  EXPECT_EQ( m.parameters[1].type, regen::ParameterType::Integer );
  ASSERT_TRUE( m.parameters[1].default_value.has_value() );
  EXPECT_EQ( *m.parameters[1].default_value, "0" );
  EXPECT_FALSE( m.parameters[1].required );
  ASSERT_TRUE( m.iteration.has_value() );
  EXPECT_EQ( m.iteration->data_source, "page.items" );
  EXPECT_EQ( m.iteration->item_var, "item" );
  EXPECT_EQ( m.iteration->index_var, std::optional< std::string >("i") );
  EXPECT_EQ( m.iteration->separator, "," );
}

TEST_F(ManifestTest, MarkersWithoutEntryGetDefaults) {
  const auto m = std::get< regen::Import >( manifest.marker_for(
    "x.ts", regen::MarkerKind::Import, "unlisted" ) );
  EXPECT_EQ( m.id, "unlisted" );
  EXPECT_EQ( m.merge_strategy, regen::ImportMergeStrategy::Merge );
  EXPECT_EQ( m.import_type, regen::ImportType::Module );

  const auto g = std::get< regen::Guard >( manifest.marker_for(
    "x.ts", regen::MarkerKind::Guard, "unlisted" ) );
  EXPECT_TRUE( g.preserve_indent );
  EXPECT_FALSE( g.default_content.has_value() );
}

TEST_F(ManifestTest, KindMismatch) {
  EXPECT_THROW( manifest.marker_for( "x.ts", regen::MarkerKind::Template,
    "props" ), regen::ManifestError );
}

TEST_F(ManifestTest, ApplyToDocument) {
  const std::string text =
    "// <guard:logic:start>\n"
    "// <guard:logic:end>\n"
    "// <generated:props:start>\n"
    "// <generated:props:end>\n";
  regen::ParsedDocument doc = regen::MarkerParser::parse( text,
    regen::profile_for("ts"), "src/view.ts" );
  manifest.apply( doc );
  EXPECT_FALSE( std::get< regen::Guard >( doc.regions[0].marker )
    .preserve_indent );
  EXPECT_EQ( std::get< regen::Generated >( doc.regions[1].marker ).strategy,
    regen::GenerationStrategy::Append );
}

// ==== Validation ====

TEST(ManifestValidationTest, RejectsBadEntries) {
  EXPECT_NE( load_error( "markers:\n  a:\n    kind: generated\n"
    "    strategy: sometimes\n" ).find( "unknown generation strategy" ),
    std::string::npos );
  EXPECT_NE( load_error( "markers:\n  a:\n    kind: gadget\n" )
    .find( "unknown marker kind" ), std::string::npos );
  EXPECT_NE( load_error( "markers:\n  a:\n    kind: guard\n    colour: red\n" )
    .find( "unknown attribute 'colour'" ), std::string::npos );
  EXPECT_NE( load_error( "markers:\n  a:\n    kind: generated\n"
    "    text: x\n    value: y\n" ).find( "at most one" ), std::string::npos );
  EXPECT_NE( load_error( "markers:\n  a:\n    kind: conditional\n"
    "    strategy: switch\n" ).find( "alternatives" ), std::string::npos );
  EXPECT_NE( load_error( "markers:\n  a:\n    kind: template\n"
    "    iteration:\n      item_var: x\n" ).find( "data_source" ),
    std::string::npos );
  EXPECT_NE( load_error( "settings:\n  workers: 0\n" ).find( "workers" ),
    std::string::npos );
  EXPECT_NE( load_error( "setting:\n  workers: 2\n" )
    .find( "unknown top-level key" ), std::string::npos );
  EXPECT_NE( load_error( "- a\n- b\n" ).find( "mapping" ), std::string::npos );
}

TEST(ManifestValidationTest, ErrorsNameTheLocation) {
  const std::string msg = load_error(
    "files:\n"
    "  src/a.ts:\n"
    "    markers:\n"
    "      deps:\n"
    "        kind: import\n"
    "        merge: sometimes\n" );
  EXPECT_NE( msg.find("files.src/a.ts.markers.deps.merge"), std::string::npos )
    << msg;
}
