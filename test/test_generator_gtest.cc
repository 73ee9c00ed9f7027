//  regen: guarded-region regeneration engine
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the regen authors
#include <gtest/gtest.h>

#include <atomic>
#include <cctype>
#include <stdexcept>
#include <string>

#include "../generator.hh"
#include "../markers.hh"
#include "../model.hh"

// Test suite for content generation strategies

namespace {

  class CountingRenderer : public regen::TemplateRenderer {
  public:
    mutable std::atomic< int > calls{ 0 };

    std::string render( const std::string& text,
      const regen::Bindings& bindings ) const override
    {
      ++calls;
      return regen::internal::protected_bind( text, bindings );
    }
  };

  regen::Generated static_marker( const std::string& text,
    regen::GenerationStrategy strategy = regen::GenerationStrategy::Replace )
  {
    regen::Generated m;
    m.id = "g";
    m.strategy = strategy;
    m.source.type = regen::ContentSource::Type::Static;
    m.source.text = text;
    return m;
  }

  regen::GenerationError::Kind error_kind( const regen::ContentGenerator& gen,
    const regen::MarkerType& marker, const regen::ModelSnapshot& model )
  {
    try {
      gen.generate( marker, "", model );
    }
    catch ( const regen::GenerationError& err ) {
      return err.kind();
    }
    ADD_FAILURE() << "generation succeeded";
    return regen::GenerationError::Kind::MissingContentSource;
  }

} // namespace

class GeneratorTest : public ::testing::Test {
protected:
  regen::ModelSnapshot model;
  regen::ContentGenerator gen;

  void SetUp() override {
    model = regen::ModelSnapshot::from_yaml(
      "schema:\n"
      "  name: Widget\n"
      "  fields: [id, name, email]\n"
      "theme:\n"
      "  mode: dark\n"
      "flags:\n"
      "  beta: true\n"
      "imports: [zeta, alpha]\n"
      "page:\n"
      "  title: Home\n"
      "  count: 3\n"
      "  tags: [a, b, c]\n"
      "  items:\n"
      "    - name: one\n"
      "      href: /1\n"
      "    - name: two\n"
      "      href: /2\n"
      "    - name: three\n"
      "      href: /3\n" );
  }
};

// ==== Generated ====

TEST_F(GeneratorTest, ReplaceDiscardsOldBody) {
  EXPECT_EQ( gen.generate( static_marker("fresh"), "old\nstuff\n", model ),
    "fresh" );
}

TEST_F(GeneratorTest, ValueSource) {
  regen::Generated m;
  m.id = "props";
  m.source.type = regen::ContentSource::Type::Value;
  m.source.text = "schema.fields";
  EXPECT_EQ( gen.generate( m, "", model ), "id, name, email" );

  m.source.join = "\n";
  EXPECT_EQ( gen.generate( m, "", model ), "id\nname\nemail" );

  m.source.text = "schema.name";
  EXPECT_EQ( gen.generate( m, "", model ), "Widget" );

  m.source.text = "schema.missing";
  EXPECT_EQ( error_kind( gen, m, model ),
    regen::GenerationError::Kind::MissingDataSource );

  m.source.text = "schema";
  EXPECT_EQ( error_kind( gen, m, model ),
    regen::GenerationError::Kind::MissingDataSource );
}

TEST_F(GeneratorTest, TemplateSource) {
  regen::Generated m;
  m.id = "title";
  m.source.type = regen::ContentSource::Type::Template;
  m.source.text = "const TITLE = \"{schema.name}\"; // {{literal}}";
  EXPECT_EQ( gen.generate( m, "", model ),
    "const TITLE = \"Widget\"; // {literal}" );

  m.source.text = "{schema.nope}";
  EXPECT_EQ( error_kind( gen, m, model ),
    regen::GenerationError::Kind::MissingParameter );
}

TEST_F(GeneratorTest, MissingContentSource) {
  regen::Generated m;
  m.id = "empty";
  EXPECT_EQ( error_kind( gen, m, model ),
    regen::GenerationError::Kind::MissingContentSource );
}

TEST_F(GeneratorTest, MergeUnionsLines) {
  const auto m = static_marker( "b\nc\na", regen::GenerationStrategy::Merge );
  EXPECT_EQ( gen.generate( m, "a\nb\n", model ), "a\nb\nc" );
  EXPECT_EQ( gen.generate( m, "", model ), "b\nc\na" );
}

TEST_F(GeneratorTest, IfEmptyOnlyFillsBlankBodies) {
  const auto m = static_marker( "seed", regen::GenerationStrategy::IfEmpty );
  EXPECT_EQ( gen.generate( m, "  \n\n", model ), "seed" );
  EXPECT_EQ( gen.generate( m, "mine\n", model ), "mine\n" );
}

TEST_F(GeneratorTest, AppendIsIdempotent) {
  const auto m = static_marker( "tail", regen::GenerationStrategy::Append );
  const std::string once = gen.generate( m, "head\n", model );
  EXPECT_EQ( once, "head\ntail" );
  EXPECT_EQ( gen.generate( m, once + "\n", model ), "head\ntail" );
  EXPECT_EQ( gen.generate( m, "", model ), "tail" );
}

TEST_F(GeneratorTest, PrependIsIdempotent) {
  const auto m = static_marker( "top", regen::GenerationStrategy::Prepend );
  const std::string once = gen.generate( m, "body\n", model );
  EXPECT_EQ( once, "top\nbody" );
  EXPECT_EQ( gen.generate( m, once, model ), "top\nbody" );
}

TEST_F(GeneratorTest, FunctionSource) {
  regen::FunctionRegistry functions;
  functions.add( "shout", []( const regen::FunctionContext& ctx ) {
    std::string name = ctx.model.text( "schema.name" ).value_or( "" );
    for ( auto& c : name ) c = static_cast< char >( std::toupper(c) );
    return name + ctx.arguments.at( "suffix" ).get_value< std::string >();
  } );
  functions.add( "broken", []( const regen::FunctionContext& )
    -> std::string { throw std::runtime_error( "boom" ); } );
  regen::ContentGenerator with_functions( nullptr, &functions );

  regen::Generated m;
  m.id = "f";
  m.source.type = regen::ContentSource::Type::Function;
  m.source.text = "shout";
  m.source.arguments = regen::ordered_node::deserialize( "suffix: \"!\"\n" );
  EXPECT_EQ( with_functions.generate( m, "", model ), "WIDGET!" );

  m.source.text = "broken";
  EXPECT_EQ( error_kind( with_functions, m, model ),
    regen::GenerationError::Kind::FunctionFailed );

  m.source.text = "unknown";
  EXPECT_EQ( error_kind( with_functions, m, model ),
    regen::GenerationError::Kind::UnknownFunction );
  EXPECT_EQ( error_kind( gen, m, model ),
    regen::GenerationError::Kind::UnknownFunction );

  EXPECT_TRUE( functions.contains("shout") );
  EXPECT_EQ( functions.names(),
    ( std::vector< std::string >{ "broken", "shout" } ) );
  EXPECT_THROW( functions.add( "", regen::GeneratorFunction() ),
    std::invalid_argument );
}

// ==== Conditional ====

TEST_F(GeneratorTest, IncludeAndExclude) {
  regen::Conditional m;
  m.id = "beta";
  m.condition = "flags.beta";
  m.body = "enableBeta(\"{schema.name}\");";
  EXPECT_EQ( gen.generate( m, "stale", model ), "enableBeta(\"Widget\");" );

  m.strategy = regen::ConditionalStrategy::Exclude;
  EXPECT_EQ( gen.generate( m, "stale", model ), "" );

  m.condition = "theme.mode == 'light'";
  EXPECT_EQ( gen.generate( m, "", model ), "enableBeta(\"Widget\");" );
}

TEST_F(GeneratorTest, SwitchSelectsAlternative) {
  regen::Conditional m;
  m.id = "theme";
  m.condition = "theme.mode";
  m.strategy = regen::ConditionalStrategy::Switch;
  m.alternatives = { { "light", "bg = white" }, { "dark", "bg = black" } };
  EXPECT_EQ( gen.generate( m, "", model ), "bg = black" );

  m.condition = "'sepia'";
  EXPECT_EQ( error_kind( gen, m, model ),
    regen::GenerationError::Kind::UnevaluableCondition );

  m.alternatives.emplace_back( "default", "bg = grey" );
  EXPECT_EQ( gen.generate( m, "", model ), "bg = grey" );
}

TEST_F(GeneratorTest, UnevaluableCondition) {
  regen::Conditional m;
  m.id = "c";
  m.condition = "flags.unknown";
  EXPECT_EQ( error_kind( gen, m, model ),
    regen::GenerationError::Kind::UnevaluableCondition );
  m.condition = "flags.beta ==";
  EXPECT_EQ( error_kind( gen, m, model ),
    regen::GenerationError::Kind::UnevaluableCondition );
}

// ==== Import ====

TEST_F(GeneratorTest, ImportKeepExisting) {
  regen::Import m;
  m.id = "deps";
  m.merge_strategy = regen::ImportMergeStrategy::KeepExisting;
  m.required = { "Y" };
  m.format = "import {item};";
  EXPECT_EQ( gen.generate( m, "import X;\n", model ),
    "import X;\nimport Y;" );
  // Already present entries are not repeated
  EXPECT_EQ( gen.generate( m, "import Y;\nimport X;\n", model ),
    "import Y;\nimport X;" );
}

TEST_F(GeneratorTest, ImportReplaceAndMerge) {
  regen::Import m;
  m.id = "deps";
  m.required = { "m1", "m2", "m1" };
  m.source = "imports";

  m.merge_strategy = regen::ImportMergeStrategy::Replace;
  EXPECT_EQ( gen.generate( m, "manual\n", model ), "m1\nm2\nzeta\nalpha" );

  m.merge_strategy = regen::ImportMergeStrategy::Merge;
  EXPECT_EQ( gen.generate( m, "manual\n\n  m2  \n", model ),
    "alpha\nm1\nm2\nmanual\nzeta" );

  m.source = "no.such.list";
  EXPECT_EQ( error_kind( gen, m, model ),
    regen::GenerationError::Kind::MissingDataSource );
}

// ==== Template ====

TEST_F(GeneratorTest, TemplateParameters) {
  regen::Template m;
  m.id = "header";
  m.body = "<h1>{title}</h1><p>{count} items, {tags}</p>";
  m.parameters.push_back( { "title", regen::ParameterType::String,
    "page.title", std::nullopt, true } );
  m.parameters.push_back( { "count", regen::ParameterType::Integer,
    "page.count", std::nullopt, true } );
  m.parameters.push_back( { "tags", regen::ParameterType::List,
    "page.tags", std::nullopt, true } );
  EXPECT_EQ( gen.generate( m, "", model ),
    "<h1>Home</h1><p>3 items, a, b, c</p>" );
}

TEST_F(GeneratorTest, TemplateParameterDefaults) {
  regen::Template m;
  m.id = "footer";
  m.body = "[{note}][{extra}]";
  m.parameters.push_back( { "note", regen::ParameterType::Any,
    "page.note", std::string( "none" ), true } );
  m.parameters.push_back( { "extra", regen::ParameterType::Any,
    "page.extra", std::nullopt, false } );
  EXPECT_EQ( gen.generate( m, "", model ), "[none][]" );

  m.parameters.push_back( { "must", regen::ParameterType::Any,
    "page.must", std::nullopt, true } );
  EXPECT_EQ( error_kind( gen, m, model ),
    regen::GenerationError::Kind::MissingParameter );
}

TEST_F(GeneratorTest, TemplateParameterType) {
  regen::Template m;
  m.id = "typed";
  m.body = "{n}";
  m.parameters.push_back( { "n", regen::ParameterType::Integer,
    "page.title", std::nullopt, true } );
  EXPECT_EQ( error_kind( gen, m, model ),
    regen::GenerationError::Kind::MissingParameter );
}

TEST_F(GeneratorTest, IterationOverScalars) {
  regen::Template m;
  m.id = "list";
  m.body = "\"{item}\"";
  m.iteration = regen::IterationSettings{ "page.tags", "item", std::nullopt,
    ",\n" };
  const std::string out = gen.generate( m, "", model );
  EXPECT_EQ( out, "\"a\",\n\"b\",\n\"c\"" );
}

TEST_F(GeneratorTest, IterationOverMappings) {
  regen::Template m;
  m.id = "links";
  m.body = "<a id=\"{i}\" href=\"{link.href}\">{link.name} of {title}</a>";
  m.parameters.push_back( { "title", regen::ParameterType::String,
    "page.title", std::nullopt, true } );
  m.iteration = regen::IterationSettings{ "page.items", "link",
    std::string( "i" ), "\n" };
  EXPECT_EQ( gen.generate( m, "", model ),
    "<a id=\"0\" href=\"/1\">one of Home</a>\n"
    "<a id=\"1\" href=\"/2\">two of Home</a>\n"
    "<a id=\"2\" href=\"/3\">three of Home</a>" );
}

TEST_F(GeneratorTest, IterationErrors) {
  regen::Template m;
  m.id = "rows";
  m.body = "{item}";
  m.iteration = regen::IterationSettings{ "page.rows", "item", std::nullopt,
    "\n" };
  EXPECT_EQ( error_kind( gen, m, model ),
    regen::GenerationError::Kind::MissingDataSource );

  m.iteration->data_source = "page.title";
  EXPECT_EQ( error_kind( gen, m, model ),
    regen::GenerationError::Kind::MissingDataSource );

  m.iteration->data_source = "page.items";
  m.body = "{item.colour}";
  EXPECT_EQ( error_kind( gen, m, model ),
    regen::GenerationError::Kind::MissingParameter );
}

// ==== Renderer seam ====

TEST_F(GeneratorTest, CustomRendererIsUsed) {
  CountingRenderer renderer;
  regen::ContentGenerator counting( &renderer );

  regen::Template m;
  m.id = "rows";
  m.body = "{item}";
  m.iteration = regen::IterationSettings{ "schema.fields", "item",
    std::nullopt, " " };
  EXPECT_EQ( counting.generate( m, "", model ), "id name email" );
  EXPECT_EQ( renderer.calls.load(), 3 );
  EXPECT_EQ( counting.invocations(), 1u );
}

TEST_F(GeneratorTest, GuardIsRejected) {
  regen::Guard g;
  g.id = "logic";
  EXPECT_THROW( gen.generate( g, "", model ), std::logic_error );
}
