#include <catch2/catch_test_macros.hpp>
#include <Emitter.hpp>
#include <Errors.hpp>
#include <Hoisting.hpp>
#include <ImportReference.hpp>
#include <StaticGraph.hpp>

using namespace esmc;

static ImportReference makeReference(const std::string &specifier, ImportAnnotations annotations = {}, bool importExternals = false)
{
    return ImportReference{ResolveOrigin{"src/index.js"}, Request::parse(specifier), std::move(annotations), std::nullopt, std::nullopt, importExternals};
}

static ImportAnnotations chunkingType(const std::string &value)
{
    return ImportAnnotations{{{std::string{ImportAnnotations::chunkingTypeKey}, value}}};
}

// Applies the generated code to an empty module and prints everything above the hoisting marker
static std::string generate(const CodeGeneration &generation)
{
    Program program{Program::Kind::Module};
    applyCodeGeneration(program, {generation});
    std::string result;
    for (auto &item : program.body)
        if (!isHoistingMarker(item))
            result += emit(item) + '\n';
    return result;
}

SCENARIO("Chunking policy")
{
    THEN("A missing annotation or \"parallel\" chunk in parallel")
    {
        REQUIRE(makeReference("./a").chunkingPolicy() == ChunkingPolicy::ParallelInheritAsync);
        REQUIRE(makeReference("./a", chunkingType("parallel")).chunkingPolicy() == ChunkingPolicy::ParallelInheritAsync);
    }

    THEN("\"none\" excludes the reference")
    {
        REQUIRE(makeReference("./a", chunkingType("none")).chunkingPolicy() == ChunkingPolicy::Excluded);
    }

    THEN("Anything else is a configuration error naming the value")
    {
        auto reference = makeReference("./a", chunkingType("bogus"));
        REQUIRE_THROWS_AS(reference.chunkingPolicy(), ConfigError);
        REQUIRE_THROWS_WITH(reference.chunkingPolicy(), "unknown chunking_type: bogus");
    }
}

SCENARIO("Code generation for import references")
{
    auto a = std::make_shared<const StaticModule>("src/a.js");
    StaticResolver resolver;
    resolver.add("src/index.js", "./a", ResolveResult::module(a));
    resolver.add("src/index.js", "fs", ResolveResult::external("fs"));
    resolver.add("src/index.js", "./ignored", ResolveResult::ignore());
    resolver.add("src/index.js", "./logo.png", ResolveResult::module(std::make_shared<const StaticAsset>("logo.png")));
    StaticChunkingContext context;

    GIVEN("A reference to a bundled module")
    {
        THEN("It is imported by the id of its chunk item")
        {
            REQUIRE(generate(makeReference("./a").codeGeneration(resolver, context)) ==
                    "var __TURBOPACK__imported__module__src$2f$a$2e$js__ = __turbopack_import__(\"src/a.js\");\n");
            context.setId("src/a.js", uint32_t{3});
            REQUIRE(generate(makeReference("./a").codeGeneration(resolver, context)) ==
                    "var __TURBOPACK__imported__module__src$2f$a$2e$js__ = __turbopack_import__(3);\n");
        }

        THEN("Classification and identifier agree")
        {
            auto [asset, ident] = makeReference("./a").classifyAndIdentify(resolver);
            REQUIRE(asset.isInternal());
            REQUIRE(ident == identForModule(*a));
        }
    }

    GIVEN("A reference to an external module")
    {
        THEN("It is required unless externals are imported as ESM")
        {
            REQUIRE(generate(makeReference("fs").codeGeneration(resolver, context)) ==
                    "var __TURBOPACK__external__fs__ = __turbopack_external_require__(\"fs\", true);\n");
            REQUIRE(generate(makeReference("fs", {}, true).codeGeneration(resolver, context)) ==
                    "var __TURBOPACK__external__fs__ = __turbopack_external_import__(\"fs\");\n");
        }

        WHEN("The environment cannot load externals")
        {
            context.setEnvironment({"edge", false});
            THEN("Code generation fails naming the request")
            {
                REQUIRE_THROWS_AS(makeReference("fs").codeGeneration(resolver, context), UnsupportedFeature);
                REQUIRE_THROWS_WITH(makeReference("fs", {}, true).codeGeneration(resolver, context),
                                    "the chunking context does not support external modules (request: fs)");
            }
        }
    }

    GIVEN("A reference that does not resolve")
    {
        const std::string expected = "(() => { const e = new Error(\"Cannot find module './missing'\"); e.code = \"MODULE_NOT_FOUND\"; throw e; })();\n";

        THEN("A single throwing statement is hoisted whatever the chunking policy")
        {
            for (auto &annotations : {ImportAnnotations{}, chunkingType("parallel"), chunkingType("none")})
            {
                auto generation = makeReference("./missing", annotations).codeGeneration(resolver, context);
                REQUIRE(generation.visitors.size() == 1);
                REQUIRE(generate(generation) == expected);
            }
        }

        THEN("An unknown chunking type is still a configuration error")
        {
            REQUIRE_THROWS_AS(makeReference("./missing", chunkingType("bogus")).codeGeneration(resolver, context), ConfigError);
            REQUIRE_THROWS_WITH(makeReference("./missing", chunkingType("bogus")).codeGeneration(resolver, context), "unknown chunking_type: bogus");
        }

        THEN("External support is not required")
        {
            context.setEnvironment({"edge", false});
            REQUIRE(generate(makeReference("./missing").codeGeneration(resolver, context)) == expected);
        }
    }

    GIVEN("An excluded reference")
    {
        THEN("Nothing is generated, not even for externals the environment cannot load")
        {
            REQUIRE(makeReference("./a", chunkingType("none")).codeGeneration(resolver, context).empty());
            context.setEnvironment({"edge", false});
            REQUIRE(makeReference("fs", chunkingType("none")).codeGeneration(resolver, context).empty());
        }
    }

    GIVEN("References that resolve to nothing chunkable")
    {
        THEN("Nothing is generated")
        {
            REQUIRE(makeReference("./ignored").codeGeneration(resolver, context).empty());
            REQUIRE(makeReference("./logo.png").codeGeneration(resolver, context).empty());
        }
    }

    GIVEN("An unknown chunking type on a resolvable reference")
    {
        THEN("Code generation fails")
        {
            REQUIRE_THROWS_AS(makeReference("./a", chunkingType("bogus")).codeGeneration(resolver, context), ConfigError);
        }
    }

    GIVEN("Two references importing the same module")
    {
        THEN("The import statement is hoisted once")
        {
            Program program{Program::Kind::Module};
            applyCodeGeneration(program, {makeReference("./a").codeGeneration(resolver, context),
                                          makeReference("./a").codeGeneration(resolver, context)});
            REQUIRE(program.body.size() == 2);
        }
    }
}

SCENARIO("Transitions and parts")
{
    auto client = std::make_shared<const StaticModule>("src/a.js");
    auto server = std::make_shared<const StaticModule>("src/a.server.js");
    StaticResolver resolver;
    resolver.add("src/index.js", "./a", ResolveResult::module(client));
    resolver.add("src/index.js", "./a", ResolveResult::module(server), "ssr");

    GIVEN("A reference annotated with a transition")
    {
        auto reference = makeReference("./a", ImportAnnotations{{{std::string{ImportAnnotations::transitionKey}, "ssr"}}});
        THEN("It resolves from the transitioned origin")
        {
            REQUIRE(reference.effectiveOrigin() == ResolveOrigin{"src/index.js", "ssr"});
            auto asset = reference.referencedAsset(resolver);
            REQUIRE(std::get<ReferencedAsset::Internal>(asset.data).module == server);
        }
    }

    GIVEN("A reference without a transition")
    {
        THEN("It resolves from its own origin")
        {
            REQUIRE(std::get<ReferencedAsset::Internal>(makeReference("./a").referencedAsset(resolver).data).module == client);
        }
    }

    GIVEN("A reference for a single export")
    {
        ImportReference reference{ResolveOrigin{"src/index.js"}, Request::parse("./a"), {}, std::nullopt, "default"};
        THEN("It resolves as an import part")
        {
            REQUIRE(reference.subType().isImportPart());
            REQUIRE(reference.subType().toString() == "import part default");
            REQUIRE_FALSE(makeReference("./a").subType().isImportPart());
        }
    }
}

SCENARIO("Describing and comparing references")
{
    THEN("A reference prints its request and annotations")
    {
        REQUIRE(makeReference("./a").toString() == "import ./a {}");
        auto annotations = chunkingType("none");
        annotations.set(std::string{ImportAnnotations::transitionKey}, "ssr");
        REQUIRE(makeReference("./a", annotations).toString() == "import ./a { turbopack-chunking-type: none, turbopack-transition: ssr }");
    }

    THEN("Setting an annotation twice keeps its first position")
    {
        auto annotations = chunkingType("none");
        annotations.set(std::string{ImportAnnotations::transitionKey}, "ssr");
        annotations.set(std::string{ImportAnnotations::chunkingTypeKey}, "parallel");
        REQUIRE(annotations.entries().size() == 2);
        REQUIRE(annotations.chunkingType() == "parallel");
        REQUIRE(annotations.entries().front().first == ImportAnnotations::chunkingTypeKey);
    }

    THEN("References with equal fields are equal and hash equally")
    {
        REQUIRE(makeReference("./a") == makeReference("./a"));
        REQUIRE(std::hash<ImportReference>()(makeReference("./a")) == std::hash<ImportReference>()(makeReference("./a")));
        REQUIRE_FALSE(makeReference("./a") == makeReference("./b"));
        REQUIRE_FALSE(makeReference("./a") == makeReference("./a", {}, true));
        REQUIRE_FALSE(makeReference("./a") == makeReference("./a", chunkingType("none")));
    }
}
