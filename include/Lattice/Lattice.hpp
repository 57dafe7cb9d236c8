#pragma once
#include <Lattice/Analysis/DocumentStatistics.hpp>
#include <Lattice/Analysis/JsonSchema.hpp>
#include <Lattice/Analysis/SchemaAnalyzer.hpp>
#include <Lattice/Analysis/SymbolExtractor.hpp>
#include <Lattice/Analysis/ZonManifest.hpp>
#include <Lattice/Config/LintConfig.hpp>
#include <Lattice/Defines.hpp>
#include <Lattice/IO/FileReader.hpp>
#include <Lattice/IO/IByteReader.hpp>
#include <Lattice/IO/IFileSystem.hpp>
#include <Lattice/IO/IOError.hpp>
#include <Lattice/IO/MemoryFileSystem.hpp>
#include <Lattice/IO/MemoryReader.hpp>
#include <Lattice/IO/RealFileSystem.hpp>
#include <Lattice/IO/SourceFile.hpp>
#include <Lattice/Lint/Diagnostic.hpp>
#include <Lattice/Lint/Linter.hpp>
#include <Lattice/Lint/Rule.hpp>
#include <Lattice/Logging/Logger.hpp>
#include <Lattice/Memory/Arena.hpp>
#include <Lattice/Memory/SystemAllocator.hpp>
#include <Lattice/Primitives.hpp>
#include <Lattice/Syntax/ContextStack.hpp>
#include <Lattice/Syntax/Escapes.hpp>
#include <Lattice/Syntax/Grammar.hpp>
#include <Lattice/Syntax/Identifier.hpp>
#include <Lattice/Syntax/JsonLexer.hpp>
#include <Lattice/Syntax/NumberText.hpp>
#include <Lattice/Syntax/ParseError.hpp>
#include <Lattice/Syntax/Parser.hpp>
#include <Lattice/Syntax/SourceCursor.hpp>
#include <Lattice/Syntax/SyntaxTree.hpp>
#include <Lattice/Syntax/Token.hpp>
#include <Lattice/Syntax/TokenStream.hpp>
#include <Lattice/Syntax/TreeWriter.hpp>
#include <Lattice/Syntax/ZonLexer.hpp>
#include <Lattice/Text/Span.hpp>
#include <Lattice/Text/Utf8.hpp>
#include <Lattice/Utilities/Expected.hpp>
