#include <Lattice/IO/FileReader.hpp>
#include <Lattice/IO/RealFileSystem.hpp>

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>

#include <unistd.h>

using namespace Lattice;
using namespace Lattice::IO;

namespace
{
    /// Creates a fresh directory under the system temp path and removes it on destruction.
    class TempDirectory
    {
    public:
        TempDirectory()
        {
            static std::atomic<int> counter {0};
            m_path = std::filesystem::temp_directory_path() /
                     ("lattice-io-" + std::to_string(::getpid()) + "-" + std::to_string(counter++));
            std::filesystem::create_directories(m_path);
        }

        TempDirectory(const TempDirectory&)            = delete;
        TempDirectory& operator=(const TempDirectory&) = delete;

        ~TempDirectory()
        {
            std::error_code ignored;
            std::filesystem::remove_all(m_path, ignored);
        }

        [[nodiscard]] std::string Write(const std::string& name, const std::string& contents) const
        {
            const std::filesystem::path file = m_path / name;
            std::filesystem::create_directories(file.parent_path());
            std::ofstream out(file, std::ios::binary);
            out << contents;
            return file.string();
        }

        [[nodiscard]] std::string Path() const { return m_path.string(); }

    private:
        std::filesystem::path m_path;
    };

    struct LogCapture
    {
        int count {0};

        static void Sink(void* userData, Logging::LogLevel, std::string_view)
        {
            ++static_cast<LogCapture*>(userData)->count;
        }
    };
}// namespace

TEST_CASE("FileReader reads a file on disk", "[IO][FileReader]")
{
    TempDirectory     dir;
    const std::string path = dir.Write("data.json", "[1, 2, 3]");

    FileReader reader;
    CHECK_FALSE(reader.IsOpen());
    REQUIRE(reader.Open(path).HasValue());
    CHECK(reader.IsOpen());
    CHECK(reader.Size().Value() == 9);

    std::array<Byte, 3> head {};
    REQUIRE(reader.Peek(head).Value() == 3);
    CHECK(head[0] == static_cast<Byte>('['));
    CHECK(reader.Tell().Value() == 0);

    REQUIRE(reader.Skip(1).Value() == 1);
    auto rest = ReadAll(reader);
    REQUIRE(rest.HasValue());
    CHECK(rest.ValueUnsafe() == "1, 2, 3]");

    CHECK(reader.Skip(5).Value() == 0);
}

TEST_CASE("FileReader reports missing files and closed handles", "[IO][FileReader]")
{
    TempDirectory dir;
    FileReader    reader;

    auto opened = reader.Open(dir.Path() + "/absent.json");
    REQUIRE_FALSE(opened.HasValue());
    CHECK(opened.Error().code == IOErrorCode::NotFound);
    CHECK(opened.Error().systemCode != 0);

    std::array<Byte, 4> buffer {};
    auto                read = reader.Read(buffer);
    REQUIRE_FALSE(read.HasValue());
    CHECK(read.ErrorUnsafe().code == IOErrorCode::InvalidArgument);
}

TEST_CASE("FileReader move transfers the handle", "[IO][FileReader]")
{
    TempDirectory     dir;
    const std::string path = dir.Write("a.zon", ".{}");

    FileReader first;
    REQUIRE(first.Open(path).HasValue());
    FileReader second {std::move(first)};
    CHECK_FALSE(first.IsOpen());
    REQUIRE(second.IsOpen());
    CHECK(ReadAll(second).Value() == ".{}");
}

TEST_CASE("RealFileSystem reads, stats and lists", "[IO][RealFileSystem]")
{
    TempDirectory dir;
    (void)dir.Write("b.json", "{}");
    (void)dir.Write("a.zon", ".{ .x = 1 }");
    (void)dir.Write("sub/inner.json", "[]");

    RealFileSystem fs;

    auto file = fs.ReadFile(dir.Path() + "/a.zon");
    REQUIRE(file.HasValue());
    CHECK(file.ValueUnsafe().contents == ".{ .x = 1 }");
    CHECK(file.ValueUnsafe().DetectGrammar() == Syntax::Grammar::Zon);

    auto status = fs.Stat(dir.Path() + "/b.json");
    REQUIRE(status.HasValue());
    CHECK(status.ValueUnsafe().type == EntryType::File);
    CHECK(status.ValueUnsafe().size == 2);

    auto listing = fs.ListDirectory(dir.Path());
    REQUIRE(listing.HasValue());
    const auto& entries = listing.ValueUnsafe();
    REQUIRE(entries.size() == 3);
    CHECK(entries[0].name == "a.zon");
    CHECK(entries[1].name == "b.json");
    CHECK(entries[2].name == "sub");
    CHECK(entries[2].type == EntryType::Directory);
}

TEST_CASE("RealFileSystem follows the shared error contract", "[IO][RealFileSystem]")
{
    TempDirectory     dir;
    const std::string file = dir.Write("x.json", "1");

    LogCapture            capture;
    const Logging::Logger logger {Logging::LogLevel::Debug, &LogCapture::Sink, &capture};
    RealFileSystem        fs {&logger};

    auto missing = fs.Open(dir.Path() + "/missing.json");
    REQUIRE_FALSE(missing.HasValue());
    CHECK(missing.ErrorUnsafe().code == IOErrorCode::NotFound);
    CHECK(capture.count == 1);

    auto directory = fs.Open(dir.Path());
    REQUIRE_FALSE(directory.HasValue());
    CHECK(directory.ErrorUnsafe().code == IOErrorCode::IsADirectory);

    auto listFile = fs.ListDirectory(file);
    REQUIRE_FALSE(listFile.HasValue());
    CHECK(listFile.ErrorUnsafe().code == IOErrorCode::NotADirectory);
}
