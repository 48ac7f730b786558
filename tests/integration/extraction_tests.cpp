/**
 * Integration tests for extracting untrusted directory content
 *
 * Entries are fed through safe_repository_join and written to disk under a
 * temporary workdir, the way an archive or patch extractor would. After each
 * run the tree is walked to confirm nothing was written outside the root.
 */

#include <doctest/doctest.h>
#include <pathguard/pathguard.hpp>

#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using namespace pathguard;

namespace {

class TempTestDir {
public:
    TempTestDir() {
        static int counter = 0;
        std::srand(static_cast<unsigned>(std::time(nullptr)));
        std::string unique_name = "pathguard_extract_" + std::to_string(std::time(nullptr)) +
                                  "_" + std::to_string(std::rand()) + "_" +
                                  std::to_string(++counter);
        path = fs::temp_directory_path() / unique_name;
        fs::create_directories(path);
    }

    ~TempTestDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    fs::path path;
};

struct Entry {
    std::string path;
    std::string content;
};

struct ExtractReport {
    std::vector<fs::path> written;
    std::vector<Violation> rejected;
};

ExtractReport extract(const fs::path& root, const fs::path& target,
                      const std::vector<Entry>& entries) {
    ExtractReport report;
    for (const auto& entry : entries) {
        auto dest = safe_repository_join(root, target, entry.path);
        if (!dest) {
            report.rejected.push_back(dest.error);
            continue;
        }
        fs::create_directories(dest.value.parent_path());
        std::ofstream out(dest.value, std::ios::binary);
        out << entry.content;
        report.written.push_back(dest.value);
    }
    return report;
}

bool is_within(const fs::path& child, const fs::path& root) {
    auto c = child.begin();
    for (auto r = root.begin(); r != root.end(); ++r, ++c) {
        if (c == child.end() || *c != *r) return false;
    }
    return true;
}

} // namespace

TEST_CASE("extraction keeps every written file under the workdir") {
    TempTestDir outer;
    fs::path root = outer.path / "workdir";
    fs::create_directories(root);
    auto canonical_root = fs::canonical(root);

    std::vector<Entry> entries = {
        {"/args.js", "module.exports = {};"},
        {"src/config.js", "export default 1;"},
        {"lib\\util.js", "util"},
        {"docs//guide.md", "# guide"},
        {"../escape.txt", "nope"},
        {"lib/../../../etc/passwd", "nope"},
        {"/../etc/shadow", "nope"},
        {"CON", "nope"},
        {"lib/aux.js", "nope"},
        {std::string("bad\0name", 8), "nope"},
        {"file|pipe", "nope"},
        {"", "nope"},
    };

    auto report = extract(root, "testing/framework", entries);

    CHECK(report.written.size() == 4);
    CHECK(report.rejected.size() == 8);

    CHECK(fs::exists(canonical_root / "testing" / "framework" / "args.js"));
    CHECK(fs::exists(canonical_root / "testing" / "framework" / "src" / "config.js"));
    CHECK(fs::exists(canonical_root / "testing" / "framework" / "lib" / "util.js"));
    CHECK(fs::exists(canonical_root / "testing" / "framework" / "docs" / "guide.md"));

    SUBCASE("nothing escaped into the parent directory") {
        CHECK_FALSE(fs::exists(outer.path / "escape.txt"));
        for (const auto& entry : fs::directory_iterator(outer.path)) {
            CHECK(entry.path().filename() == "workdir");
        }
    }

    SUBCASE("every file on disk is inside the canonical root") {
        for (const auto& entry : fs::recursive_directory_iterator(root)) {
            CHECK(is_within(fs::canonical(entry.path()), canonical_root));
        }
    }

    SUBCASE("rejections carry the expected kinds") {
        int traversal = 0;
        int reserved = 0;
        int invalid = 0;
        int empty = 0;
        for (const auto& v : report.rejected) {
            switch (v.kind) {
                case ViolationKind::Traversal: ++traversal; break;
                case ViolationKind::ReservedName: ++reserved; break;
                case ViolationKind::InvalidCharacters: ++invalid; break;
                case ViolationKind::Empty: ++empty; break;
                default: break;
            }
        }
        CHECK(traversal == 3);
        CHECK(reserved == 2);
        CHECK(invalid == 2);
        CHECK(empty == 1);
    }
}

TEST_CASE("extraction through a symlinked workdir writes to the real directory") {
    TempTestDir outer;
    fs::path real = outer.path / "real";
    fs::path link = outer.path / "link";
    fs::create_directories(real);

    std::error_code ec;
    fs::create_directory_symlink(real, link, ec);
    if (ec) {
        MESSAGE("symlinks unavailable, skipping: " << ec.message());
        return;
    }

    auto report = extract(link, "", {{"pkg/index.js", "x"}, {"../outside.js", "y"}});

    REQUIRE(report.written.size() == 1);
    CHECK(report.written[0] == fs::canonical(real) / "pkg" / "index.js");
    CHECK(fs::exists(real / "pkg" / "index.js"));
    CHECK_FALSE(fs::exists(outer.path / "outside.js"));
    REQUIRE(report.rejected.size() == 1);
    CHECK(report.rejected[0].kind == ViolationKind::Traversal);
}

TEST_CASE("extraction into a missing workdir rejects every entry") {
    TempTestDir outer;
    auto report = extract(outer.path / "does-not-exist", "", {{"a.txt", "a"}, {"b/c.txt", "c"}});

    CHECK(report.written.empty());
    REQUIRE(report.rejected.size() == 2);
    for (const auto& v : report.rejected) {
        CHECK(v.kind == ViolationKind::Io);
        CHECK(v.message.find("Cannot canonicalize workdir") == 0);
    }
    CHECK_FALSE(fs::exists(outer.path / "does-not-exist"));
}
