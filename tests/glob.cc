#include "helpers.hpp"

#include "Glob.hpp"

#include <boost/ut.hpp>
#include <filesystem>
#include <vector>

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;

  "isGlobPattern"_test = [] {
    expect(weld::isGlobPattern("src/*.rs"));
    expect(weld::isGlobPattern("file?.txt"));
    expect(weld::isGlobPattern("[ab].wit"));
    expect(!weld::isGlobPattern("src/main.rs"));
  };

  "matchGlob"_test = [] {
    expect(weld::matchGlob("*.rs", "main.rs"));
    expect(!weld::matchGlob("*.rs", "src/main.rs"));
    expect(weld::matchGlob("src/*.rs", "src/main.rs"));
    expect(weld::matchGlob("src/**/*.rs", "src/main.rs"));
    expect(weld::matchGlob("src/**/*.rs", "src/a/b/lib.rs"));
    expect(!weld::matchGlob("src/**/*.rs", "test/lib.rs"));
    expect(weld::matchGlob("file?.txt", "file1.txt"));
    expect(!weld::matchGlob("file?.txt", "file10.txt"));
    expect(weld::matchGlob("[a-c].wit", "b.wit"));
    expect(!weld::matchGlob("[!a-c].wit", "b.wit"));
    expect(weld::matchGlob("./out/*", "out/x"));
  };

  "expandGlob"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(tmp / "src/main.rs", "");
    tests::writeFile(tmp / "src/lib.rs", "");
    tests::writeFile(tmp / "src/util/io.rs", "");
    tests::writeFile(tmp / "src/README.md", "");

    const auto shallow = weld::expandGlob(tmp.path, "src/*.rs").unwrap();
    expect(shallow
           == std::vector<std::filesystem::path>{ tmp / "src/lib.rs",
                                                  tmp / "src/main.rs" });

    const auto deep = weld::expandGlob(tmp.path, "src/**/*.rs").unwrap();
    expect(deep.size() == 3U);
    expect(deep.back() == tmp / "src/util/io.rs");

    const auto literal = weld::expandGlob(tmp.path, "src/README.md").unwrap();
    expect(literal == std::vector<std::filesystem::path>{ tmp / "src/README.md" });

    expect(weld::expandGlob(tmp.path, "src/missing.rs").unwrap().empty());
    expect(weld::expandGlob(tmp.path, "nowhere/*.rs").unwrap().empty());
    expect(weld::expandGlob(tmp.path, "src/*.go").unwrap().empty());

    const auto absolute =
        weld::expandGlob("/unused", (tmp / "src/*.md").string()).unwrap();
    expect(absolute.size() == 1U);
  };
}
