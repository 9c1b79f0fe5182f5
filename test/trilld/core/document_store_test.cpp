#include "trilld/core/document_store.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using lsp::error::LspErrorCode;
using trilld::ClosePolicy;
using trilld::DocumentStore;

TEST_CASE("DocumentStore returns the text that was stored", "[store]") {
  DocumentStore store;
  store.Open("file:///a.sv", "module a; endmodule");

  auto state = store.Get("file:///a.sv");
  REQUIRE(state.has_value());
  REQUIRE((*state)->text == "module a; endmodule");
  REQUIRE(store.Contains("file:///a.sv"));
  REQUIRE(store.Size() == 1);
}

TEST_CASE("DocumentStore replaces the whole text on update", "[store]") {
  DocumentStore store;
  store.Open("file:///a.sv", "first");

  auto before = store.Get("file:///a.sv");
  store.Update("file:///a.sv", "second");
  auto after = store.Get("file:///a.sv");

  REQUIRE(after.has_value());
  REQUIRE((*after)->text == "second");
  REQUIRE(store.Size() == 1);

  // Earlier snapshots are never mutated
  REQUIRE(before.has_value());
  REQUIRE((*before)->text == "first");
}

TEST_CASE("DocumentStore reports unknown documents", "[store]") {
  DocumentStore store;

  auto state = store.Get("file:///missing.sv");
  REQUIRE_FALSE(state.has_value());
  REQUIRE(state.error().Code() == LspErrorCode::kDocumentNotFound);
}

TEST_CASE("DocumentStore Close follows the close policy", "[store]") {
  SECTION("remove erases the entry") {
    DocumentStore store(ClosePolicy::kRemove);
    store.Open("file:///a.sv", "text");
    store.Close("file:///a.sv");

    REQUIRE_FALSE(store.Contains("file:///a.sv"));
    REQUIRE_FALSE(store.Get("file:///a.sv").has_value());
  }

  SECTION("retain keeps the last text") {
    DocumentStore store(ClosePolicy::kRetain);
    store.Open("file:///a.sv", "text");
    store.Close("file:///a.sv");

    auto state = store.Get("file:///a.sv");
    REQUIRE(state.has_value());
    REQUIRE((*state)->text == "text");
  }

  SECTION("closing an unknown id is harmless") {
    DocumentStore store;
    store.Close("file:///never-opened.sv");
    REQUIRE(store.Size() == 0);
  }
}

TEST_CASE("DocumentStore lists open documents", "[store]") {
  DocumentStore store;
  store.Open("file:///a.sv", "a");
  store.Open("file:///b.sv", "b");
  store.Open("file:///a.sv", "a2");

  auto uris = store.GetAllUris();
  REQUIRE(uris.size() == 2);
  REQUIRE_THAT(
      uris, Catch::Matchers::UnorderedEquals(
                std::vector<std::string>{"file:///a.sv", "file:///b.sv"}));
}

TEST_CASE("DocumentStore readers never see a torn value", "[store]") {
  DocumentStore store;

  // Each version is a run of one repeated character
  auto make_text = [](int version) {
    return std::string(4096, static_cast<char>('a' + version % 26));
  };
  store.Open("file:///hot.sv", make_text(0));

  std::atomic<bool> done{false};
  std::atomic<int> torn{0};

  std::vector<std::thread> readers;
  for (int i = 0; i < 4; ++i) {
    readers.emplace_back([&] {
      while (!done.load()) {
        auto state = store.Get("file:///hot.sv");
        if (!state) {
          ++torn;
          continue;
        }
        const auto& text = (*state)->text;
        if (text.size() != 4096 ||
            text.find_first_not_of(text.front()) != std::string::npos) {
          ++torn;
        }
      }
    });
  }

  std::thread writer([&] {
    for (int version = 1; version <= 2000; ++version) {
      store.Update("file:///hot.sv", make_text(version));
    }
    done = true;
  });

  writer.join();
  for (auto& reader : readers) {
    reader.join();
  }

  REQUIRE(torn.load() == 0);
  REQUIRE(store.Get("file:///hot.sv").value()->text == make_text(2000));
}
