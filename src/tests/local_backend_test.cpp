#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <thread>
#include "backend/local_backend.hpp"
#include "test_utils.hpp"

using namespace sftpgw::backend;
using sftpgw::path::normalize;

class LocalBackendTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::filesystem::path root;
  std::unique_ptr<LocalBackend> backend;

  void SetUp() override {
    init_test_logging();
    test_dir = make_temp_directory("local_backend_test");
    root = test_dir / "root";
    backend = std::make_unique<LocalBackend>(root.string());
  }

  void TearDown() override {
    backend.reset();
    std::error_code ec;
    std::filesystem::remove_all(test_dir, ec);
  }

  template <typename Operation>
  void expect_error(BackendErrc expected, Operation&& op) {
    try {
      op();
      ADD_FAILURE() << "Expected " << backend_errc_to_string(expected);
    } catch (const BackendError& e) {
      EXPECT_EQ(e.code(), expected) << e.what();
    }
  }

  std::vector<std::string> list_names(const std::string& dir) {
    std::vector<std::string> names;
    for (const auto& entry : backend->list_dir(normalize(dir))) {
      names.push_back(entry.name);
    }
    std::sort(names.begin(), names.end());
    return names;
  }

  static std::string file_contents(const std::filesystem::path& location) {
    std::ifstream file(location, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  }
};

TEST_F(LocalBackendTest, CreatesRootAndStartsEmpty) {
  EXPECT_TRUE(std::filesystem::is_directory(root));
  EXPECT_EQ(backend->root(), std::filesystem::canonical(root));
  EXPECT_TRUE(backend->file_info(normalize("/")).is_directory());
  EXPECT_TRUE(backend->list_dir(normalize("/")).empty());
}

TEST_F(LocalBackendTest, RootMustBeADirectory) {
  std::ofstream(test_dir / "plain") << "x";
  EXPECT_THROW(LocalBackend((test_dir / "plain").string()), std::invalid_argument);
  EXPECT_THROW(LocalBackend(""), std::invalid_argument);
}

TEST_F(LocalBackendTest, WriteThenReadLandsOnDisk) {
  backend->write_file(normalize("/a.txt"), to_bytes("hello"));

  EXPECT_EQ(file_contents(root / "a.txt"), "hello");
  EXPECT_EQ(to_text(backend->read_file(normalize("/a.txt"))), "hello");

  const auto attrs = backend->file_info(normalize("/a.txt"));
  EXPECT_TRUE(attrs.is_regular());
  ASSERT_TRUE(attrs.size.has_value());
  EXPECT_EQ(*attrs.size, 5u);
  EXPECT_TRUE(attrs.mtime.has_value());
  EXPECT_TRUE(attrs.permissions.has_value());

  backend->write_file(normalize("/a.txt"), to_bytes("hi"));
  EXPECT_EQ(to_text(backend->read_file(normalize("/a.txt"))), "hi");
  EXPECT_EQ(list_names("/"), (std::vector<std::string>{"a.txt"}));
}

TEST_F(LocalBackendTest, ListDirReturnsDirectChildrenOnly) {
  backend->make_dir(normalize("/docs"));
  backend->write_file(normalize("/docs/one"), to_bytes("1"));
  backend->make_dir(normalize("/docs/sub"));
  backend->write_file(normalize("/docs/sub/deep"), to_bytes("2"));

  EXPECT_EQ(list_names("/docs"), (std::vector<std::string>{"one", "sub"}));
  for (const auto& entry : backend->list_dir(normalize("/docs"))) {
    EXPECT_EQ(entry.attrs.is_directory(), entry.name == "sub");
  }
}

TEST_F(LocalBackendTest, ListDirErrors) {
  backend->write_file(normalize("/file"), to_bytes("x"));
  expect_error(BackendErrc::NOT_FOUND, [&] { backend->list_dir(normalize("/missing")); });
  expect_error(BackendErrc::NOT_A_DIRECTORY, [&] { backend->list_dir(normalize("/file")); });
}

TEST_F(LocalBackendTest, MakeDirPolicy) {
  backend->make_dir(normalize("/d"));
  expect_error(BackendErrc::ALREADY_EXISTS, [&] { backend->make_dir(normalize("/d")); });
  expect_error(BackendErrc::ALREADY_EXISTS, [&] { backend->make_dir(normalize("/")); });
  expect_error(BackendErrc::NOT_FOUND, [&] { backend->make_dir(normalize("/x/y")); });

  backend->write_file(normalize("/f"), to_bytes("x"));
  expect_error(BackendErrc::NOT_A_DIRECTORY, [&] { backend->make_dir(normalize("/f/sub")); });
  expect_error(BackendErrc::NOT_FOUND, [&] { backend->write_file(normalize("/x/y"), to_bytes("z")); });
  expect_error(BackendErrc::NOT_A_DIRECTORY, [&] { backend->write_file(normalize("/f/y"), to_bytes("z")); });
}

TEST_F(LocalBackendTest, DelDir) {
  backend->make_dir(normalize("/d"));
  backend->write_file(normalize("/d/f"), to_bytes("x"));

  expect_error(BackendErrc::NOT_EMPTY, [&] { backend->del_dir(normalize("/d")); });
  expect_error(BackendErrc::NOT_A_DIRECTORY, [&] { backend->del_dir(normalize("/d/f")); });
  expect_error(BackendErrc::NOT_FOUND, [&] { backend->del_dir(normalize("/none")); });
  expect_error(BackendErrc::PERMISSION_DENIED, [&] { backend->del_dir(normalize("/")); });

  backend->remove_file(normalize("/d/f"));
  backend->del_dir(normalize("/d"));
  EXPECT_FALSE(std::filesystem::exists(root / "d"));
}

TEST_F(LocalBackendTest, RemoveFile) {
  backend->write_file(normalize("/f"), to_bytes("x"));
  backend->make_dir(normalize("/d"));

  expect_error(BackendErrc::IS_A_DIRECTORY, [&] { backend->remove_file(normalize("/d")); });
  backend->remove_file(normalize("/f"));
  expect_error(BackendErrc::NOT_FOUND, [&] { backend->remove_file(normalize("/f")); });
  expect_error(BackendErrc::NOT_FOUND, [&] { backend->read_file(normalize("/f")); });
  expect_error(BackendErrc::IS_A_DIRECTORY, [&] { backend->read_file(normalize("/d")); });
  expect_error(BackendErrc::IS_A_DIRECTORY, [&] { backend->write_file(normalize("/d"), to_bytes("x")); });
}

TEST_F(LocalBackendTest, RenameNeverOverwrites) {
  backend->write_file(normalize("/old.txt"), to_bytes("data"));
  backend->write_file(normalize("/taken"), to_bytes("keep"));

  expect_error(BackendErrc::ALREADY_EXISTS, [&] { backend->rename(normalize("/old.txt"), normalize("/taken")); });
  EXPECT_EQ(to_text(backend->read_file(normalize("/old.txt"))), "data");
  EXPECT_EQ(to_text(backend->read_file(normalize("/taken"))), "keep");

  backend->rename(normalize("/old.txt"), normalize("/new.txt"));
  EXPECT_EQ(to_text(backend->read_file(normalize("/new.txt"))), "data");
  expect_error(BackendErrc::NOT_FOUND, [&] { backend->read_file(normalize("/old.txt")); });
  expect_error(BackendErrc::NOT_FOUND, [&] { backend->rename(normalize("/old.txt"), normalize("/x")); });

  // Renaming onto itself is a no-op
  backend->rename(normalize("/new.txt"), normalize("/new.txt"));
  EXPECT_EQ(to_text(backend->read_file(normalize("/new.txt"))), "data");
}

TEST_F(LocalBackendTest, RenameDirectoryMovesSubtree) {
  backend->make_dir(normalize("/src"));
  backend->make_dir(normalize("/src/inner"));
  backend->write_file(normalize("/src/inner/f"), to_bytes("x"));

  expect_error(BackendErrc::PERMISSION_DENIED, [&] { backend->rename(normalize("/src"), normalize("/src/inner/dst")); });
  expect_error(BackendErrc::NOT_FOUND, [&] { backend->rename(normalize("/src"), normalize("/no/dst")); });

  backend->rename(normalize("/src"), normalize("/dst"));
  EXPECT_EQ(to_text(backend->read_file(normalize("/dst/inner/f"))), "x");
  EXPECT_EQ(list_names("/"), (std::vector<std::string>{"dst"}));
}

TEST_F(LocalBackendTest, TemporaryNamesAreReservedAndHidden) {
  const std::string reserved = std::string("/a") + LocalBackend::TEMP_SUFFIX;
  expect_error(BackendErrc::PERMISSION_DENIED, [&] { backend->write_file(normalize(reserved), to_bytes("x")); });
  expect_error(BackendErrc::PERMISSION_DENIED, [&] { backend->make_dir(normalize(reserved)); });

  // Left behind by an interrupted write
  std::ofstream(root / (std::string("b") + LocalBackend::TEMP_SUFFIX)) << "partial";
  backend->write_file(normalize("/b"), to_bytes("whole"));
  EXPECT_EQ(list_names("/"), (std::vector<std::string>{"b"}));
}

TEST_F(LocalBackendTest, SymbolicLinksAreNotFollowed) {
  const auto outside = test_dir / "outside";
  std::filesystem::create_directories(outside);
  std::ofstream(outside / "secret") << "hidden";
  std::filesystem::create_directory_symlink(outside, root / "link");
  std::filesystem::create_symlink(outside / "secret", root / "file_link");

  EXPECT_EQ(backend->file_info(normalize("/link")).type, FileType::SYMLINK);
  EXPECT_EQ(list_names("/"), (std::vector<std::string>{"file_link", "link"}));

  expect_error(BackendErrc::PERMISSION_DENIED, [&] { backend->list_dir(normalize("/link")); });
  expect_error(BackendErrc::PERMISSION_DENIED, [&] { backend->read_file(normalize("/link/secret")); });
  expect_error(BackendErrc::PERMISSION_DENIED, [&] { backend->read_file(normalize("/file_link")); });
  expect_error(BackendErrc::PERMISSION_DENIED, [&] { backend->write_file(normalize("/link/new"), to_bytes("x")); });
  expect_error(BackendErrc::PERMISSION_DENIED, [&] { backend->write_file(normalize("/file_link"), to_bytes("x")); });
  EXPECT_FALSE(std::filesystem::exists(outside / "new"));
  EXPECT_EQ(file_contents(outside / "secret"), "hidden");

  // Removing a link leaves its target alone
  backend->remove_file(normalize("/file_link"));
  EXPECT_TRUE(std::filesystem::exists(outside / "secret"));
}

TEST_F(LocalBackendTest, ConcurrentWritersOnDistinctPaths) {
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([this, t] {
      for (int i = 0; i < 25; ++i) {
        backend->write_file(normalize("/t" + std::to_string(t) + "_" + std::to_string(i)), to_bytes("x"));
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(backend->list_dir(normalize("/")).size(), 100u);
}

TEST_F(LocalBackendTest, DescribeNamesRoot) {
  EXPECT_NE(backend->describe().find(backend->root().string()), std::string::npos);
}
