#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <cstdint>
#include <functional>
#include "handle/handle_manager.hpp"
#include "backend/memory_backend.hpp"
#include "mock_backend.hpp"
#include "test_utils.hpp"

using namespace sftpgw::handle;
using sftpgw::backend::BackendErrc;
using sftpgw::backend::BackendError;
using sftpgw::backend::MemoryBackend;
using sftpgw::path::normalize;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

class HandleManagerTest : public ::testing::Test {
protected:
  std::shared_ptr<MemoryBackend> backend;
  std::unique_ptr<HandleManager> handles;

  void SetUp() override {
    init_test_logging();
    backend = std::make_shared<MemoryBackend>();
    handles = std::make_unique<HandleManager>(backend);
  }

  void expect_handle_error(HandleErrc expected, const std::function<void()>& op) {
    try {
      op();
      ADD_FAILURE() << "Expected " << handle_errc_to_string(expected);
    } catch (const HandleError& e) {
      EXPECT_EQ(e.code(), expected) << e.what();
    }
  }
};

TEST_F(HandleManagerTest, IdsStartAtOneAndAreNotReused) {
  const auto first = handles->open_file(normalize("/a"), OpenMode::READ, {});
  const auto second = handles->open_dir(normalize("/"));
  EXPECT_EQ(first, 1u);
  EXPECT_EQ(second, 2u);

  handles->close(first);
  EXPECT_FALSE(handles->contains(first));
  EXPECT_EQ(handles->open_file(normalize("/b"), OpenMode::READ, {}), 3u);
  EXPECT_EQ(handles->size(), 2u);
}

TEST_F(HandleManagerTest, SequentialAndPositionalReads) {
  const auto id = handles->open_file(normalize("/f"), OpenMode::READ, to_bytes("abcdefgh"));

  EXPECT_EQ(to_text(handles->read(id, 3)), "abc");
  EXPECT_EQ(to_text(handles->read(id, 3)), "def");
  EXPECT_EQ(to_text(handles->read(id, 10)), "gh");
  EXPECT_TRUE(handles->read(id, 10).empty());

  EXPECT_EQ(to_text(handles->read(id, 2, 1)), "bc");
  EXPECT_TRUE(handles->read(id, 4, 100).empty());
}

TEST_F(HandleManagerTest, WritesAreBufferedUntilClose) {
  const auto id = handles->open_file(normalize("/out"), OpenMode::WRITE, {});
  handles->write(id, to_bytes("hello"));
  handles->write(id, to_bytes(" world"));

  EXPECT_THROW(backend->read_file(normalize("/out")), BackendError);
  EXPECT_EQ(handles->stat(id).size, 11u);

  handles->close(id);
  EXPECT_EQ(to_text(backend->read_file(normalize("/out"))), "hello world");
}

TEST_F(HandleManagerTest, OffsetWriteZeroFillsGap) {
  const auto id = handles->open_file(normalize("/sparse"), OpenMode::WRITE, to_bytes("ab"));
  handles->write(id, to_bytes("z"), 4);
  handles->close(id);

  const auto content = backend->read_file(normalize("/sparse"));
  ASSERT_EQ(content.size(), 5u);
  EXPECT_EQ(content[0], 'a');
  EXPECT_EQ(content[2], 0);
  EXPECT_EQ(content[3], 0);
  EXPECT_EQ(content[4], 'z');
}

TEST_F(HandleManagerTest, AppendIgnoresOffset) {
  const auto id = handles->open_file(normalize("/log"), OpenMode::WRITE, to_bytes("one;"), true);
  handles->write(id, to_bytes("two;"), 0);
  handles->close(id);

  EXPECT_EQ(to_text(backend->read_file(normalize("/log"))), "one;two;");
}

TEST_F(HandleManagerTest, AccessModeIsEnforced) {
  const auto reader = handles->open_file(normalize("/r"), OpenMode::READ, to_bytes("x"));
  const auto writer = handles->open_file(normalize("/w"), OpenMode::WRITE, {});

  expect_handle_error(HandleErrc::ACCESS_DENIED, [&] { handles->write(reader, to_bytes("y")); });
  expect_handle_error(HandleErrc::ACCESS_DENIED, [&] { handles->read(writer, 1); });

  const auto both = handles->open_file(normalize("/rw"), OpenMode::READ_WRITE, to_bytes("abc"));
  handles->write(both, to_bytes("X"), 1);
  EXPECT_EQ(to_text(handles->read(both, 3, 0)), "aXc");
}

TEST_F(HandleManagerTest, WrongHandleKind) {
  const auto dir = handles->open_dir(normalize("/"));
  const auto file = handles->open_file(normalize("/f"), OpenMode::READ, {});

  expect_handle_error(HandleErrc::WRONG_HANDLE_TYPE, [&] { handles->read(dir, 1); });
  expect_handle_error(HandleErrc::WRONG_HANDLE_TYPE, [&] { handles->write(dir, to_bytes("x")); });
  expect_handle_error(HandleErrc::WRONG_HANDLE_TYPE, [&] { handles->read_dir(file, 10); });
}

TEST_F(HandleManagerTest, UnknownAndClosedHandles) {
  expect_handle_error(HandleErrc::INVALID_HANDLE, [&] { handles->read(42, 1); });
  expect_handle_error(HandleErrc::INVALID_HANDLE, [&] { handles->close(42); });
  expect_handle_error(HandleErrc::INVALID_HANDLE, [&] { handles->stat(42); });

  const auto id = handles->open_dir(normalize("/"));
  handles->close(id);
  expect_handle_error(HandleErrc::INVALID_HANDLE, [&] { handles->read_dir(id, 1); });
}

TEST_F(HandleManagerTest, ReadDirBatchesThenExhausts) {
  for (int i = 0; i < 5; ++i) {
    backend->write_file(normalize("/f" + std::to_string(i)), to_bytes("x"));
  }
  const auto id = handles->open_dir(normalize("/"));

  EXPECT_EQ(handles->read_dir(id, 2).size(), 2u);
  EXPECT_EQ(handles->read_dir(id, 2).size(), 2u);
  EXPECT_EQ(handles->read_dir(id, 2).size(), 1u);
  EXPECT_TRUE(handles->read_dir(id, 2).empty());
  // Files added after exhaustion stay invisible to this handle
  backend->write_file(normalize("/late"), to_bytes("x"));
  EXPECT_TRUE(handles->read_dir(id, 2).empty());
}

TEST_F(HandleManagerTest, EmptyDirectoryEndsImmediately) {
  backend->make_dir(normalize("/empty"));
  const auto id = handles->open_dir(normalize("/empty"));
  EXPECT_TRUE(handles->read_dir(id, 100).empty());
  EXPECT_TRUE(handles->read_dir(id, 100).empty());
}

TEST_F(HandleManagerTest, ReadDirPropagatesBackendErrors) {
  const auto id = handles->open_dir(normalize("/missing"));
  try {
    handles->read_dir(id, 10);
    ADD_FAILURE() << "Expected NOT_FOUND";
  } catch (const BackendError& e) {
    EXPECT_EQ(e.code(), BackendErrc::NOT_FOUND);
  }
  EXPECT_TRUE(handles->contains(id));
}

TEST_F(HandleManagerTest, FailedFlushKeepsHandle) {
  auto mock = std::make_shared<MockBackend>();
  HandleManager manager(mock);
  const auto id = manager.open_file(normalize("/f"), OpenMode::WRITE, {});
  manager.write(id, to_bytes("data"));

  EXPECT_CALL(*mock, write_file(_, _))
    .WillOnce(Throw(BackendError(BackendErrc::UNAVAILABLE)))
    .WillOnce(Return());

  EXPECT_THROW(manager.close(id), BackendError);
  EXPECT_TRUE(manager.contains(id));
  EXPECT_NO_THROW(manager.close(id));
  EXPECT_FALSE(manager.contains(id));
}

TEST_F(HandleManagerTest, ReadOnlyCloseNeverWrites) {
  auto mock = std::make_shared<MockBackend>();
  HandleManager manager(mock);
  EXPECT_CALL(*mock, write_file(_, _)).Times(0);

  manager.close(manager.open_file(normalize("/f"), OpenMode::READ, to_bytes("x")));
  manager.close(manager.open_dir(normalize("/")));
}

TEST_F(HandleManagerTest, DiscardAllDropsWithoutFlushing) {
  const auto id = handles->open_file(normalize("/pending"), OpenMode::WRITE, {});
  handles->write(id, to_bytes("lost"));
  handles->open_dir(normalize("/"));

  EXPECT_EQ(handles->discard_all(), 2u);
  EXPECT_EQ(handles->size(), 0u);
  EXPECT_THROW(backend->file_info(normalize("/pending")), BackendError);
}

TEST_F(HandleManagerTest, StatReportsKindAndPath) {
  const auto file = handles->open_file(normalize("/a/b"), OpenMode::READ_WRITE, to_bytes("xyz"));
  const auto dir = handles->open_dir(normalize("/a"));

  const auto file_info = handles->stat(file);
  EXPECT_EQ(file_info.kind, HandleKind::FILE);
  EXPECT_EQ(file_info.path.view(), "/a/b");
  EXPECT_EQ(file_info.size, 3u);
  EXPECT_EQ(handles->stat(dir).kind, HandleKind::DIRECTORY);
}

TEST_F(HandleManagerTest, HandlePathOutlivesInputBuffer) {
  uint64_t id = 0;
  {
    const std::string raw = "/short/lived";
    id = handles->open_dir(normalize(raw));
  }
  EXPECT_EQ(handles->stat(id).path.view(), "/short/lived");
}

TEST_F(HandleManagerTest, WireFormat) {
  EXPECT_EQ(HandleManager::format_handle(17), "17");
  EXPECT_EQ(HandleManager::parse_handle("17"), 17u);
  EXPECT_EQ(HandleManager::parse_handle("18446744073709551615"), UINT64_MAX);

  for (const std::string bad : {"", "abc", "-1", "1 ", "0x10", "18446744073709551616", "123456789012345678901"}) {
    expect_handle_error(HandleErrc::INVALID_HANDLE, [&] { HandleManager::parse_handle(bad); });
  }
}
