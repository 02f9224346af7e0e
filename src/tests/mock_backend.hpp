#ifndef SFTPGW_MOCK_BACKEND_HPP
#define SFTPGW_MOCK_BACKEND_HPP

#include <gmock/gmock.h>
#include <string>
#include <vector>
#include "backend/backend.hpp"

// Backend double for checking which storage calls a component makes
class MockBackend : public sftpgw::backend::Backend {
public:
    MOCK_METHOD(std::vector<sftpgw::backend::DirEntry>, list_dir, (const sftpgw::path::NormalizedPath&), (override));
    MOCK_METHOD(sftpgw::backend::FileAttributes, file_info, (const sftpgw::path::NormalizedPath&), (override));
    MOCK_METHOD(void, make_dir, (const sftpgw::path::NormalizedPath&), (override));
    MOCK_METHOD(void, del_dir, (const sftpgw::path::NormalizedPath&), (override));
    MOCK_METHOD(void, remove_file, (const sftpgw::path::NormalizedPath&), (override));
    MOCK_METHOD(void, rename, (const sftpgw::path::NormalizedPath&, const sftpgw::path::NormalizedPath&), (override));
    MOCK_METHOD(sftpgw::backend::Bytes, read_file, (const sftpgw::path::NormalizedPath&), (override));
    MOCK_METHOD(void, write_file, (const sftpgw::path::NormalizedPath&, const sftpgw::backend::Bytes&), (override));
    MOCK_METHOD(std::string, describe, (), (const, override));
};

#endif // SFTPGW_MOCK_BACKEND_HPP
