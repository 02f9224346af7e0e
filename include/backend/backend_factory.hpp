#ifndef SFTPGW_BACKEND_FACTORY_HPP
#define SFTPGW_BACKEND_FACTORY_HPP

#include <memory>
#include "backend/backend.hpp"
#include "config/server_config.hpp"

namespace sftpgw {
namespace backend {

// Creates the backend selected by config, shared by every session of the server
std::shared_ptr<Backend> make_backend(const config::ServerConfig& config);

} // namespace backend
} // namespace sftpgw

#endif // SFTPGW_BACKEND_FACTORY_HPP
