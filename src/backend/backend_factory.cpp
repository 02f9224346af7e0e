#include "backend/backend_factory.hpp"
#include "backend/local_backend.hpp"
#include "backend/memory_backend.hpp"
#include "backend/object_store_backend.hpp"
#include <boost/log/trivial.hpp>

namespace sftpgw {
namespace backend {

std::shared_ptr<Backend> make_backend(const config::ServerConfig& config) {
  std::shared_ptr<Backend> backend;
  switch (config.backend) {
    case config::BackendKind::MEMORY:
      backend = std::make_shared<MemoryBackend>();
      break;
    case config::BackendKind::OBJECT_STORE: {
      if (config.store_root.empty()) {
        throw config::ConfigError("object backend needs a store root");
      }
      auto object_store = std::make_shared<store::ObjectStore>(config.store_root);
      backend = std::make_shared<ObjectStoreBackend>(object_store, config.key_prefix);
      break;
    }
    case config::BackendKind::LOCAL:
      if (config.store_root.empty()) {
        throw config::ConfigError("local backend needs a root directory");
      }
      backend = std::make_shared<LocalBackend>(config.store_root);
      break;
    default:
      throw config::ConfigError("unsupported backend kind");
  }

  BOOST_LOG_TRIVIAL(info) << "Backend factory: Using " << backend->describe();
  return backend;
}

} // namespace backend
} // namespace sftpgw
